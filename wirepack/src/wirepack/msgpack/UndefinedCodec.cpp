#include "wirepack/msgpack/UndefinedCodec.h"
#include "wirepack/msgpack/Encoder.h"

namespace wirepack::msgpack
{
	Value undefined(Allocator* allocator)
	{
		return Value{shared_from<Undefined>(allocator)};
	}

	bool UndefinedCodec::supports(const Value& value) const
	{
		return value.kind() == Value::KIND_OBJECT && value.as_object()->typeName() == "undefined"_sv;
	}

	Result<Buffer, Error> UndefinedCodec::encode(Encoder& encoder, const Value& value)
	{
		(void)value;
		return Buffer{encoder.allocator()};
	}

	Result<Value, Error> UndefinedCodec::decode(Span<const std::byte> payload, Allocator* allocator)
	{
		if (payload.count() != 0)
			return errf(allocator, Error::KIND_INVALID_FORMAT, "undefined carries no payload but got {} bytes"_sv, payload.count());
		return undefined(allocator);
	}
}
