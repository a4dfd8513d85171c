#pragma once

#include "wirepack/Exports.h"
#include "wirepack/msgpack/Codec.h"

namespace wirepack::msgpack
{
	// marker for a value that exists but was never assigned, distinct from nil
	class Undefined: public Object
	{
	public:
		StringView typeName() const override { return "undefined"_sv; }
	};

	WIREPACK_EXPORT Value undefined(Allocator* allocator);

	// carries Undefined across the wire as an empty ext payload of type 0x0a
	class UndefinedCodec: public Codec
	{
	public:
		static constexpr int8_t TYPE = 0x0a;

		int8_t type() const override { return TYPE; }
		WIREPACK_EXPORT bool supports(const Value& value) const override;
		WIREPACK_EXPORT Result<Buffer, Error> encode(Encoder& encoder, const Value& value) override;
		WIREPACK_EXPORT Result<Value, Error> decode(Span<const std::byte> payload, Allocator* allocator) override;
	};
}
