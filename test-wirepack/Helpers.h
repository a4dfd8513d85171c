#pragma once

#include <wirepack/Msgpack.h>
#include <wirepack/String.h>

#include <cstdint>

// renders bytes as "[0xcc, 0x80]"
inline wirepack::String hex(wirepack::Allocator* allocator, wirepack::Span<const std::byte> bytes)
{
	wirepack::String res{allocator};
	res.push("["_sv);
	for (size_t i = 0; i < bytes.count(); ++i)
	{
		if (i > 0)
			res.push(", "_sv);
		res.push(wirepack::strf(allocator, "{:#04x}"_sv, uint8_t(bytes[i])));
	}
	res.push("]"_sv);
	return res;
}

template<size_t N>
inline wirepack::Span<const std::byte> view(const uint8_t (&data)[N])
{
	return wirepack::Span<const std::byte>{reinterpret_cast<const std::byte*>(data), N};
}

inline wirepack::String encodeHex(
	wirepack::Allocator* allocator,
	const wirepack::msgpack::Value& value,
	wirepack::msgpack::EncoderConfig config = {})
{
	wirepack::msgpack::Encoder encoder{std::move(config), allocator};
	auto res = encoder.encode(value);
	if (res.isError())
		return wirepack::strf(allocator, "{}"_sv, res.error());
	return hex(allocator, res.value());
}

// plain record with two integer fields
class Point: public wirepack::msgpack::Object
{
	int64_t m_x = 0;
	int64_t m_y = 0;

public:
	Point(int64_t x, int64_t y)
		: m_x(x),
		  m_y(y)
	{}

	int64_t x() const { return m_x; }
	int64_t y() const { return m_y; }

	wirepack::StringView typeName() const override { return "point"_sv; }

	void keys(wirepack::Array<wirepack::String>& out) const override
	{
		out.push(wirepack::String{"x"_sv, out.allocator()});
		out.push(wirepack::String{"y"_sv, out.allocator()});
	}

	wirepack::msgpack::Value property(wirepack::StringView key, wirepack::Allocator*) const override
	{
		if (key == "x"_sv)
			return wirepack::msgpack::Value{m_x};
		if (key == "y"_sv)
			return wirepack::msgpack::Value{m_y};
		return wirepack::msgpack::Value{};
	}
};

// sequence of the integers 0..count-1
class Range: public wirepack::msgpack::Object
{
	size_t m_count = 0;

public:
	explicit Range(size_t count)
		: m_count(count)
	{}

	wirepack::StringView typeName() const override { return "range"_sv; }
	bool isSequence() const override { return true; }
	size_t count() const override { return m_count; }

	wirepack::msgpack::Value element(size_t index, wirepack::Allocator*) const override
	{
		return wirepack::msgpack::Value{uint64_t(index)};
	}
};

class Function: public wirepack::msgpack::Object
{
public:
	wirepack::StringView typeName() const override { return "function"_sv; }
	bool isCallable() const override { return true; }
};

// carries a Point as a two byte ext payload
class PointCodec: public wirepack::msgpack::Codec
{
public:
	static constexpr int8_t TYPE = 1;

	int8_t type() const override { return TYPE; }

	bool supports(const wirepack::msgpack::Value& value) const override
	{
		return value.kind() == wirepack::msgpack::Value::KIND_OBJECT && value.as_object()->typeName() == "point"_sv;
	}

	wirepack::Result<wirepack::Buffer, wirepack::msgpack::Error>
	encode(wirepack::msgpack::Encoder& encoder, const wirepack::msgpack::Value& value) override
	{
		auto point = static_cast<const Point*>(value.as_object().get());
		wirepack::Buffer payload{encoder.allocator()};
		payload.push(uint8_t(point->x()));
		payload.push(uint8_t(point->y()));
		return payload;
	}

	wirepack::Result<wirepack::msgpack::Value, wirepack::msgpack::Error>
	decode(wirepack::Span<const std::byte> payload, wirepack::Allocator* allocator) override
	{
		if (payload.count() != 2)
		{
			return wirepack::msgpack::errf(
				allocator,
				wirepack::msgpack::Error::KIND_INVALID_FORMAT,
				"point payload must be 2 bytes, got {}"_sv,
				payload.count()
			);
		}
		auto point = wirepack::shared_from<Point>(allocator, int64_t(payload[0]), int64_t(payload[1]));
		return wirepack::msgpack::Value{point};
	}
};
