#include <doctest/doctest.h>

#include "Helpers.h"

#include <wirepack/Mallocator.h>

using namespace wirepack::msgpack;

namespace
{
	class ReservedCodec: public Codec
	{
	public:
		int8_t type() const override { return -1; }
		bool supports(const Value&) const override { return false; }
		wirepack::Result<wirepack::Buffer, Error> encode(Encoder&, const Value&) override
		{
			return wirepack::Result<wirepack::Buffer, Error>::createEmpty();
		}
		wirepack::Result<Value, Error> decode(wirepack::Span<const std::byte>, wirepack::Allocator*) override
		{
			return wirepack::Result<Value, Error>::createEmpty();
		}
	};

	// claims every point with a one byte payload holding the given marker
	class MarkerCodec: public Codec
	{
		int8_t m_type = 0;
		uint8_t m_marker = 0;
		bool m_decline = false;

	public:
		MarkerCodec(int8_t type, uint8_t marker, bool decline = false)
			: m_type(type),
			  m_marker(marker),
			  m_decline(decline)
		{}

		int8_t type() const override { return m_type; }

		bool supports(const Value& value) const override
		{
			return value.kind() == Value::KIND_OBJECT && value.as_object()->typeName() == "point"_sv;
		}

		wirepack::Result<wirepack::Buffer, Error> encode(Encoder& encoder, const Value&) override
		{
			if (m_decline)
				return wirepack::Result<wirepack::Buffer, Error>::createEmpty();
			wirepack::Buffer payload{encoder.allocator()};
			payload.push(m_marker);
			return payload;
		}

		wirepack::Result<Value, Error> decode(wirepack::Span<const std::byte> payload, wirepack::Allocator*) override
		{
			if (payload.count() == 1 && uint8_t(payload[0]) == m_marker)
				return Value{uint64_t(m_marker)};
			return wirepack::Result<Value, Error>::createEmpty();
		}
	};

	// wraps maps holding a "$date" key into ext type 7
	class DateCodec: public Codec
	{
	public:
		int8_t type() const override { return 7; }

		bool supports(const Value& value) const override
		{
			return value.kind() == Value::KIND_MAP && value.as_map().lookup("$date"_sv) != nullptr;
		}

		wirepack::Result<wirepack::Buffer, Error> encode(Encoder& encoder, const Value& value) override
		{
			auto date = value.as_map().lookup("$date"_sv);
			if (date->kind() != Value::KIND_INT)
				return errf(encoder.allocator(), Error::KIND_ENCODING_FAILED, "$date must be an integer"_sv);

			wirepack::Buffer payload{encoder.allocator()};
			payload.push(uint8_t(date->as_int()));
			return payload;
		}

		wirepack::Result<Value, Error> decode(wirepack::Span<const std::byte> payload, wirepack::Allocator* allocator) override
		{
			Map map{allocator};
			map.insert(Value::string("$date"_sv, allocator), Value{int64_t(payload[0])});
			return Value{std::move(map)};
		}
	};
}

TEST_CASE("msgpack: codec registry")
{
	wirepack::Mallocator allocator;

	CodecRegistry registry{&allocator};
	REQUIRE(registry.count() == 0);
	REQUIRE(registry.findByType(1) == nullptr);

	auto err = registry.emplace<MarkerCodec>(int8_t(1), uint8_t(0xaa));
	REQUIRE(!err);
	err = registry.emplace<MarkerCodec>(int8_t(1), uint8_t(0xbb));
	REQUIRE(!err);
	err = registry.emplace<PointCodec>();
	REQUIRE(!err);
	REQUIRE(registry.count() == 3);

	// the earliest codec claiming a type answers lookups
	REQUIRE(registry.findByType(1) == registry[0]);
	REQUIRE(registry.findByType(2) == nullptr);

	err = registry.emplace<ReservedCodec>();
	REQUIRE(err.kind() == Error::KIND_INVALID_CODEC);
	REQUIRE(registry.count() == 3);

	err = registry.add(nullptr);
	REQUIRE(err.kind() == Error::KIND_INVALID_CODEC);
}

TEST_CASE("msgpack: newest codec wins on encode")
{
	wirepack::Mallocator allocator;

	CodecRegistry registry{&allocator};
	auto err = registry.emplace<MarkerCodec>(int8_t(5), uint8_t(0xaa));
	REQUIRE(!err);
	err = registry.emplace<MarkerCodec>(int8_t(6), uint8_t(0xbb));
	REQUIRE(!err);

	EncoderConfig config{};
	config.codecs = &registry;
	auto point = Value{wirepack::shared_from<Point>(&allocator, 1, 2)};
	REQUIRE(encodeHex(&allocator, point, std::move(config)) == "[0xd4, 0x06, 0xbb]"_sv);
}

TEST_CASE("msgpack: declining codec passes to the next one")
{
	wirepack::Mallocator allocator;

	CodecRegistry registry{&allocator};
	auto err = registry.emplace<MarkerCodec>(int8_t(5), uint8_t(0xaa));
	REQUIRE(!err);
	err = registry.emplace<MarkerCodec>(int8_t(6), uint8_t(0xbb), true);
	REQUIRE(!err);

	EncoderConfig config{};
	config.codecs = &registry;
	auto point = Value{wirepack::shared_from<Point>(&allocator, 1, 2)};
	REQUIRE(encodeHex(&allocator, point, std::move(config)) == "[0xd4, 0x05, 0xaa]"_sv);

	// with every codec declining the object falls back to its properties
	CodecRegistry declining{&allocator};
	err = declining.emplace<MarkerCodec>(int8_t(6), uint8_t(0xbb), true);
	REQUIRE(!err);

	EncoderConfig fallback{};
	fallback.codecs = &declining;
	REQUIRE(encodeHex(&allocator, point, std::move(fallback)) == "[0x82, 0xa1, 0x78, 0x01, 0xa1, 0x79, 0x02]"_sv);
}

TEST_CASE("msgpack: codec decode")
{
	wirepack::Mallocator allocator;

	CodecRegistry registry{&allocator};
	auto err = registry.emplace<PointCodec>();
	REQUIRE(!err);
	err = registry.emplace<MarkerCodec>(int8_t(9), uint8_t(0xaa));
	REQUIRE(!err);

	DecoderConfig config{};
	config.codecs = &registry;
	Decoder decoder{config, &allocator};

	const uint8_t point_bytes[] = {0xd5, 0x01, 0x03, 0x04};
	auto point = decoder.decode(view(point_bytes));
	REQUIRE(point.isValue());
	REQUIRE(point.value().kind() == Value::KIND_OBJECT);
	auto object = static_cast<const Point*>(point.value().as_object().get());
	REQUIRE(object->x() == 3);
	REQUIRE(object->y() == 4);

	const uint8_t bad_point[] = {0xd4, 0x01, 0x03};
	auto bad = decoder.decode(view(bad_point));
	REQUIRE(bad.isError());
	REQUIRE(bad.error().kind() == Error::KIND_INVALID_FORMAT);

	const uint8_t marker[] = {0xd4, 0x09, 0xaa};
	auto claimed = decoder.decode(view(marker));
	REQUIRE(claimed.isValue());
	REQUIRE(claimed.value() == Value{0xaa});

	// a codec without a result leaves the raw ext in place
	const uint8_t other_marker[] = {0xd4, 0x09, 0xbb};
	auto raw = decoder.decode(view(other_marker));
	REQUIRE(raw.isValue());
	REQUIRE(raw.value().kind() == Value::KIND_EXT);
	REQUIRE(raw.value().as_ext().type() == 9);
	REQUIRE(raw.value().as_ext().count() == 1);
}

TEST_CASE("msgpack: map codec")
{
	wirepack::Mallocator allocator;

	CodecRegistry registry{&allocator};
	auto err = registry.emplace<DateCodec>();
	REQUIRE(!err);

	Map map{&allocator};
	map.insert(Value::string("$date"_sv, &allocator), Value{42});
	Value date{std::move(map)};

	EncoderConfig encoder_config{};
	encoder_config.codecs = &registry;
	Encoder encoder{std::move(encoder_config), &allocator};
	auto encoded = encoder.encode(date);
	REQUIRE(encoded.isValue());
	REQUIRE(hex(&allocator, encoded.value()) == "[0xd4, 0x07, 0x2a]"_sv);

	DecoderConfig decoder_config{};
	decoder_config.codecs = &registry;
	Decoder decoder{decoder_config, &allocator};
	auto decoded = decoder.decode(encoded.value());
	REQUIRE(decoded.isValue());
	REQUIRE(decoded.value() == date);

	// codec errors abort the whole encoding
	Map bad_map{&allocator};
	bad_map.insert(Value::string("$date"_sv, &allocator), Value::string("today"_sv, &allocator));
	auto failed = encoder.encode(Value{std::move(bad_map)});
	REQUIRE(failed.isError());
	REQUIRE(failed.error().kind() == Error::KIND_ENCODING_FAILED);
	REQUIRE(failed.error().message() == "$date must be an integer"_sv);

	// plain maps still encode as maps
	Map plain{&allocator};
	plain.insert(Value::string("a"_sv, &allocator), Value{1});
	auto plain_encoded = encoder.encode(Value{std::move(plain)});
	REQUIRE(plain_encoded.isValue());
	REQUIRE(hex(&allocator, plain_encoded.value()) == "[0x81, 0xa1, 0x61, 0x01]"_sv);
}

TEST_CASE("msgpack: undefined codec")
{
	wirepack::Mallocator allocator;

	CodecRegistry registry{&allocator};
	auto err = registry.emplace<UndefinedCodec>();
	REQUIRE(!err);

	EncoderConfig encoder_config{};
	encoder_config.codecs = &registry;
	Encoder encoder{std::move(encoder_config), &allocator};

	auto encoded = encoder.encode(undefined(&allocator));
	REQUIRE(encoded.isValue());
	REQUIRE(hex(&allocator, encoded.value()) == "[0xc7, 0x00, 0x0a]"_sv);

	DecoderConfig decoder_config{};
	decoder_config.codecs = &registry;
	Decoder decoder{decoder_config, &allocator};

	auto decoded = decoder.decode(encoded.value());
	REQUIRE(decoded.isValue());
	REQUIRE(decoded.value().kind() == Value::KIND_OBJECT);
	REQUIRE(decoded.value().as_object()->typeName() == "undefined"_sv);

	const uint8_t with_payload[] = {0xd4, 0x0a, 0x01};
	auto bad = decoder.decode(view(with_payload));
	REQUIRE(bad.isError());
	REQUIRE(bad.error().kind() == Error::KIND_INVALID_FORMAT);
}
