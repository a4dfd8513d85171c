#include <doctest/doctest.h>

#include "Helpers.h"

#include <wirepack/Mallocator.h>
#include <wirepack/Mimallocator.h>

#include <limits>

using namespace wirepack::msgpack;

inline static Value roundtrip(wirepack::Allocator* allocator, const Value& value)
{
	Encoder encoder{EncoderConfig{}, allocator};
	auto encoded = encoder.encode(value);
	REQUIRE(encoded.isValue());

	Decoder decoder{DecoderConfig{}, allocator};
	auto decoded = decoder.decode(encoded.value());
	REQUIRE(decoded.isValue());
	return decoded.releaseValue();
}

TEST_CASE("msgpack: integer boundaries survive a roundtrip")
{
	wirepack::Mallocator allocator;

	const int64_t signed_values[] = {
		0, 1, 127, 128, 255, 256, 65535, 65536, 4294967295, 4294967296,
		-1, -32, -33, -128, -129, -32768, -32769, -2147483648LL, -2147483649LL,
		INT64_MAX, INT64_MIN,
	};
	for (auto v: signed_values)
	{
		auto res = roundtrip(&allocator, Value{v});
		REQUIRE(res.kind() == Value::KIND_INT);
		REQUIRE(res.as_int() == v);
	}

	auto max = roundtrip(&allocator, Value{UINT64_MAX});
	REQUIRE(max.kind() == Value::KIND_UINT);
	REQUIRE(max.as_uint() == UINT64_MAX);

	auto above_int64 = roundtrip(&allocator, Value{uint64_t(INT64_MAX) + 1});
	REQUIRE(above_int64.kind() == Value::KIND_UINT);
}

TEST_CASE("msgpack: floating point survives a roundtrip")
{
	wirepack::Mallocator allocator;

	REQUIRE(roundtrip(&allocator, Value{0.1}).as_double() == 0.1);
	REQUIRE(roundtrip(&allocator, Value{-2.5e-300}).as_double() == -2.5e-300);
	REQUIRE(roundtrip(&allocator, Value{0.1f}).as_float() == 0.1f);

	auto inf = roundtrip(&allocator, Value{-std::numeric_limits<double>::infinity()});
	REQUIRE(inf.as_double() == -std::numeric_limits<double>::infinity());

	auto nan = roundtrip(&allocator, Value{std::numeric_limits<double>::quiet_NaN()});
	REQUIRE(nan.kind() == Value::KIND_DOUBLE);
	REQUIRE(nan.as_double() != nan.as_double());

	// integral doubles come back as integers that still compare equal
	auto integral = roundtrip(&allocator, Value{42.0});
	REQUIRE(integral.kind() == Value::KIND_INT);
	REQUIRE(integral == Value{42.0});
}

TEST_CASE("msgpack: document roundtrip")
{
	wirepack::Mimallocator allocator;

	Map inner{&allocator};
	inner.insert(Value::string("enabled"_sv, &allocator), Value{true});
	inner.insert(Value::string("ratio"_sv, &allocator), Value{0.75});
	inner.insert(Value{7}, Value{});

	wirepack::Array<Value> tags{&allocator};
	tags.push(Value::string("alpha"_sv, &allocator));
	tags.push(Value::string("\xce\xb2\xce\xb5\xcf\x84\xce\xb1"_sv, &allocator));
	tags.push(Value::string("a string long enough to go through the scratch region"_sv, &allocator));

	const uint8_t raw[] = {0x00, 0xff, 0x10, 0x20};

	Map document{&allocator};
	document.insert(Value::string("name"_sv, &allocator), Value::string("wirepack"_sv, &allocator));
	document.insert(Value::string("version"_sv, &allocator), Value{3});
	document.insert(Value::string("tags"_sv, &allocator), Value{std::move(tags)});
	document.insert(Value::string("settings"_sv, &allocator), Value{std::move(inner)});
	document.insert(Value::string("blob"_sv, &allocator), Value::bytes(view(raw), &allocator));
	document.insert(Value::string("ext"_sv, &allocator), Value{Ext{17, view(raw), &allocator}});
	document.insert(Value::string("offset"_sv, &allocator), Value{-40000});

	Value value{std::move(document)};
	auto res = roundtrip(&allocator, value);
	REQUIRE(res == value);
	REQUIRE(res.as_map().lookup("settings"_sv)->as_map().lookup("ratio"_sv)->as_double() == 0.75);
	REQUIRE(res.as_map().lookup("tags"_sv)->as_array()[1].as_string() == "\xce\xb2\xce\xb5\xcf\x84\xce\xb1"_sv);
}

TEST_CASE("msgpack: large containers roundtrip")
{
	wirepack::Mallocator allocator;

	Map map{&allocator};
	for (int i = 0; i < 1000; ++i)
		map.insert(wirepack::strf(&allocator, "field_{}"_sv, i), Value{i * 3});

	wirepack::Array<Value> array{&allocator};
	for (int i = 0; i < 70000; ++i)
		array.push(Value{i % 7});

	wirepack::Array<Value> both{&allocator};
	both.push(Value{std::move(map)});
	both.push(Value{std::move(array)});
	Value value{std::move(both)};

	auto res = roundtrip(&allocator, value);
	REQUIRE(res == value);
	REQUIRE(res.as_array()[0].as_map().lookup("field_999"_sv)->as_int() == 2997);
	REQUIRE(res.as_array()[1].as_array().count() == 70000);
}

TEST_CASE("msgpack: encoder and decoder are reusable")
{
	wirepack::Mallocator allocator;

	Encoder encoder{EncoderConfig{}, &allocator};
	Decoder decoder{DecoderConfig{}, &allocator};

	wirepack::Buffer stream{&allocator};
	for (int i = 0; i < 10; ++i)
	{
		auto err = encoder.encodeTo(stream, Value{wirepack::strf(&allocator, "message {} with some padding text"_sv, i)});
		REQUIRE(!err);
	}

	wirepack::Span<const std::byte> rest = stream;
	for (int i = 0; i < 10; ++i)
	{
		size_t consumed = 0;
		auto res = decoder.decodePrefix(rest, consumed);
		REQUIRE(res.isValue());
		REQUIRE(res.value().as_string() == wirepack::strf(&allocator, "message {} with some padding text"_sv, i));
		rest = rest.sliceRight(consumed);
	}
	REQUIRE(rest.count() == 0);
}
