#include <doctest/doctest.h>

#include "Helpers.h"

#include <wirepack/Mallocator.h>

#include <fmt/format.h>

#include <limits>

using namespace wirepack::msgpack;

TEST_CASE("msgpack: value kinds")
{
	wirepack::Mallocator allocator;

	REQUIRE(Value{}.kind() == Value::KIND_NIL);
	REQUIRE(Value{nullptr}.kind() == Value::KIND_NIL);
	REQUIRE(Value{true}.kind() == Value::KIND_BOOL);
	REQUIRE(Value{-1}.kind() == Value::KIND_INT);
	REQUIRE(Value{uint8_t(1)}.kind() == Value::KIND_UINT);
	REQUIRE(Value{1.5f}.kind() == Value::KIND_FLOAT);
	REQUIRE(Value{1.5}.kind() == Value::KIND_DOUBLE);
	REQUIRE(Value::string("a"_sv, &allocator).kind() == Value::KIND_STRING);
	REQUIRE(Value::bytes(wirepack::Span<const std::byte>{}, &allocator).kind() == Value::KIND_BYTES);
	REQUIRE(Value{wirepack::Array<Value>{&allocator}}.kind() == Value::KIND_ARRAY);
	REQUIRE(Value{Map{&allocator}}.kind() == Value::KIND_MAP);
	REQUIRE(Value{Ext{3, wirepack::Buffer{&allocator}}}.kind() == Value::KIND_EXT);
	REQUIRE(Value{wirepack::shared_from<Point>(&allocator, 1, 2)}.kind() == Value::KIND_OBJECT);

	// a null object reads as nil
	wirepack::Shared<wirepack::msgpack::Object> empty;
	REQUIRE(Value{empty}.is_nil());

	REQUIRE(kindName(Value::KIND_UINT) == "uint"_sv);
	REQUIRE(kindName(Value::KIND_OBJECT) == "object"_sv);
}

TEST_CASE("msgpack: numbers compare by value")
{
	REQUIRE(Value{1} == Value{uint64_t(1)});
	REQUIRE(Value{1} == Value{1.0});
	REQUIRE(Value{1.0f} == Value{1.0});
	REQUIRE(Value{uint64_t(3)} == Value{3.0f});
	REQUIRE(Value{-1} != Value{UINT64_MAX});
	REQUIRE(Value{1} != Value{1.5});
	REQUIRE(Value{0} != Value{false});
	REQUIRE(Value{} != Value{0});

	REQUIRE(Value{1}.hash(0) == Value{1.0}.hash(0));
	REQUIRE(Value{uint64_t(7)}.hash(0) == Value{7}.hash(0));
	REQUIRE(Value{UINT64_MAX}.to_double() == 18446744073709551615.0);
}

TEST_CASE("msgpack: nan equals nan")
{
	auto nan = std::numeric_limits<double>::quiet_NaN();
	REQUIRE(Value{nan} == Value{nan});
	REQUIRE(Value{nan} == Value{std::numeric_limits<float>::quiet_NaN()});
	REQUIRE(Value{nan} != Value{1.0});
	REQUIRE(Value{nan}.hash(0) == Value{-nan}.hash(0));

	wirepack::Mallocator allocator;
	Map map{&allocator};
	REQUIRE(map.insert(Value{nan}, Value{1}));
	REQUIRE(map.insert(Value{-nan}, Value{2}) == false);
	REQUIRE(map.count() == 1);
	REQUIRE(*map.lookup(Value{nan}) == Value{2});
}

TEST_CASE("msgpack: assign a value from one of its children")
{
	wirepack::Mallocator allocator;

	wirepack::Array<Value> array{&allocator};
	array.push(Value::string("a string long enough to live on the heap"_sv, &allocator));
	array.push(Value{2});

	Value v{array};
	v = v.as_array()[0];
	REQUIRE(v.kind() == Value::KIND_STRING);
	REQUIRE(v.as_string() == "a string long enough to live on the heap"_sv);

	Value moved{array};
	moved = std::move(moved.as_array()[0]);
	REQUIRE(moved.as_string() == "a string long enough to live on the heap"_sv);

	Map inner{&allocator};
	inner.insert(Value::string("leaf"_sv, &allocator), Value{7});
	Map outer{&allocator};
	outer.insert(Value::string("inner"_sv, &allocator), Value{inner});

	Value doc{outer};
	doc = *doc.as_map().lookup(Value::string("inner"_sv, &allocator));
	REQUIRE(doc.kind() == Value::KIND_MAP);
	REQUIRE(*doc.as_map().lookup("leaf"_sv) == Value{7});

	doc = std::move(*doc.as_map().lookup(Value::string("leaf"_sv, &allocator)));
	REQUIRE(doc == Value{7});
}

TEST_CASE("msgpack: value copies are deep")
{
	wirepack::Mallocator allocator;

	wirepack::Array<Value> array{&allocator};
	array.push(Value{1});
	array.push(Value::string("two"_sv, &allocator));
	Value a{std::move(array)};

	auto b = a;
	REQUIRE(a == b);

	b.as_array().push(Value{3});
	b.as_array()[1].as_string().push("!"_sv);
	REQUIRE(a.as_array().count() == 2);
	REQUIRE(a.as_array()[1].as_string() == "two"_sv);
	REQUIRE(a != b);

	auto c = std::move(b);
	REQUIRE(b.is_nil());
	REQUIRE(c.as_array().count() == 3);
}

TEST_CASE("msgpack: map insert and lookup")
{
	wirepack::Mallocator allocator;

	Map map{&allocator};
	REQUIRE(map.insert(Value::string("a"_sv, &allocator), Value{1}));
	REQUIRE(map.insert(Value{2}, Value::string("two"_sv, &allocator)));
	REQUIRE(map.insert(Value::string("b"_sv, &allocator), Value{3}));
	REQUIRE(map.count() == 3);

	// replacing keeps the original position
	REQUIRE(map.insert(Value::string("a"_sv, &allocator), Value{10}) == false);
	REQUIRE(map.count() == 3);
	REQUIRE(map[0].key == Value::string("a"_sv, &allocator));
	REQUIRE(map[0].value == Value{10});

	REQUIRE(map.lookup("b"_sv) != nullptr);
	REQUIRE(*map.lookup("b"_sv) == Value{3});
	REQUIRE(map.lookup("c"_sv) == nullptr);
	REQUIRE(map.lookup(Value{2.0}) != nullptr);
	REQUIRE(map.lookup(Value{2.0})->as_string() == "two"_sv);
	REQUIRE(map.lookup(Value{uint64_t(2)}) != nullptr);
	REQUIRE(map.lookup(Value{3}) == nullptr);

	*map.lookup(Value{2}) = Value{nullptr};
	REQUIRE(map[1].value.is_nil());
}

TEST_CASE("msgpack: large map lookup")
{
	wirepack::Mallocator allocator;

	Map map{&allocator};
	for (int i = 0; i < 100; ++i)
	{
		REQUIRE(map.insert(wirepack::strf(&allocator, "key{}"_sv, i), Value{i}));
		REQUIRE(map.insert(Value{i}, Value{i * 2}));
	}
	REQUIRE(map.count() == 200);

	for (int i = 0; i < 100; ++i)
	{
		auto by_name = map.lookup(wirepack::strf(&allocator, "key{}"_sv, i));
		REQUIRE(by_name != nullptr);
		REQUIRE(by_name->as_int() == i);

		auto by_number = map.lookup(Value{double(i)});
		REQUIRE(by_number != nullptr);
		REQUIRE(by_number->as_int() == i * 2);
	}

	REQUIRE(map.insert(Value{50}, Value{-1}) == false);
	REQUIRE(map.count() == 200);
	REQUIRE(map.lookup(Value{50})->as_int() == -1);
	REQUIRE(map[101].key == Value{50});

	REQUIRE(map.lookup("key100"_sv) == nullptr);
	REQUIRE(map.lookup(Value{100}) == nullptr);

	auto copy = map;
	REQUIRE(copy == map);
	REQUIRE(copy.lookup("key99"_sv)->as_int() == 99);

	map.clear();
	REQUIRE(map.count() == 0);
	REQUIRE(map.lookup("key1"_sv) == nullptr);
}

TEST_CASE("msgpack: value formatting")
{
	wirepack::Mallocator allocator;

	wirepack::Array<Value> array{&allocator};
	array.push(Value{1});
	array.push(Value::string("a"_sv, &allocator));
	array.push(Value{});
	array.push(Value{true});
	REQUIRE(fmt::format("{}", Value{array}) == "[1, \"a\", null, true]");

	const uint8_t raw[] = {0x01, 0x02};
	Map map{&allocator};
	map.insert(Value::string("k"_sv, &allocator), Value::bytes(view(raw), &allocator));
	map.insert(Value{2}, Value{1.5});
	REQUIRE(fmt::format("{}", Value{map}) == "{\"k\": <bytes 01 02>, 2: 1.5}");

	const uint8_t payload[] = {0x2a};
	REQUIRE(fmt::format("{}", Value{Ext{42, view(payload), &allocator}}) == "<ext 42 2a>");
	REQUIRE(fmt::format("{}", Value{wirepack::shared_from<Function>(&allocator)}) == "<function>");
}
