#include <doctest/doctest.h>

#include <wirepack/Hash.h>
#include <wirepack/Mallocator.h>
#include <wirepack/StringView.h>

TEST_CASE("wirepack::Hash bytes")
{
	auto short_bytes = wirepack::Span<const std::byte>("abc"_sv);
	REQUIRE(wirepack::hashBytes(short_bytes) == wirepack::fnva(short_bytes));

	auto long_bytes = wirepack::Span<const std::byte>("a longer piece of text"_sv);
	REQUIRE(wirepack::hashBytes(long_bytes) == wirepack::murmurHash(long_bytes));

	REQUIRE(wirepack::hashBytes(long_bytes) == wirepack::hashBytes(long_bytes));
	REQUIRE(wirepack::hashBytes(long_bytes) != wirepack::hashBytes(long_bytes, 1));
	REQUIRE(wirepack::hashBytes(short_bytes) != wirepack::hashBytes(long_bytes));

	// the tail after the last full block still contributes
	auto a = wirepack::Span<const std::byte>("0123456789abcdefX"_sv);
	auto b = wirepack::Span<const std::byte>("0123456789abcdefY"_sv);
	REQUIRE(wirepack::murmurHash(a) != wirepack::murmurHash(b));
}

TEST_CASE("wirepack::Hash integers")
{
	wirepack::Hash<int64_t> hash_int;
	wirepack::Hash<uint64_t> hash_uint;

	REQUIRE(hash_int(42, wirepack::DEFAULT_HASH_SEED) == hash_int(42, wirepack::DEFAULT_HASH_SEED));
	REQUIRE(hash_int(42, wirepack::DEFAULT_HASH_SEED) != hash_int(43, wirepack::DEFAULT_HASH_SEED));
	// same bit pattern, same hash
	REQUIRE(hash_int(7, 0) == hash_uint(7, 0));

	int x = 0;
	wirepack::Hash<int*> hash_ptr;
	REQUIRE(hash_ptr(&x, 0) == hash_ptr(&x, 0));
}

TEST_CASE("wirepack::Map")
{
	wirepack::Mallocator allocator;

	wirepack::Map<int64_t, int64_t> map{&allocator};
	REQUIRE(map.count() == 0);
	REQUIRE(map.lookup(1) == map.end());

	for (int64_t i = 0; i < 1000; ++i)
		map.insert(i, i * 3);
	REQUIRE(map.count() == 1000);
	REQUIRE(map.capacity() >= 1000);

	// an existing key keeps its value
	map.insert(int64_t(10), int64_t(-1));
	REQUIRE(map.count() == 1000);
	REQUIRE(map.lookup(10)->value == 30);

	for (int64_t i = 0; i < 1000; ++i)
	{
		auto it = map.lookup(i);
		REQUIRE(it != map.end());
		REQUIRE(it->key == i);
		REQUIRE(it->value == i * 3);
	}
	REQUIRE(map.lookup(1000) == map.end());

	// values stay in insertion order
	int64_t expected = 0;
	for (const auto& [key, value]: map)
		REQUIRE(key == expected++);

	auto copy = map;
	REQUIRE(copy.count() == 1000);
	REQUIRE(copy.lookup(999)->value == 2997);

	auto moved = std::move(copy);
	REQUIRE(moved.lookup(500)->value == 1500);

	map.clear();
	REQUIRE(map.count() == 0);
	REQUIRE(map.lookup(5) == map.end());
	map.insert(int64_t(5), int64_t(6));
	REQUIRE(map.lookup(5)->value == 6);
}
