#include <doctest/doctest.h>

#include <wirepack/Mallocator.h>
#include <wirepack/msgpack/Scratch.h>

using namespace wirepack::msgpack;

TEST_CASE("msgpack: scratch growth capacity")
{
	REQUIRE(Scratch::growthCapacity(2048, 1) == 4096);
	REQUIRE(Scratch::growthCapacity(2048, 2048) == 4096);
	REQUIRE(Scratch::growthCapacity(2048, 3000) == 6144);
	REQUIRE(Scratch::growthCapacity(16, 100000) == 100000);
	REQUIRE(Scratch::growthCapacity(0, 10) == 10);
}

TEST_CASE("msgpack: scratch reuse")
{
	wirepack::Mallocator allocator;

	Scratch scratch{2048, &allocator};
	REQUIRE(scratch.capacity() == 0);
	REQUIRE(scratch.allocMin() == 2048);

	auto first = scratch.reserve(10);
	REQUIRE(first.count() == 4096);
	REQUIRE(scratch.capacity() == 4096);

	// requests that fit reuse the same region
	auto second = scratch.reserve(4096);
	REQUIRE(second.data() == first.data());

	auto third = scratch.reserve(5000);
	REQUIRE(third.count() == 10240);

	// capacity never shrinks
	scratch.reserve(1);
	REQUIRE(scratch.capacity() == 10240);

	auto moved = std::move(scratch);
	REQUIRE(moved.capacity() == 10240);
	REQUIRE(scratch.capacity() == 0);
}
