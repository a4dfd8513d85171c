#include <doctest/doctest.h>

#include <wirepack/Mallocator.h>
#include <wirepack/Mimallocator.h>

#include <cstring>

template<typename TAllocator>
inline void allocateAndFill()
{
	TAllocator allocator;

	auto bytes = allocator.alloc(64, alignof(std::max_align_t));
	REQUIRE(bytes.count() == 64);
	REQUIRE(bytes.data() != nullptr);
	REQUIRE(reinterpret_cast<uintptr_t>(bytes.data()) % alignof(std::max_align_t) == 0);

	allocator.commit(bytes);
	::memset(bytes.data(), 0xab, bytes.count());
	REQUIRE(bytes[63] == std::byte{0xab});
	allocator.release(bytes);
	allocator.free(bytes);
}

TEST_CASE("wirepack::Mallocator basics")
{
	allocateAndFill<wirepack::Mallocator>();
}

TEST_CASE("wirepack::Mimallocator basics")
{
	allocateAndFill<wirepack::Mimallocator>();
}

TEST_CASE("wirepack::Allocator typed helpers")
{
	wirepack::Mallocator allocator;

	auto numbers = allocator.allocT<int64_t>(10);
	REQUIRE(numbers.count() == 10);
	allocator.commitT(numbers);
	for (size_t i = 0; i < numbers.count(); ++i)
		numbers[i] = int64_t(i * i);
	REQUIRE(numbers[9] == 81);
	allocator.releaseT(numbers);
	allocator.freeT(numbers);

	auto single = allocator.allocSingleT<double>();
	allocator.commitSingleT(single);
	*single = 1.5;
	REQUIRE(*single == 1.5);
	allocator.releaseSingleT(single);
	allocator.freeSingleT(single);
}
