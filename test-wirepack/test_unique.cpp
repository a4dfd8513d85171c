#include <doctest/doctest.h>

#include <wirepack/Mallocator.h>
#include <wirepack/Unique.h>

namespace
{
	struct Base
	{
		virtual ~Base() = default;
		virtual int id() const { return 1; }
	};

	struct Derived: Base
	{
		int* destroyed = nullptr;
		int64_t padding[4] = {};

		explicit Derived(int* d)
			: destroyed(d)
		{}

		~Derived() override { ++*destroyed; }

		int id() const override { return 2; }
	};
}

TEST_CASE("wirepack::Unique basics")
{
	wirepack::Mallocator allocator;

	auto number = wirepack::unique_from<int>(&allocator, 42);
	REQUIRE(number);
	REQUIRE(*number == 42);
	REQUIRE(number.allocator() == &allocator);

	auto moved = std::move(number);
	REQUIRE(number == nullptr);
	REQUIRE(*moved == 42);

	moved = nullptr;
	REQUIRE(!moved);
}

TEST_CASE("wirepack::Unique upcast")
{
	wirepack::Mallocator allocator;

	int destroyed = 0;
	{
		wirepack::Unique<Base> base = wirepack::unique_from<Derived>(&allocator, &destroyed);
		REQUIRE(base->id() == 2);
	}
	REQUIRE(destroyed == 1);
}
