#include <doctest/doctest.h>

#include <wirepack/Func.h>
#include <wirepack/Mallocator.h>

namespace
{
	struct Counter
	{
		int* alive = nullptr;

		explicit Counter(int* a)
			: alive(a)
		{
			++*alive;
		}

		Counter(const Counter& other)
			: alive(other.alive)
		{
			++*alive;
		}

		Counter(Counter&& other) noexcept
			: alive(other.alive)
		{
			++*alive;
		}

		~Counter() { --*alive; }

		int operator()(int x) const { return x + 1; }
	};
}

TEST_CASE("wirepack::Func basics")
{
	wirepack::Func<int(int)> f;
	REQUIRE(!f);

	f = [](int x) { return x * 2; };
	REQUIRE(f);
	REQUIRE(f(21) == 42);

	int captured = 10;
	f = [captured](int x) { return x + captured; };
	REQUIRE(f(5) == 15);

	auto g = std::move(f);
	REQUIRE(!f);
	REQUIRE(g(1) == 11);
}

TEST_CASE("wirepack::Func large callables")
{
	wirepack::Mallocator allocator;

	int64_t a = 1, b = 2, c = 3, d = 4, e = 5;
	wirepack::Func<int64_t()> f{&allocator, [a, b, c, d, e] { return a + b + c + d + e; }};
	REQUIRE(f() == 15);

	wirepack::Func<int64_t()> g{std::move(f)};
	REQUIRE(!f);
	REQUIRE(g() == 15);
}

TEST_CASE("wirepack::Func destroys its callable")
{
	int alive = 0;
	{
		wirepack::Func<int(int)> f{Counter{&alive}};
		REQUIRE(alive == 1);
		REQUIRE(f(1) == 2);

		auto g = std::move(f);
		REQUIRE(alive == 1);
		REQUIRE(g(2) == 3);

		g = nullptr;
		REQUIRE(alive == 0);
	}
	REQUIRE(alive == 0);
}
