#include <catch2/catch.hpp>
#include "dragfit/ThreadPool.hpp"
#include <stdexcept>

using namespace dragfit;

TEST_CASE("ThreadPool returns results in submission order", "[pool]") {
	ThreadPool pool(3);
	REQUIRE(pool.size() == 3);

	auto futures = pool.enqueue_each(50, [](int i) { return i * i; });
	REQUIRE(futures.size() == 50);
	for (int i = 0; i < 50; ++i)
		CHECK(futures[i].get() == i * i);
}

TEST_CASE("ThreadPool forwards task exceptions to the future", "[pool]") {
	ThreadPool pool(2);
	auto ok  = pool.enqueue([](int a, int b) { return a + b; }, 2, 3);
	auto bad = pool.enqueue([] { throw std::runtime_error("boom"); return 0; });
	CHECK(ok.get() == 5);
	CHECK_THROWS_AS(bad.get(), std::runtime_error);
}

TEST_CASE("ThreadPool with zero threads uses the hardware", "[pool]") {
	ThreadPool pool(0);
	CHECK(pool.size() >= 1);
}
