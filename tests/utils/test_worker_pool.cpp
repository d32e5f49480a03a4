#include <catch2/catch_test_macros.hpp>

#include "timecast/utils/worker_pool.hpp"

#include <atomic>
#include <future>
#include <stdexcept>
#include <vector>

using timecast::utils::WorkerPool;

TEST_CASE("WorkerPool runs submitted tasks and returns results", "[utils][worker_pool]") {
	WorkerPool pool(3);
	REQUIRE(pool.size() == 3);

	std::vector<std::future<int>> futures;
	for (int i = 0; i < 10; ++i) {
		futures.push_back(pool.submit([i]() { return i * i; }));
	}
	for (int i = 0; i < 10; ++i) {
		REQUIRE(futures[static_cast<std::size_t>(i)].get() == i * i);
	}
}

TEST_CASE("WorkerPool propagates task exceptions through the future", "[utils][worker_pool]") {
	WorkerPool pool(1);
	auto future = pool.submit([]() -> int { throw std::runtime_error("task failed"); });
	REQUIRE_THROWS_AS(future.get(), std::runtime_error);

	auto next = pool.submit([]() { return 7; });
	REQUIRE(next.get() == 7);
}

TEST_CASE("WorkerPool drains queued work on destruction", "[utils][worker_pool]") {
	std::atomic<int> counter{0};
	{
		WorkerPool pool(2);
		for (int i = 0; i < 50; ++i) {
			pool.schedule([&counter]() { counter.fetch_add(1); });
		}
	}
	REQUIRE(counter.load() == 50);
}

TEST_CASE("WorkerPool requires at least one worker", "[utils][worker_pool]") {
	REQUIRE_THROWS_AS(WorkerPool(0), std::invalid_argument);
}
