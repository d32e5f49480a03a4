#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace timecast::utils {

/**
 * @class WorkerPool
 * @brief A minimal fixed size thread pool.
 *
 * Each pipeline invocation owns its own pool, so concurrent invocations never
 * share workers. Tasks are executed in submission order by the first idle
 * worker. The destructor drains the queue and joins every worker.
 */
class WorkerPool {
public:
	using Task = std::function<void()>;

	explicit WorkerPool(std::size_t size);

	~WorkerPool();

	WorkerPool(const WorkerPool &) = delete;
	WorkerPool(WorkerPool &&) = delete;
	WorkerPool &operator=(const WorkerPool &) = delete;
	WorkerPool &operator=(WorkerPool &&) = delete;

	std::size_t size() const {
		return threads_.size();
	}

	/// Schedule a Callable type to be executed by a thread in the pool.
	void schedule(Task &&task);

	/**
	 * @brief Schedules @p function and returns a future for its result.
	 *
	 * Exceptions thrown by the function are stored in the future and rethrown by get().
	 */
	template <typename F>
	auto submit(F &&function) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
		using Result = std::invoke_result_t<std::decay_t<F>>;
		auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(function));
		auto future = task->get_future();
		schedule([task]() { (*task)(); });
		return future;
	}

private:
	void worker();
	void shutdown();

	std::mutex mutex_;
	std::condition_variable available_;
	std::deque<Task> tasks_;
	bool done_ = false;
	std::vector<std::thread> threads_;
};

} // namespace timecast::utils
