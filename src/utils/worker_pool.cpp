#include "timecast/utils/worker_pool.hpp"

#include <stdexcept>
#include <utility>

namespace timecast::utils {

WorkerPool::WorkerPool(std::size_t size) {
	if (size == 0) {
		throw std::invalid_argument("Worker pool size must be at least 1.");
	}
	threads_.reserve(size);
	for (std::size_t i = 0; i < size; ++i) {
		threads_.emplace_back([this] { worker(); });
	}
}

WorkerPool::~WorkerPool() {
	shutdown();
}

void WorkerPool::schedule(Task &&task) {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (done_) {
			throw std::logic_error("Cannot schedule work on a pool that is shutting down.");
		}
		tasks_.push_back(std::move(task));
	}
	available_.notify_one();
}

void WorkerPool::worker() {
	for (;;) {
		Task task;
		{
			std::unique_lock<std::mutex> lock(mutex_);
			available_.wait(lock, [this] { return done_ || !tasks_.empty(); });
			if (tasks_.empty()) {
				// Only reached once done_ is set and the queue is drained.
				return;
			}
			task = std::move(tasks_.front());
			tasks_.pop_front();
		}
		task();
	}
}

void WorkerPool::shutdown() {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		done_ = true;
	}
	available_.notify_all();
	for (auto &thread : threads_) {
		if (thread.joinable()) {
			thread.join();
		}
	}
}

} // namespace timecast::utils
