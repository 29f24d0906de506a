#include <strata/common/thread_pool.hpp>

#include <strata/util/log.hpp>

#include <atomic>
#include <cassert>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <thread>

namespace strata
{

// The number of threads started in case no explicit request was made and `std`
// didn't return meaningful value. Assuming an "average" 8-threaded machine.
constexpr static size_t DEFAULT_THREAD_COUNT = 8;

struct ThreadPool::Worker {
	std::thread thread;

	// Enqueued but not yet completed tasks, used for load balancing
	std::atomic_size_t pending = 0;

	std::mutex queue_mutex;
	std::condition_variable queue_cv;
	std::queue<std::packaged_task<void()>> tasks_queue;
	bool stop_requested = false;
};

ThreadPool::ThreadPool(size_t thread_count)
{
	if (thread_count == 0) {
		size_t std_hint = std::thread::hardware_concurrency();
		thread_count = std_hint > 0 ? std_hint : DEFAULT_THREAD_COUNT;
	}

	Log::info("Starting thread pool with {} threads", thread_count);

	m_workers.reserve(thread_count);
	for (size_t i = 0; i < thread_count; i++) {
		auto &worker = m_workers.emplace_back(std::make_unique<Worker>());
		worker->thread = std::thread(&ThreadPool::workerFunction, worker.get());
	}
}

ThreadPool::~ThreadPool() noexcept
{
	for (auto &worker : m_workers) {
		std::lock_guard lock(worker->queue_mutex);
		worker->stop_requested = true;
		worker->queue_cv.notify_one();
	}

	for (auto &worker : m_workers) {
		if (worker->thread.joinable()) {
			worker->thread.join();
		}
	}

	Log::debug("Thread pool stopped");
}

void ThreadPool::doEnqueueTask(std::packaged_task<void()> task)
{
	size_t min_job_count = SIZE_MAX;
	Worker *min_job_worker = nullptr;

	for (auto &worker : m_workers) {
		size_t job_count = worker->pending.load(std::memory_order_relaxed);

		if (job_count < min_job_count) {
			min_job_count = job_count;
			min_job_worker = worker.get();
		}
	}
	assert(min_job_worker);

	min_job_worker->pending.fetch_add(1, std::memory_order_relaxed);

	{
		std::lock_guard lock(min_job_worker->queue_mutex);
		min_job_worker->tasks_queue.emplace(std::move(task));
	}

	min_job_worker->queue_cv.notify_one();
}

void ThreadPool::workerFunction(Worker *worker)
{
	for (;;) {
		std::packaged_task<void()> task;

		{
			std::unique_lock lock(worker->queue_mutex);
			worker->queue_cv.wait(lock, [worker] { return worker->stop_requested || !worker->tasks_queue.empty(); });

			// Drain the queue before exiting
			if (worker->tasks_queue.empty()) {
				return;
			}

			task = std::move(worker->tasks_queue.front());
			worker->tasks_queue.pop();
		}

		// Exceptions are stored in the task's shared state
		task();
		worker->pending.fetch_sub(1, std::memory_order_relaxed);
	}
}

} // namespace strata
