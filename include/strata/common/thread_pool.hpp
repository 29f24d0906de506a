#pragma once

#include <strata/visibility.hpp>

#include <functional>
#include <future>
#include <memory>
#include <type_traits>
#include <vector>

namespace strata
{

// Fixed-size pool of worker threads with one task queue per worker.
// New tasks go to the least loaded worker. Exceptions thrown by tasks
// are delivered through the returned futures.
//
// Destructor waits until all already enqueued tasks complete.
class STRATA_API ThreadPool {
public:
	// Zero means "choose automatically" (hardware concurrency)
	explicit ThreadPool(size_t thread_count = 0);
	ThreadPool(ThreadPool &&) = delete;
	ThreadPool(const ThreadPool &) = delete;
	ThreadPool &operator=(ThreadPool &&) = delete;
	ThreadPool &operator=(const ThreadPool &) = delete;
	~ThreadPool() noexcept;

	template<typename F>
	std::future<std::invoke_result_t<F>> enqueueTask(F &&f)
	{
		using R = std::invoke_result_t<F>;

		std::packaged_task<R()> task(std::forward<F>(f));
		std::future<R> future = task.get_future();
		doEnqueueTask(std::packaged_task<void()>(std::move(task)));

		return future;
	}

	size_t threadCount() const noexcept { return m_workers.size(); }

private:
	struct Worker;

	void doEnqueueTask(std::packaged_task<void()> task);

	static void workerFunction(Worker *worker);

	std::vector<std::unique_ptr<Worker>> m_workers;
};

} // namespace strata
