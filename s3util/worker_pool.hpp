#pragma once
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

// s3util
#include "job.hpp"

namespace s3util
{

using job_fn_t = std::function<job_outcome(const transfer_job&)>;

/// Fixed set of worker threads consuming transfer jobs from a shared queue.
/// Threads are started on construction and joined on destruction.
class worker_pool
{
public:
	/// @param workers  number of threads, values below 1 are treated as 1
	/// @param fn       unit of work, invoked once per job from a worker thread
	worker_pool(size_t workers, job_fn_t fn);
	~worker_pool();

	worker_pool(const worker_pool&) = delete;
	worker_pool& operator=(const worker_pool&) = delete;

public:
	/// Process every job exactly once and wait until all of them are done.
	/// A failing job does not affect the others. An exception leaving
	/// the job function is recorded as that job's error.
	/// @return one result per job, in the order of @p jobs
	std::vector<transfer_result> submit_all(const std::vector<transfer_job>& jobs);

	size_t worker_count() const { return m_threads.size(); }

private:
	struct task
	{
		const transfer_job*      job;
		std::promise<job_outcome> result;
	};

	void worker_thread(size_t worker_id);
	void stop();

private:
	const job_fn_t           m_fn;
	std::vector<std::thread> m_threads;

	std::mutex              m_mtx;
	std::condition_variable m_cv;
	std::queue<task>        m_queue;
	bool                    m_stop = false;
};

} // namespace s3util
