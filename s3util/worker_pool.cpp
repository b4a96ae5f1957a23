#include <algorithm>
#include <exception>
#include <system_error>

// submodules
#include "spdlog/spdlog.h"

// s3util
#include "worker_pool.hpp"


using namespace std;

#define LOG_SC_POOL "POOL "

namespace s3util
{

worker_pool::worker_pool(size_t workers, job_fn_t fn)
	: m_fn(move(fn))
{
	const size_t count = max<size_t>(workers, 1);

	try
	{
		m_threads.reserve(count);
		for (size_t i = 0; i < count; ++i)
			m_threads.emplace_back(&worker_pool::worker_thread, this, i);
	}
	catch (const system_error& e)
	{
		spdlog::error(LOG_SC_POOL "Failed to start worker threads: {}", e.what());
		stop();
		throw;
	}

	spdlog::debug(LOG_SC_POOL "Started {} workers", m_threads.size());
}

worker_pool::~worker_pool()
{
	stop();
}

void worker_pool::stop()
{
	{
		lock_guard<mutex> lck(m_mtx);
		m_stop = true;
	}

	m_cv.notify_all();
	for (auto& t : m_threads)
	{
		if (t.joinable())
			t.join();
	}
}

vector<transfer_result> worker_pool::submit_all(const vector<transfer_job>& jobs)
{
	vector<future<job_outcome>> pending;
	pending.reserve(jobs.size());

	{
		lock_guard<mutex> lck(m_mtx);
		for (const transfer_job& job : jobs)
		{
			task t{ &job, promise<job_outcome>() };
			pending.push_back(t.result.get_future());
			m_queue.push(move(t));
		}
	}
	m_cv.notify_all();

	// Collect in submission order. Each future is bound to exactly
	// one task, so the wait ends only when every job has reported.
	vector<transfer_result> results;
	results.reserve(jobs.size());
	for (size_t i = 0; i < jobs.size(); ++i)
		results.push_back(transfer_result{ &jobs[i], pending[i].get() });

	return results;
}

void worker_pool::worker_thread(size_t worker_id)
{
	spdlog::trace(LOG_SC_POOL "Worker {} started", worker_id);

	while (true)
	{
		task t;
		{
			unique_lock<mutex> lck(m_mtx);
			m_cv.wait(lck, [this] { return !m_queue.empty() || m_stop; });

			if (m_queue.empty())
				break;

			t = move(m_queue.front());
			m_queue.pop();
		}

		job_outcome outcome;
		try
		{
			outcome = m_fn(*t.job);
		}
		catch (const exception& e)
		{
			outcome = job_err{ e.what() };
		}
		catch (...)
		{
			outcome = job_err{ "unknown error" };
		}

		t.result.set_value(move(outcome));
	}

	spdlog::trace(LOG_SC_POOL "Worker {} stopped", worker_id);
}

} // namespace s3util
