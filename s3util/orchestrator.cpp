#include <algorithm>
#include <system_error>
#include <variant>

// submodules
#include "spdlog/spdlog.h"

// s3util
#include "errors.hpp"
#include "locator.hpp"
#include "orchestrator.hpp"
#include "planner.hpp"
#include "transfer.hpp"
#include "worker_pool.hpp"


using namespace std;

#define LOG_SC_RUN "RUN "

namespace s3util
{

const char* to_string(orchestrator::state s)
{
	switch (s)
	{
	case orchestrator::state::init:
		return "init";
	case orchestrator::state::resolving:
		return "resolving";
	case orchestrator::state::planning:
		return "planning";
	case orchestrator::state::transferring:
		return "transferring";
	case orchestrator::state::aggregating:
		return "aggregating";
	case orchestrator::state::done:
		return "done";
	case orchestrator::state::failed:
		return "failed";
	}

	return "unknown";
}

orchestrator::orchestrator(const config& cfg, storage::shared_client_t client)
	: m_cfg(cfg)
	, m_client(move(client))
{
	if (!m_client)
		throw fatal_error("No storage client available");
}

void orchestrator::set_state(state s)
{
	spdlog::trace(LOG_SC_RUN "State {} -> {}", to_string(m_state), to_string(s));
	m_state = s;
}

vector<transfer_job> orchestrator::plan_jobs(const string& src, const string& dst)
{
	try
	{
		set_state(state::resolving);

		const bool src_remote = is_storage_uri(src);
		const bool dst_remote = is_storage_uri(dst);
		if (src_remote == dst_remote)
		{
			throw ambiguous_direction_error(src_remote
				? "Both paths are storage URIs, one of them must be a local path"
				: fmt::format("One of the paths must start with {}", storage_scheme));
		}

		const direction       dir = src_remote ? direction::download : direction::upload;
		const storage_locator loc = *resolve_storage_uri(src_remote ? src : dst);
		if (loc.bucket().empty())
			throw usage_error(fmt::format("Missing bucket name in '{}'", src_remote ? src : dst));

		set_state(state::planning);
		if (dir == direction::upload)
			return planner::plan_upload(src, loc);

		return planner::plan_download(*m_client, loc, dst);
	}
	catch (const std::exception&)
	{
		set_state(state::failed);
		throw;
	}
}

vector<transfer_job> orchestrator::plan(const string& src, const string& dst)
{
	vector<transfer_job> jobs = plan_jobs(src, dst);
	set_state(state::done);
	return jobs;
}

aggregate_outcome orchestrator::run(const string& src, const string& dst)
{
	const vector<transfer_job> jobs = plan_jobs(src, dst);

	aggregate_outcome outcome;
	outcome.total = jobs.size();
	if (jobs.empty())
		spdlog::warn(LOG_SC_RUN "Found nothing to transfer from '{}'", src);

	set_state(state::transferring);
	vector<transfer_result> results;
	try
	{
		// The pool joins its workers when leaving the scope.
		worker_pool pool(size_t(max(m_cfg.parallelism, 1)),
			[this](const transfer_job& job) { return transfer::transfer_one(*m_client, job); });

		spdlog::info(LOG_SC_RUN "Transferring {} files using {} workers", jobs.size(), pool.worker_count());
		results = pool.submit_all(jobs);
	}
	catch (const system_error& e)
	{
		set_state(state::failed);
		throw fatal_error(fmt::format("Failed to start transfer workers: {}", e.what()));
	}

	set_state(state::aggregating);
	for (const transfer_result& res : results)
	{
		if (succeeded(res.outcome))
		{
			++outcome.succeeded;
			continue;
		}

		outcome.failed.push_back(job_failure{
			res.job->source() + " -> " + res.job->destination(), get<job_err>(res.outcome).reason });
	}

	set_state(state::done);
	spdlog::info(LOG_SC_RUN "{} of {} files transferred, {} failed",
		outcome.succeeded, outcome.total, outcome.failed.size());
	return outcome;
}

} // namespace s3util
