#pragma once
#include <string>
#include <vector>

// s3util
#include "job.hpp"
#include "storage.hpp"

namespace s3util
{

struct config
{
	int         parallelism = 8;     // number of concurrent transfers
	std::string store_root;          // root folder of the directory store
	bool        only_print  = false; // Do not transfer, just print the planned jobs
};

/// Drives one copy: resolve the arguments, plan the jobs,
/// run them on a worker pool and aggregate the results.
class orchestrator
{
public:
	enum class state
	{
		init,
		resolving,
		planning,
		transferring,
		aggregating,
		done,
		failed
	};

public:
	orchestrator(const config& cfg, storage::shared_client_t client);

public:
	/// Copy @p src to @p dst. Exactly one of them must be a storage URI.
	/// Individual job failures are reported in the outcome.
	/// @throws ambiguous_direction_error, usage_error, plan_error
	aggregate_outcome run(const std::string& src, const std::string& dst);

	/// Resolve and plan only, nothing is transferred.
	/// @throws ambiguous_direction_error, usage_error, plan_error
	std::vector<transfer_job> plan(const std::string& src, const std::string& dst);

	state current_state() const { return m_state; }

private:
	std::vector<transfer_job> plan_jobs(const std::string& src, const std::string& dst);
	void set_state(state s);

private:
	const config             m_cfg;
	storage::shared_client_t m_client;
	state                    m_state = state::init;
};

const char* to_string(orchestrator::state s);

} // namespace s3util
