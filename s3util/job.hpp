#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

// s3util
#include "locator.hpp"

namespace s3util
{

enum class direction
{
	upload,   // local -> storage
	download  // storage -> local
};

/// One file to transfer in one direction.
struct transfer_job
{
	transfer_job(direction dir, const std::filesystem::path& local, const storage_locator& remote)
		: dir(dir)
		, local(local)
		, remote(remote)
	{
	}

	direction             dir;
	std::filesystem::path local;
	storage_locator       remote;

	const std::string source() const;
	const std::string destination() const;
};

struct job_ok
{
};

struct job_err
{
	std::string reason;
};

using job_outcome = std::variant<job_ok, job_err>;

inline bool succeeded(const job_outcome& outcome) { return std::holds_alternative<job_ok>(outcome); }

struct transfer_result
{
	const transfer_job* job;
	job_outcome         outcome;
};

struct job_failure
{
	std::string job;     // "<source> -> <destination>"
	std::string reason;
};

/// Counters and failures of one orchestrator run.
/// Failures are kept in job submission order.
struct aggregate_outcome
{
	size_t                   total     = 0;
	size_t                   succeeded = 0;
	std::vector<job_failure> failed;

	bool ok() const { return failed.empty(); }
};

} // namespace s3util
