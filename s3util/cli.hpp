#pragma once
#include <ostream>
#include <string>

// s3util
#include "orchestrator.hpp"

namespace s3util
{

// Process exit codes
constexpr int EXIT_OK    = 0;
constexpr int EXIT_FAIL  = 1;
constexpr int EXIT_USAGE = 2;

/// Copy @p src to @p dst after the command line has been parsed.
/// Planned jobs (with --printout) go to @p out. Failed jobs, the summary and
/// usage errors followed by @p usage go to @p err.
/// @return process exit code
int run_copy(const config& cfg, const std::string& src, const std::string& dst,
	std::ostream& out, std::ostream& err, const std::string& usage);

} // namespace s3util
