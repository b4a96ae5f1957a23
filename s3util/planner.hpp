#pragma once
#include <string>
#include <vector>

// s3util
#include "job.hpp"
#include "locator.hpp"
#include "storage.hpp"

namespace s3util
{
namespace planner
{

/// Build upload jobs for a local file or directory tree.
/// Directory contents are enumerated recursively and ordered
/// lexicographically by relative path.
/// @param [in] src  local file or directory
/// @param [in] dst  destination bucket and key (or key prefix)
/// @throws plan_error if the source can not be fully enumerated
std::vector<transfer_job> plan_upload(const std::string& src, const storage_locator& dst);

/// Build download jobs. A key ending in '*' requests every object
/// with the preceding prefix.
/// @throws plan_error on listing failure or an unusable destination
std::vector<transfer_job> plan_download(storage::iclient& client, const storage_locator& src, const std::string& dst);

/// Enumerate regular files under @p dir, relative to it, with '/' separators.
/// @throws plan_error on any unreadable entry or broken symlink
std::vector<std::string> read_directory(const std::filesystem::path& dir);

/// Destination key for @p relpath uploaded under @p prefix.
std::string make_key(const std::string& prefix, const std::string& relpath);

} // namespace planner
} // namespace s3util
