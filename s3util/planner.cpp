#include <algorithm>
#include <filesystem>	// Requires C++17
#include <string>
#include <vector>

// submodules
#include "spdlog/spdlog.h"

// s3util
#include "errors.hpp"
#include "planner.hpp"


using namespace std;
using namespace s3util;
namespace fs = std::filesystem;

#define LOG_SC_PLAN "PLAN "

namespace
{

/// Last '/'-separated segment of an object key.
string last_segment(const string& key)
{
	const size_t pos = key.find_last_of('/');
	return pos == string::npos ? key : key.substr(pos + 1);
}

bool ends_with(const string& str, char c)
{
	return !str.empty() && str.back() == c;
}

/// Local path for a listed object, relative to the download directory.
/// @throws plan_error if the path would leave the download directory
fs::path download_relpath(const string& key, const string& prefix)
{
	string suffix = key.substr(prefix.size());
	while (!suffix.empty() && suffix.front() == '/')
		suffix.erase(0, 1);

	// The key equals the prefix: keep the object name.
	if (suffix.empty())
		suffix = last_segment(key);

	const fs::path rel = fs::path(suffix).lexically_normal();
	if (rel.empty() || rel.is_absolute() || rel == "." || *rel.begin() == "..")
		throw plan_error(fmt::format("Object key '{}' maps outside of the destination directory", key));

	return rel;
}

} // namespace

namespace s3util
{
namespace planner
{

string make_key(const string& prefix, const string& relpath)
{
	string p = prefix;
	while (ends_with(p, '/'))
		p.pop_back();

	if (p.empty())
		return relpath;

	return p + "/" + relpath;
}

vector<string> read_directory(const fs::path& dir)
{
	vector<string> filenames;

	error_code                             ec;
	fs::recursive_directory_iterator       it(dir, fs::directory_options::none, ec);
	const fs::recursive_directory_iterator end;
	if (ec)
		throw plan_error(fmt::format("Failed to read directory '{}': {}", dir.string(), ec.message()));

	while (it != end)
	{
		const fs::directory_entry& entry = *it;

		if (entry.is_symlink(ec) && !fs::exists(entry.path(), ec))
			throw plan_error(fmt::format("Broken symlink '{}'", entry.path().string()));

		if (ec)
			throw plan_error(fmt::format("Failed to stat '{}': {}", entry.path().string(), ec.message()));

		if (entry.is_regular_file(ec))
		{
			filenames.push_back(entry.path().lexically_relative(dir).generic_string());
		}
		else if (ec)
		{
			throw plan_error(fmt::format("Failed to stat '{}': {}", entry.path().string(), ec.message()));
		}
		else if (!entry.is_directory(ec))
		{
			spdlog::debug(LOG_SC_PLAN "Skipping special file '{}'", entry.path().string());
		}

		it.increment(ec);
		if (ec)
			throw plan_error(fmt::format("Failed to walk source directory '{}': {}", dir.string(), ec.message()));
	}

	sort(filenames.begin(), filenames.end());
	return filenames;
}

vector<transfer_job> plan_upload(const string& src, const storage_locator& dst)
{
	const local_path_info info = classify_local_path(src);
	if (info.kind == path_kind::not_found)
		throw plan_error(fmt::format("Failed to stat input path '{}': {}", src, info.reason));

	vector<transfer_job> jobs;

	if (info.kind == path_kind::file)
	{
		// Output is either a bucket, in which case the file name is used
		// as the key, or a key that is used verbatim.
		// The name is taken from the path as given, a symlink keeps its own name.
		const string filename = fs::path(src).filename().string();
		string       key      = dst.key();
		if (key.empty())
			key = filename;
		else if (ends_with(key, '/'))
			key += filename;

		jobs.emplace_back(direction::upload, info.path, storage_locator(dst.bucket(), key));
		return jobs;
	}

	// Uploading a folder to s3://mybucket/images results in
	//   <folder>/foo.png         -> s3://mybucket/images/foo.png
	//   <folder>/subdir/baz.jpg  -> s3://mybucket/images/subdir/baz.jpg
	const vector<string> filenames = read_directory(info.path);
	jobs.reserve(filenames.size());
	for (const string& rel : filenames)
	{
		jobs.emplace_back(direction::upload, info.path / fs::path(rel).make_preferred(),
			storage_locator(dst.bucket(), make_key(dst.key(), rel)));
	}

	spdlog::debug(LOG_SC_PLAN "Found {} files in '{}'", jobs.size(), info.path.string());
	return jobs;
}

vector<transfer_job> plan_download(storage::iclient& client, const storage_locator& src, const string& dst)
{
	const string& key = src.key();
	vector<transfer_job> jobs;

	if (!ends_with(key, '*'))
	{
		if (key.empty() || ends_with(key, '/'))
		{
			throw plan_error(fmt::format(
				"'{}' does not name an object, append '*' to download a prefix", to_storage_uri(src)));
		}

		const local_path_info info = classify_local_path(dst);
		const fs::path out = info.kind == path_kind::directory ? info.path / last_segment(key) : fs::path(dst);

		jobs.emplace_back(direction::download, out, src);
		return jobs;
	}

	// Wildcard: download all keys with the prefix before the marker.
	const string prefix = key.substr(0, key.size() - 1);

	const local_path_info info = classify_local_path(dst);
	if (info.kind != path_kind::directory)
	{
		throw plan_error(fmt::format("Destination '{}' must be an existing directory for a wildcard download{}",
			dst, info.reason.empty() ? string() : ": " + info.reason));
	}

	vector<string> keys;
	try
	{
		keys = client.list(src.bucket(), prefix);
	}
	catch (const storage::exception& e)
	{
		throw plan_error(fmt::format("Failed to list '{}': {}",
			to_storage_uri(storage_locator(src.bucket(), prefix)), e.what()));
	}

	sort(keys.begin(), keys.end());
	jobs.reserve(keys.size());
	for (const string& obj : keys)
	{
		if (obj.compare(0, prefix.size(), prefix) != 0)
			throw plan_error(fmt::format("Listing returned key '{}' outside of prefix '{}'", obj, prefix));

		// Placeholder objects for "folders" carry no data.
		if (ends_with(obj, '/'))
		{
			spdlog::debug(LOG_SC_PLAN "Skipping folder placeholder '{}'", obj);
			continue;
		}

		jobs.emplace_back(direction::download, info.path / download_relpath(obj, prefix),
			storage_locator(src.bucket(), obj));
	}

	spdlog::debug(LOG_SC_PLAN "Listed {} objects with prefix '{}'", jobs.size(), prefix);
	return jobs;
}

} // namespace planner
} // namespace s3util
