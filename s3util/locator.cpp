#include <cstring>

#include "locator.hpp"


using namespace std;
namespace fs = std::filesystem;

namespace s3util
{

bool is_storage_uri(const string& path)
{
	return path.compare(0, strlen(storage_scheme), storage_scheme) == 0;
}

optional<storage_locator> resolve_storage_uri(const string& path)
{
	if (!is_storage_uri(path))
		return nullopt;

	// get the path in `bucket/key` format
	const string without_scheme = path.substr(strlen(storage_scheme));
	const size_t first_slash    = without_scheme.find('/');
	if (first_slash == string::npos)
	{
		// Everything after the scheme is the bucket name,
		// the target is the entire bucket.
		return storage_locator(without_scheme, string());
	}

	// A trailing slash means no key was specified.
	return storage_locator(without_scheme.substr(0, first_slash), without_scheme.substr(first_slash + 1));
}

string to_storage_uri(const storage_locator& loc)
{
	if (loc.key().empty())
		return storage_scheme + loc.bucket();

	return storage_scheme + loc.bucket() + "/" + loc.key();
}

local_path_info classify_local_path(const string& path)
{
	local_path_info info;
	info.path = path;

	error_code ec;
	const fs::path canonical = fs::canonical(path, ec);
	if (ec)
	{
		info.reason = ec.message();
		return info;
	}
	info.path = canonical;

	const fs::file_status st = fs::status(canonical, ec);
	if (ec)
	{
		info.reason = ec.message();
		return info;
	}

	if (fs::is_directory(st))
		info.kind = path_kind::directory;
	else if (fs::is_regular_file(st))
		info.kind = path_kind::file;
	else
		info.reason = "not a regular file or directory";

	return info;
}

} // namespace s3util
