#include <algorithm>
#include <fstream>
#include <vector>

// submodules
#include "spdlog/spdlog.h"

// s3util
#include "dir_store.hpp"


using namespace std;
namespace fs = std::filesystem;

#define LOG_SC_STORE "STORE "

namespace s3util
{
namespace storage
{

namespace
{

// Keys are relative '/'-separated paths with no empty, '.' or '..' segments.
bool is_valid_key(const string& key)
{
	if (key.empty())
		return false;

	size_t pos = 0;
	while (pos <= key.size())
	{
		size_t next = key.find('/', pos);
		if (next == string::npos)
			next = key.size();

		const string segment = key.substr(pos, next - pos);
		if (segment.empty() || segment == "." || segment == "..")
			return false;

		pos = next + 1;
	}

	return true;
}

bool is_valid_bucket(const string& bucket)
{
	return !bucket.empty() && bucket.find('/') == string::npos && bucket != "." && bucket != "..";
}

} // namespace

dir_store::dir_store(const fs::path& root)
	: m_root(root)
{
	error_code ec;
	if (!fs::is_directory(m_root, ec))
		throw storage::exception(fmt::format("Store root '{}' is not a directory", m_root.string()));

	spdlog::debug(LOG_SC_STORE "Using store root '{}'", m_root.string());
}

fs::path dir_store::bucket_path(const string& bucket) const
{
	if (!is_valid_bucket(bucket))
		throw storage::exception(fmt::format("Invalid bucket name '{}'", bucket));

	const fs::path path = m_root / bucket;
	error_code     ec;
	if (!fs::is_directory(path, ec))
		throw storage::exception(fmt::format("No such bucket '{}'", bucket));

	return path;
}

fs::path dir_store::object_path(const string& bucket, const string& key) const
{
	if (!is_valid_key(key))
		throw storage::exception(fmt::format("Invalid object key '{}'", key));

	return bucket_path(bucket) / fs::path(key).make_preferred();
}

void dir_store::put(const string& bucket, const string& key, istream& body)
{
	const fs::path path = object_path(bucket, key);

	// Concurrent writers may race creating the same parent,
	// so only fail if the parent is still not a directory afterwards.
	error_code ec;
	fs::create_directories(path.parent_path(), ec);
	if (ec && !fs::is_directory(path.parent_path()))
	{
		throw storage::exception(
			fmt::format("Failed to create '{}': {}", path.parent_path().string(), ec.message()));
	}

	ofstream ofile(path, ios::out | ios::trunc | ios::binary);
	if (!ofile)
		throw storage::exception(fmt::format("Failed to open object '{}/{}' for writing", bucket, key));

	vector<char> buf(64 * 1024);
	bool         read_failed = false;
	while (ofile)
	{
		body.read(buf.data(), streamsize(buf.size()));
		const streamsize n = body.gcount();
		if (n > 0)
			ofile.write(buf.data(), n);

		if (body.eof())
			break;

		if (!body.good())
		{
			read_failed = true;
			break;
		}
	}

	ofile.close();
	if (read_failed || ofile.fail())
	{
		fs::remove(path, ec);
		throw storage::exception(fmt::format("Failed to {} object '{}/{}'",
			read_failed ? "read body of" : "write", bucket, key));
	}

	spdlog::trace(LOG_SC_STORE "Stored '{}/{}'", bucket, key);
}

unique_ptr<istream> dir_store::get(const string& bucket, const string& key)
{
	const fs::path path = object_path(bucket, key);

	error_code ec;
	if (!fs::is_regular_file(path, ec))
		throw storage::exception(fmt::format("No such object '{}/{}'", bucket, key));

	auto ifile = make_unique<ifstream>(path, ios::in | ios::binary);
	if (!*ifile)
		throw storage::exception(fmt::format("Failed to open object '{}/{}' for reading", bucket, key));

	return ifile;
}

vector<string> dir_store::list(const string& bucket, const string& prefix)
{
	const fs::path root = bucket_path(bucket);

	vector<string> keys;
	error_code     ec;
	for (fs::recursive_directory_iterator it(root, ec), end; it != end; it.increment(ec))
	{
		if (ec)
			break;

		if (!it->is_regular_file(ec))
			continue;

		const string key = it->path().lexically_relative(root).generic_string();
		if (key.compare(0, prefix.size(), prefix) == 0)
			keys.push_back(key);
	}

	if (ec)
		throw storage::exception(fmt::format("Failed to list bucket '{}': {}", bucket, ec.message()));

	sort(keys.begin(), keys.end());
	return keys;
}

} // namespace storage
} // namespace s3util
