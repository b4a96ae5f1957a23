#pragma once
#include <filesystem>	// Requires C++17
#include <optional>
#include <string>
#include <system_error>

namespace s3util
{

constexpr const char* storage_scheme = "s3://";

/// Bucket and key of an object (or of a key prefix) in object storage.
class storage_locator
{
public:
	storage_locator(const std::string& bucket, const std::string& key)
		: m_bucket(bucket)
		, m_key(key)
	{
	}

public:
	const std::string& bucket() const { return m_bucket; }
	const std::string& key() const { return m_key; }

	bool operator==(const storage_locator& other) const
	{
		return m_bucket == other.m_bucket && m_key == other.m_key;
	}

	bool operator!=(const storage_locator& other) const { return !(*this == other); }

private:
	std::string m_bucket;
	std::string m_key;
};

/// @return true if the path starts with the storage scheme prefix
bool is_storage_uri(const std::string& path);

/// Split a storage URI into bucket and key.
/// Examples:
///   s3://mybucket/mykey  => "mybucket", "mykey"
///   s3://mybucket/       => "mybucket", ""
///   s3://mybucket        => "mybucket", ""
/// @return locator, or std::nullopt if the path is not a storage URI
std::optional<storage_locator> resolve_storage_uri(const std::string& path);

/// Compose a storage URI from a locator. Inverse of resolve_storage_uri().
std::string to_storage_uri(const storage_locator& loc);

enum class path_kind
{
	file,
	directory,
	not_found
};

struct local_path_info
{
	path_kind             kind = path_kind::not_found;
	std::filesystem::path path;    // canonical absolute path, or the input path if not found
	std::string           reason;  // why the path is not_found
};

/// Resolve a local path to its canonical absolute form and classify it.
/// Existing entries that are neither regular files nor directories
/// are reported as not_found.
local_path_info classify_local_path(const std::string& path);

} // namespace s3util
