#pragma once
#include <filesystem>	// Requires C++17
#include <string>

// s3util
#include "storage.hpp"

namespace s3util
{
namespace storage
{

/// Object storage kept in a local directory tree.
/// Each bucket is a directory right below the root,
/// each object is a file at `<root>/<bucket>/<key>`.
class dir_store : public iclient
{
public:
	/// @throws storage::exception if @p root is not an existing directory
	explicit dir_store(const std::filesystem::path& root);

public:
	void put(const std::string& bucket, const std::string& key, std::istream& body) override;

	std::unique_ptr<std::istream> get(const std::string& bucket, const std::string& key) override;

	std::vector<std::string> list(const std::string& bucket, const std::string& prefix) override;

	const std::filesystem::path& root() const { return m_root; }

private:
	std::filesystem::path bucket_path(const std::string& bucket) const;
	std::filesystem::path object_path(const std::string& bucket, const std::string& key) const;

private:
	const std::filesystem::path m_root;
};

} // namespace storage
} // namespace s3util
