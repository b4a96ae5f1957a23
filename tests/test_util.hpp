#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "storage.hpp"

namespace s3util
{
namespace test
{

/// Unique folder under the system temp path, removed with its content on destruction.
class temp_dir
{
public:
	temp_dir()
	{
		std::string templ = (std::filesystem::temp_directory_path() / "s3util-test-XXXXXX").string();
		if (mkdtemp(templ.data()) == nullptr)
			throw std::runtime_error("mkdtemp failed");
		m_path = templ;
	}

	~temp_dir()
	{
		std::error_code ec;
		std::filesystem::remove_all(m_path, ec);
	}

	temp_dir(const temp_dir&) = delete;
	temp_dir& operator=(const temp_dir&) = delete;

	const std::filesystem::path& path() const { return m_path; }

private:
	std::filesystem::path m_path;
};

inline void write_file(const std::filesystem::path& path, const std::string& content)
{
	std::filesystem::create_directories(path.parent_path());
	std::ofstream ofile(path, std::ios::binary | std::ios::trunc);
	ofile << content;
}

inline std::string read_file(const std::filesystem::path& path)
{
	std::ifstream ifile(path, std::ios::binary);
	return std::string(std::istreambuf_iterator<char>(ifile), std::istreambuf_iterator<char>());
}

/// In-memory object storage with failure injection.
class mem_store : public storage::iclient
{
public:
	void put(const std::string& bucket, const std::string& key, std::istream& body) override
	{
		std::stringstream ss;
		ss << body.rdbuf();

		std::lock_guard<std::mutex> lck(m_mtx);
		++m_put_calls;
		if (m_fail_keys.count(key))
			throw storage::exception("injected put failure for " + key);
		m_objects[bucket + "/" + key] = ss.str();
	}

	std::unique_ptr<std::istream> get(const std::string& bucket, const std::string& key) override
	{
		std::lock_guard<std::mutex> lck(m_mtx);
		if (m_fail_keys.count(key))
			throw storage::exception("injected get failure for " + key);

		const auto it = m_objects.find(bucket + "/" + key);
		if (it == m_objects.end())
			throw storage::exception("no such object " + bucket + "/" + key);

		return std::make_unique<std::istringstream>(it->second);
	}

	std::vector<std::string> list(const std::string& bucket, const std::string& prefix) override
	{
		std::lock_guard<std::mutex> lck(m_mtx);
		if (m_fail_list)
			throw storage::exception("injected list failure");

		if (!m_list_override.empty())
			return m_list_override;

		std::vector<std::string> keys;
		const std::string full_prefix = bucket + "/" + prefix;
		for (const auto& obj : m_objects)
		{
			if (obj.first.compare(0, full_prefix.size(), full_prefix) == 0)
				keys.push_back(obj.first.substr(bucket.size() + 1));
		}
		return keys;
	}

public:
	void add(const std::string& bucket, const std::string& key, const std::string& data)
	{
		std::lock_guard<std::mutex> lck(m_mtx);
		m_objects[bucket + "/" + key] = data;
	}

	bool has(const std::string& bucket, const std::string& key) const
	{
		std::lock_guard<std::mutex> lck(m_mtx);
		return m_objects.count(bucket + "/" + key) != 0;
	}

	std::string object(const std::string& bucket, const std::string& key) const
	{
		std::lock_guard<std::mutex> lck(m_mtx);
		return m_objects.at(bucket + "/" + key);
	}

	size_t object_count() const
	{
		std::lock_guard<std::mutex> lck(m_mtx);
		return m_objects.size();
	}

	size_t put_calls() const
	{
		std::lock_guard<std::mutex> lck(m_mtx);
		return m_put_calls;
	}

	void fail_key(const std::string& key) { m_fail_keys.insert(key); }
	void fail_list() { m_fail_list = true; }
	void set_list_result(const std::vector<std::string>& keys) { m_list_override = keys; }

private:
	mutable std::mutex                 m_mtx;
	std::map<std::string, std::string> m_objects;
	std::set<std::string>              m_fail_keys;
	std::vector<std::string>           m_list_override;
	bool                               m_fail_list = false;
	size_t                             m_put_calls = 0;
};

} // namespace test
} // namespace s3util
