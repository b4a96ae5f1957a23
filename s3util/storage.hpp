#pragma once
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace s3util
{
namespace storage
{

class exception : public std::exception
{

public:
	exception(const std::string &&err)
		: m_error_msg(err)
	{
	}

public:
	virtual const char *what() const throw() { return m_error_msg.c_str(); }

private:
	const std::string m_error_msg;
};

/// Object storage capability consumed by the transfer core.
/// Implementations must be safe for concurrent invocation from
/// several worker threads.
class iclient
{

public:
	virtual ~iclient() = default;

public:
	/** Store the whole @p body stream as object @p key in @p bucket.
	 *
	 * @throws storage::exception Thrown on failure.
	 */
	virtual void put(const std::string &bucket, const std::string &key, std::istream &body) = 0;

	/** Open object @p key in @p bucket for reading.
	 *
	 * @returns A stream positioned at the start of the object.
	 *
	 * @throws storage::exception Thrown on failure.
	 */
	virtual std::unique_ptr<std::istream> get(const std::string &bucket, const std::string &key) = 0;

	/** List the keys in @p bucket that start with the literal @p prefix.
	 *
	 * @throws storage::exception Thrown on failure.
	 */
	virtual std::vector<std::string> list(const std::string &bucket, const std::string &prefix) = 0;
};

typedef std::shared_ptr<iclient> shared_client_t;

} // namespace storage
} // namespace s3util
