#pragma once
#include <exception>
#include <string>

namespace s3util
{

class error : public std::exception
{

public:
	error(const std::string &&err)
		: m_error_msg(err)
	{
	}

public:
	virtual const char *what() const throw() { return m_error_msg.c_str(); }

private:
	const std::string m_error_msg;
};

/// Bad command line invocation. Raised before any I/O.
class usage_error : public error
{
public:
	using error::error;
};

/// Neither or both of the paths are storage URIs.
class ambiguous_direction_error : public usage_error
{
public:
	using usage_error::usage_error;
};

/// Enumeration, listing or stat failure while building the job list.
class plan_error : public error
{
public:
	using error::error;
};

/// Unrecoverable condition, e.g. the storage backend can not be created.
class fatal_error : public error
{
public:
	using error::error;
};

} // namespace s3util
