#include <cerrno>
#include <chrono>
#include <filesystem>	// Requires C++17
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

// submodules
#include "spdlog/spdlog.h"

// s3util
#include "transfer.hpp"


using namespace std;
using namespace std::chrono;
using namespace s3util;
namespace fs = std::filesystem;

#define LOG_SC_XFER "XFER "

const string transfer_job::source() const
{
	return dir == direction::upload ? local.string() : to_storage_uri(remote);
}

const string transfer_job::destination() const
{
	return dir == direction::upload ? to_storage_uri(remote) : local.string();
}

namespace
{

void log_done(const transfer_job& job, size_t bytes, steady_clock::time_point time_start)
{
	const auto delta_us  = duration_cast<microseconds>(steady_clock::now() - time_start).count();
	const size_t rate_kbps = (bytes * 1000) / (delta_us ? delta_us : 1) * 8;

	spdlog::debug(LOG_SC_XFER "'{}' -> '{}' done ({} kbytes transferred at {} kbps)",
		job.source(), job.destination(), bytes / 1024, rate_kbps);
}

/// Reason why opening @p path failed. @p err is the errno captured after the attempt.
string open_failure(const fs::path& path, int err)
{
	if (err != 0)
		return error_code(err, generic_category()).message();

	error_code ec;
	fs::status(path, ec);
	return ec ? ec.message() : "cannot open file";
}

/// Copy the remaining content of @p src to @p dst.
/// @return the number of bytes copied, sets badbit on @p src on a read error
size_t copy_stream(istream& src, ostream& dst)
{
	vector<char> buf(64 * 1024);
	size_t       total = 0;

	while (dst)
	{
		src.read(buf.data(), streamsize(buf.size()));
		const streamsize n = src.gcount();
		if (n > 0)
		{
			dst.write(buf.data(), n);
			total += size_t(n);
		}

		if (src.eof())
			break;

		if (!src.good())
		{
			src.setstate(ios::badbit);
			break;
		}
	}

	return total;
}

} // namespace

namespace s3util
{
namespace transfer
{

job_outcome upload_file(storage::iclient& client, const transfer_job& job)
{
	const steady_clock::time_point time_start = steady_clock::now();

	try
	{
		errno = 0;
		ifstream ifile(job.local, ios::in | ios::binary);
		if (!ifile)
		{
			const string reason = open_failure(job.local, errno);
			return job_err{ fmt::format("failed to read source file '{}': {}", job.local.string(), reason) };
		}

		client.put(job.remote.bucket(), job.remote.key(), ifile);

		error_code   ec;
		const size_t bytes = size_t(fs::file_size(job.local, ec));
		log_done(job, ec ? 0 : bytes, time_start);
		return job_ok{};
	}
	catch (const exception& e)
	{
		return job_err{ fmt::format("failed to upload '{}': {}", job.local.string(), e.what()) };
	}
}

job_outcome download_file(storage::iclient& client, const transfer_job& job)
{
	const steady_clock::time_point time_start = steady_clock::now();
	const string                   dst        = job.local.string();
	bool                           created    = false;

	try
	{
		const unique_ptr<istream> body = client.get(job.remote.bucket(), job.remote.key());
		if (!body)
			return job_err{ fmt::format("failed to download '{}': no data stream", dst) };

		const fs::path parent = job.local.parent_path();
		error_code     ec;
		if (!parent.empty() && !fs::create_directories(parent, ec) && ec && !fs::is_directory(parent))
		{
			return job_err{ fmt::format("failed to create folder '{}': {}", parent.string(), ec.message()) };
		}

		errno = 0;
		ofstream ofile(job.local, ios::out | ios::trunc | ios::binary);
		if (!ofile)
		{
			const string reason = open_failure(job.local, errno);
			return job_err{ fmt::format("failed to open '{}' for writing: {}", dst, reason) };
		}
		created = true;

		const size_t bytes = copy_stream(*body, ofile);
		ofile.close();

		if (body->bad() || ofile.fail())
		{
			fs::remove(job.local, ec);
			return job_err{ fmt::format("failed to download '{}': {} error", dst, body->bad() ? "read" : "write") };
		}

		log_done(job, bytes, time_start);
		return job_ok{};
	}
	catch (const exception& e)
	{
		// Do not leave a partially written file behind.
		error_code ec;
		if (created)
			fs::remove(job.local, ec);
		return job_err{ fmt::format("failed to download '{}': {}", dst, e.what()) };
	}
}

job_outcome transfer_one(storage::iclient& client, const transfer_job& job)
{
	switch (job.dir)
	{
	case direction::upload:
		return upload_file(client, job);
	case direction::download:
		return download_file(client, job);
	}

	return job_err{ "unknown transfer direction" };
}

} // namespace transfer
} // namespace s3util
