#pragma once

// s3util
#include "job.hpp"
#include "storage.hpp"

namespace s3util
{
namespace transfer
{

/// Upload one local file to object storage.
/// Never throws, failures are returned as job_err.
job_outcome upload_file(storage::iclient& client, const transfer_job& job);

/// Download one object into a local file, creating missing parent folders.
/// A partially written file is removed on failure.
/// Never throws, failures are returned as job_err.
job_outcome download_file(storage::iclient& client, const transfer_job& job);

/// Dispatch by the job direction.
job_outcome transfer_one(storage::iclient& client, const transfer_job& job);

} // namespace transfer
} // namespace s3util
