#include <memory>
#include <string>
#include <vector>

// submodules
#include "spdlog/spdlog.h"

// s3util
#include "cli.hpp"
#include "dir_store.hpp"
#include "errors.hpp"
#include "locator.hpp"


using namespace std;
using namespace s3util;

#define LOG_SC_CLI "CLI "

int s3util::run_copy(const config& cfg, const string& src, const string& dst,
	ostream& out, ostream& err, const string& usage)
{
	try
	{
		// The direction is known from the arguments alone, check it before touching the store.
		if (is_storage_uri(src) == is_storage_uri(dst))
		{
			throw ambiguous_direction_error(is_storage_uri(src)
				? "Both paths are storage URIs, one of them must be a local path"
				: fmt::format("One of the paths must start with {}", storage_scheme));
		}

		if (cfg.store_root.empty())
			throw usage_error("No bucket store configured, use --store-root or S3UTIL_STORE_ROOT");

		storage::shared_client_t client = make_shared<storage::dir_store>(cfg.store_root);
		orchestrator             orch(cfg, client);

		if (cfg.only_print)
		{
			const vector<transfer_job> jobs = orch.plan(src, dst);
			for (const transfer_job& job : jobs)
				out << job.source() << " -> " << job.destination() << endl;
			return EXIT_OK;
		}

		const aggregate_outcome outcome = orch.run(src, dst);
		for (const job_failure& f : outcome.failed)
			err << f.job << ": " << f.reason << endl;

		err << outcome.succeeded << " of " << outcome.total << " files transferred";
		if (!outcome.ok())
			err << ", " << outcome.failed.size() << " failed";
		err << endl;

		return outcome.ok() ? EXIT_OK : EXIT_FAIL;
	}
	catch (const usage_error& e)
	{
		err << e.what() << "\n\n" << usage << endl;
		return EXIT_USAGE;
	}
	catch (const plan_error& e)
	{
		spdlog::error(LOG_SC_CLI "Nothing was transferred: {}", e.what());
		return EXIT_FAIL;
	}
	catch (const storage::exception& e)
	{
		spdlog::critical(LOG_SC_CLI "Storage error: {}", e.what());
		return EXIT_FAIL;
	}
	catch (const std::exception& e)
	{
		spdlog::critical(LOG_SC_CLI "{}", e.what());
		return EXIT_FAIL;
	}
}
