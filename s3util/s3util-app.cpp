#include <iostream>
#include <string>

// Third party libraries
#include "CLI/CLI.hpp"
#include "spdlog/spdlog.h"

// s3util
#include "cli.hpp"

#ifndef S3UTIL_VERSION_STRING
#define S3UTIL_VERSION_STRING "0.0.0"
#endif

using namespace std;

const char* usage_examples()
{
	return "One of the paths must start with s3://\n"
		"Example copy to s3:\n"
		"    s3util foo.txt s3://mybucket/foo.txt\n"
		"    s3util ./images s3://mybucket/images\n"
		"Example copy from s3:\n"
		"    s3util s3://mybucket/foo.txt foo.txt\n"
		"    s3util 's3://mybucket/logs/*' ./logs\n";
}

int main(int argc, char** argv)
{
	using namespace s3util;

	CLI::App app("s3util: copy files and folders to and from object storage. v" S3UTIL_VERSION_STRING);
	app.set_config("--config");
	app.footer(usage_examples());
	app.failure_message(CLI::FailureMessage::help);

	spdlog::set_pattern("%H:%M:%S.%f %^[%L]%$ %v");
	app.add_flag_function(
		"--verbose,-v",
		[](size_t) {
			spdlog::set_level(spdlog::level::trace);
		},
		"enable verbose output");

	app.add_option(
		"--loglevel",
		[](CLI::results_t val) {
			const spdlog::level::level_enum lev = spdlog::level::from_str(val[0]);
			spdlog::set_level(lev);
			spdlog::info("Log level set to {}", val[0]);
			return true;
		},
		"log level [trace, debug, info, warn, err, critical, off]");

	app.add_flag_function(
		"--version",
		[](size_t) {
			cerr << "s3util v" << S3UTIL_VERSION_STRING << endl;
			throw CLI::Success();
		},
		"Show version info");

	s3util::config cfg;
	string         src, dst;
	app.add_option("input", src, "Source path: local file or folder, or s3://bucket/key[*]")->required();
	app.add_option("output", dst, "Destination path: local path or s3://bucket[/key]")->required();
	app.add_option("-j,--parallel", cfg.parallelism, "Number of concurrent transfers")
		->capture_default_str()
		->check(CLI::PositiveNumber);
	app.add_option("--store-root", cfg.store_root, "Root folder of the bucket store")
		->envname("S3UTIL_STORE_ROOT");
	app.add_flag("--printout", cfg.only_print, "Print the planned transfers. No transfer.");

	try
	{
		app.parse(argc, argv);
	}
	catch (const CLI::ParseError& e)
	{
		const int code = app.exit(e);
		return code == 0 ? EXIT_OK : EXIT_USAGE;
	}

	return run_copy(cfg, src, dst, cout, cerr, app.help());
}
