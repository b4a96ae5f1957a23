#include <cstdio>
#include <string>

#include <sys/wait.h>

#include "gtest/gtest.h"

#include "cli.hpp"

using namespace s3util;

namespace
{

struct command_result
{
	int         status = -1;
	std::string output;
};

/// Run the s3util executable with @p args, capturing stdout and stderr.
command_result run_app(const std::string& args)
{
	command_result res;
	const std::string cmd = std::string("'") + S3UTIL_APP_PATH + "' " + args + " 2>&1";

	FILE* pipe = popen(cmd.c_str(), "r");
	if (pipe == nullptr)
		return res;

	char buf[512];
	size_t n = 0;
	while ((n = fread(buf, 1, sizeof(buf), pipe)) > 0)
		res.output.append(buf, n);

	const int wstatus = pclose(pipe);
	if (wstatus != -1 && WIFEXITED(wstatus))
		res.status = WEXITSTATUS(wstatus);
	return res;
}

} // namespace

TEST(App, MissingArgumentPrintsUsage)
{
	const command_result res = run_app("only-one-path");
	EXPECT_EQ(res.status, EXIT_USAGE);
	EXPECT_NE(res.output.find("output is required"), std::string::npos) << res.output;
	EXPECT_NE(res.output.find("Example copy to s3:"), std::string::npos) << res.output;
}

TEST(App, LocalToLocalPrintsUsage)
{
	const command_result res = run_app("--store-root /nonexistent a.txt b.txt");
	EXPECT_EQ(res.status, EXIT_USAGE);
	EXPECT_NE(res.output.find("One of the paths must start with s3://"), std::string::npos) << res.output;
	EXPECT_EQ(res.output.find("Storage error"), std::string::npos) << res.output;
}

TEST(App, VersionExitsZero)
{
	const command_result res = run_app("--version");
	EXPECT_EQ(res.status, EXIT_OK);
	EXPECT_NE(res.output.find("s3util v"), std::string::npos) << res.output;
}
