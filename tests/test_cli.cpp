#include <filesystem>
#include <sstream>
#include <string>

#include "gtest/gtest.h"

#include "cli.hpp"
#include "test_util.hpp"

using namespace s3util;
namespace fs = std::filesystem;

namespace
{

const std::string usage_text = "Usage: s3util [OPTIONS] input output";

config store_config(const fs::path& root)
{
	config cfg;
	cfg.parallelism = 2;
	cfg.store_root  = root.string();
	return cfg;
}

} // namespace

TEST(RunCopy, SuccessExitsZero)
{
	test::temp_dir root;
	test::temp_dir src;
	fs::create_directory(root.path() / "mybucket");
	test::write_file(src.path() / "a.txt", "A");
	test::write_file(src.path() / "sub" / "b.txt", "B");

	std::ostringstream out, err;
	const int code = run_copy(store_config(root.path()), src.path().string(), "s3://mybucket/images", out, err,
		usage_text);

	EXPECT_EQ(code, EXIT_OK);
	EXPECT_EQ(err.str(), "2 of 2 files transferred\n");
	EXPECT_EQ(test::read_file(root.path() / "mybucket" / "images" / "sub" / "b.txt"), "B");
}

TEST(RunCopy, FailedJobsAreListedAndExitOne)
{
	test::temp_dir root;
	test::temp_dir src;
	test::write_file(src.path() / "a.txt", "A");
	test::write_file(src.path() / "b.txt", "B");

	// The bucket folder does not exist, every upload fails.
	std::ostringstream out, err;
	const int code = run_copy(store_config(root.path()), src.path().string(), "s3://nobucket", out, err, usage_text);
	EXPECT_EQ(code, EXIT_FAIL);

	const fs::path    base = fs::canonical(src.path());
	const std::string line_a = (base / "a.txt").string() + " -> s3://nobucket/a.txt: ";
	const std::string line_b = (base / "b.txt").string() + " -> s3://nobucket/b.txt: ";
	const std::string text   = err.str();

	const size_t pos_a = text.find(line_a);
	const size_t pos_b = text.find(line_b);
	ASSERT_EQ(pos_a, 0u) << text;
	ASSERT_NE(pos_b, std::string::npos) << text;
	EXPECT_LT(pos_a, pos_b);
	EXPECT_NE(text.find("No such bucket 'nobucket'", pos_a), std::string::npos);
	EXPECT_NE(text.find("0 of 2 files transferred, 2 failed\n"), std::string::npos);
}

TEST(RunCopy, AmbiguousDirectionIsCheckedBeforeTheStore)
{
	test::temp_dir tmp;
	const config   cfg = store_config(tmp.path() / "no-such-root");

	std::ostringstream out, err;
	EXPECT_EQ(run_copy(cfg, "a.txt", "b.txt", out, err, usage_text), EXIT_USAGE);
	EXPECT_NE(err.str().find("One of the paths must start with s3://"), std::string::npos);
	EXPECT_NE(err.str().find(usage_text), std::string::npos);

	std::ostringstream err_both;
	EXPECT_EQ(run_copy(cfg, "s3://a/x", "s3://b/y", out, err_both, usage_text), EXIT_USAGE);
	EXPECT_NE(err_both.str().find("Both paths are storage URIs"), std::string::npos);

	std::ostringstream err_no_root;
	EXPECT_EQ(run_copy(config(), "a.txt", "b.txt", out, err_no_root, usage_text), EXIT_USAGE);
	EXPECT_NE(err_no_root.str().find("One of the paths must start with s3://"), std::string::npos);
	EXPECT_TRUE(out.str().empty());
}

TEST(RunCopy, MissingStoreRootIsUsageError)
{
	std::ostringstream out, err;
	EXPECT_EQ(run_copy(config(), "a.txt", "s3://b/a.txt", out, err, usage_text), EXIT_USAGE);
	EXPECT_NE(err.str().find("No bucket store configured"), std::string::npos);
	EXPECT_NE(err.str().find(usage_text), std::string::npos);
}

TEST(RunCopy, UnusableStoreRootExitsOne)
{
	test::temp_dir tmp;

	std::ostringstream out, err;
	EXPECT_EQ(run_copy(store_config(tmp.path() / "no-such-root"), "a.txt", "s3://b/a.txt", out, err, usage_text),
		EXIT_FAIL);
}

TEST(RunCopy, PlanErrorExitsOne)
{
	test::temp_dir root;
	test::temp_dir src;
	fs::create_directory(root.path() / "b");

	std::ostringstream out, err;
	EXPECT_EQ(run_copy(store_config(root.path()), (src.path() / "missing").string(), "s3://b", out, err, usage_text),
		EXIT_FAIL);
	EXPECT_TRUE(fs::is_empty(root.path() / "b"));
}

TEST(RunCopy, PrintoutListsJobsWithoutTransfer)
{
	test::temp_dir root;
	test::temp_dir src;
	fs::create_directory(root.path() / "b");
	test::write_file(src.path() / "a.txt", "A");

	config cfg     = store_config(root.path());
	cfg.only_print = true;

	std::ostringstream out, err;
	EXPECT_EQ(run_copy(cfg, src.path().string(), "s3://b/img", out, err, usage_text), EXIT_OK);
	EXPECT_EQ(out.str(), (fs::canonical(src.path()) / "a.txt").string() + " -> s3://b/img/a.txt\n");
	EXPECT_TRUE(fs::is_empty(root.path() / "b"));
}
