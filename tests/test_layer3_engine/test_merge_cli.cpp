/**
 * @file test_merge_cli.cpp
 * @brief Command-line parsing, job layering, exit codes and file output of the aiomerge runs.
 */
#include "aio_engine.hpp"
#include "shared_test_helpers.h"
#include "tools/merge_cli.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace aiomerge;
using namespace aiomerge::cli;
using namespace aiomerge::tests::helper;
using aiomerge::utils::Logger;

namespace
{

/// Sets (or with nullptr, clears) an environment variable for the lifetime of the object.
class ScopedEnv
{
  public:
    ScopedEnv(const char *name, const char *value) : name_(name)
    {
        if (const char *old = std::getenv(name))
            old_ = old;
        if (value != nullptr)
            ::setenv(name, value, 1);
        else
            ::unsetenv(name);
    }
    ~ScopedEnv()
    {
        if (old_)
            ::setenv(name_.c_str(), old_->c_str(), 1);
        else
            ::unsetenv(name_.c_str());
    }
    ScopedEnv(const ScopedEnv &) = delete;
    ScopedEnv &operator=(const ScopedEnv &) = delete;

  private:
    std::string name_;
    std::optional<std::string> old_;
};

std::vector<uint8_t> read_bytes(const fs::path &path)
{
    std::error_code ec;
    auto bytes = utils::read_file_bytes(path, ec);
    EXPECT_FALSE(ec) << path << ": " << ec.message();
    return bytes;
}

} // namespace

class MergeCliTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        write_bytes(base_, make_pattern(256, 11));
        write_bytes(fw1_, make_pattern(64, 12));
        write_bytes(fw2_, make_pattern(32, 13));
    }

    void TearDown() override
    {
        auto &logger = Logger::instance();
        logger.set_level(Logger::Level::L_INFO);
        logger.set_console();
        logger.flush();
    }

    MergeJob simple_job() const
    {
        MergeJob job;
        job.base = base_;
        job.targets.push_back(TargetJob{fw1_, std::nullopt});
        job.output = dir_ / "merged.bin";
        return job;
    }

    TempDir dir_{"aiomerge_cli"};
    fs::path base_ = dir_ / "main.bin";
    fs::path fw1_ = dir_ / "fw1.bin";
    fs::path fw2_ = dir_ / "fw2.bin";
    std::ostringstream out_;
    std::ostringstream err_;
};

// ---------------------------------------------------------------------------
// parse_args
// ---------------------------------------------------------------------------

TEST(MergeCliArgsTest, CollectsFlagsAndRepeatedTargets)
{
    const auto args = parse_args({"--base", "main.bin", "--target", "a.bin", "--target", "b.bin@0x4000", "-o",
                                  "out.bin", "--report", "out.json", "--parallel-checksums", "--dry-run",
                                  "--log-level", "debug", "--log-file", "merge.log"});
    EXPECT_EQ(args.base, "main.bin");
    EXPECT_EQ(args.targets, (std::vector<std::string>{"a.bin", "b.bin@0x4000"}));
    EXPECT_EQ(args.output, "out.bin");
    EXPECT_EQ(args.report, "out.json");
    EXPECT_TRUE(args.parallel_checksums);
    EXPECT_TRUE(args.dry_run);
    EXPECT_EQ(args.log_level, "debug");
    EXPECT_EQ(args.log_file, "merge.log");
    EXPECT_FALSE(args.show_help);
}

TEST(MergeCliArgsTest, BadCommandLinesAreUsageErrors)
{
    EXPECT_THROW(parse_args({"--base", "main.bin", "--frobnicate"}), UsageError);
    EXPECT_THROW(parse_args({"--base"}), UsageError);
    EXPECT_THROW(parse_args({"--output", "out.bin"}), UsageError);
    EXPECT_THROW(parse_args({}), UsageError);
}

TEST(MergeCliArgsTest, HelpStopsParsing)
{
    const auto args = parse_args({"--help", "--frobnicate"});
    EXPECT_TRUE(args.show_help);

    std::ostringstream os;
    print_usage(os, "aiomerge");
    EXPECT_NE(os.str().find("--inspect <file>"), std::string::npos);
}

// ---------------------------------------------------------------------------
// resolve_job
// ---------------------------------------------------------------------------

TEST_F(MergeCliTest, FlagsOverrideJobFile)
{
    ScopedEnv level("AIOMERGE_LOG_LEVEL", nullptr);
    const auto job_path = dir_ / "job.json";
    write_text(job_path, R"({
        "base": "main.bin",
        "targets": [ { "path": "fw1.bin" }, "fw2.bin" ],
        "output": "from_job.bin",
        "log": { "level": "warn" }
    })");

    MergeArgs args;
    args.job_path = job_path.string();
    args.output = (dir_ / "from_flag.bin").string();
    args.log_level = "debug";
    args.parallel_checksums = true;

    const auto job = resolve_job(args);
    EXPECT_EQ(job.base, base_);
    ASSERT_EQ(job.targets.size(), 2u);
    EXPECT_EQ(job.output, dir_ / "from_flag.bin");
    EXPECT_EQ(job.log.level, Logger::Level::L_DEBUG);
    EXPECT_TRUE(job.parallel_checksums);
}

TEST_F(MergeCliTest, CommandLineTargetsReplaceJobTargets)
{
    const auto job_path = dir_ / "job.json";
    write_text(job_path, R"({ "base": "main.bin", "targets": [ "fw1.bin", "fw2.bin" ] })");

    MergeArgs args;
    args.job_path = job_path.string();
    args.targets = {"extra.bin@0x400"};

    const auto job = resolve_job(args);
    ASSERT_EQ(job.targets.size(), 1u);
    EXPECT_EQ(job.targets[0].path, fs::path("extra.bin"));
    EXPECT_EQ(job.targets[0].offset, 0x400u);
}

TEST_F(MergeCliTest, LogLevelFlagOverridesEnvironment)
{
    ScopedEnv level("AIOMERGE_LOG_LEVEL", "error");

    MergeArgs args;
    args.base = base_.string();
    EXPECT_EQ(resolve_job(args).log.level, Logger::Level::L_ERROR);

    args.log_level = "trace";
    EXPECT_EQ(resolve_job(args).log.level, Logger::Level::L_TRACE);
}

TEST_F(MergeCliTest, UnknownLogLevelIsAConfigError)
{
    MergeArgs args;
    args.base = base_.string();
    args.log_level = "chatty";
    EXPECT_THROW(resolve_job(args), std::runtime_error);

    EXPECT_EQ(run(args, out_, err_), kExitUsage);
    EXPECT_NE(err_.str().find("Config error"), std::string::npos);
}

// ---------------------------------------------------------------------------
// run_merge
// ---------------------------------------------------------------------------

TEST_F(MergeCliTest, MergeWritesImageAndReport)
{
    auto job = simple_job();
    job.report = dir_ / "merged.json";

    ASSERT_EQ(run_merge(job, false, out_, err_), kExitOk) << err_.str();
    EXPECT_NE(out_.str().find("fw1.bin"), std::string::npos);
    EXPECT_NE(out_.str().find("Wrote"), std::string::npos);

    // Header 0x20 + 2 * 0x50, then 256 base bytes, then 64 target bytes.
    const auto image = read_bytes(job.output);
    EXPECT_EQ(image.size(), 0xC0u + 256u + 64u);

    std::string text;
    ASSERT_TRUE(read_file_contents(job.report.string(), text));
    const auto report = nlohmann::json::parse(text);
    EXPECT_EQ(report.at("header_size"), 0xC0);
    EXPECT_EQ(report.at("entry_count"), 2);
    EXPECT_EQ(report.at("entries").at(1).at("offset"), 0xC0 + 256);
}

TEST_F(MergeCliTest, DryRunWritesNothing)
{
    auto job = simple_job();
    job.report = dir_ / "merged.json";

    EXPECT_EQ(run_merge(job, true, out_, err_), kExitOk) << err_.str();
    EXPECT_NE(out_.str().find("fw1.bin"), std::string::npos);
    EXPECT_FALSE(fs::exists(job.output));
    EXPECT_FALSE(fs::exists(job.report));
}

TEST_F(MergeCliTest, DryRunNeedsNoOutputPath)
{
    auto job = simple_job();
    job.output.clear();
    EXPECT_EQ(run_merge(job, true, out_, err_), kExitOk) << err_.str();
    EXPECT_EQ(run_merge(job, false, out_, err_), kExitUsage);
}

TEST_F(MergeCliTest, RejectedMergeExitsTwoAndWritesNothing)
{
    auto job = simple_job();
    job.targets.push_back(TargetJob{fw2_, 0x10u});
    job.report = dir_ / "merged.json";

    EXPECT_EQ(run_merge(job, false, out_, err_), kExitRejected);
    EXPECT_NE(err_.str().find("OffsetCollidesWithHeader"), std::string::npos);
    EXPECT_FALSE(fs::exists(job.output));
    EXPECT_FALSE(fs::exists(job.report));
}

TEST_F(MergeCliTest, MissingInputFileExitsOne)
{
    auto job = simple_job();
    job.targets.push_back(TargetJob{dir_ / "absent.bin", std::nullopt});

    EXPECT_EQ(run_merge(job, false, out_, err_), kExitUsage);
    EXPECT_NE(err_.str().find("absent.bin"), std::string::npos);
    EXPECT_FALSE(fs::exists(job.output));
}

TEST_F(MergeCliTest, FailedReportWriteLeavesNoImage)
{
    auto job = simple_job();
    job.report = dir_ / "report_dir";
    fs::create_directory(job.report);

    EXPECT_EQ(run_merge(job, false, out_, err_), kExitUsage);
    EXPECT_NE(err_.str().find("Cannot write report"), std::string::npos);
    EXPECT_FALSE(fs::exists(job.output));
}

TEST_F(MergeCliTest, RunDispatchesMergeFromArguments)
{
    ScopedEnv level("AIOMERGE_LOG_LEVEL", nullptr);
    ScopedEnv file("AIOMERGE_LOG_FILE", nullptr);
    const auto output = dir_ / "from_args.bin";
    const auto args =
        parse_args({"--base", base_.string(), "--target", fw2_.string() + "@0x400", "--output", output.string()});

    ASSERT_EQ(run(args, out_, err_), kExitOk) << err_.str();
    EXPECT_EQ(read_bytes(output).size(), 0x400u + 32u);
}

// ---------------------------------------------------------------------------
// run_inspect
// ---------------------------------------------------------------------------

TEST_F(MergeCliTest, InspectReportsChecksumMismatchWithExitTwo)
{
    const auto job = simple_job();
    ASSERT_EQ(run_merge(job, false, out_, err_), kExitOk) << err_.str();

    std::ostringstream good;
    EXPECT_EQ(run_inspect(job.output, good, err_), kExitOk);
    EXPECT_NE(good.str().find("2 entries"), std::string::npos);
    EXPECT_EQ(good.str().find("MISMATCH"), std::string::npos);

    auto image = read_bytes(job.output);
    image[0xC0 + 256 + 3] ^= 0x01;
    write_bytes(job.output, image);

    std::ostringstream bad;
    EXPECT_EQ(run_inspect(job.output, bad, err_), kExitRejected);
    EXPECT_NE(bad.str().find("MISMATCH"), std::string::npos);
}

TEST_F(MergeCliTest, InspectOfPlainOrMissingFile)
{
    EXPECT_EQ(run_inspect(base_, out_, err_), kExitRejected);
    EXPECT_EQ(run_inspect(dir_ / "absent.bin", out_, err_), kExitUsage);
}
