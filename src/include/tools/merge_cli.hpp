#pragma once

/**
 * @file merge_cli.hpp
 * @brief Command-line front end of aiomerge: argument parsing, job resolution
 *        and the merge / inspect runs behind `aiomerge`.
 *
 * `main` only converts argv, prints usage and shuts the Logger down; the rest
 * lives here so it can be driven from tests with in-memory streams.
 *
 * Exit codes: 0 success, 1 usage/config/I/O error, 2 merge rejected or
 * inspection failed.
 */

#include <filesystem>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "aiomerge_export.h"
#include "utils/merge_config.hpp"

namespace aiomerge::cli
{

inline constexpr int kExitOk = 0;
inline constexpr int kExitUsage = 1;
inline constexpr int kExitRejected = 2;

/// Raised by parse_args for unknown flags, missing values or no work to do.
class UsageError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

struct MergeArgs
{
    std::string job_path;
    std::string base;
    std::vector<std::string> targets; ///< "<path>[@<offset>]", in command-line order.
    std::string output;
    std::string report;
    std::string inspect_path;
    std::string log_level;
    std::string log_file;
    bool parallel_checksums{false};
    bool dry_run{false};
    bool show_help{false};
};

/**
 * @brief Parses the arguments after the program name.
 * @throws UsageError on an unknown flag, a flag without its value, or when
 *         none of --base, --job and --inspect is given (unless --help).
 */
AIOMERGE_EXPORT MergeArgs parse_args(const std::vector<std::string> &args);

AIOMERGE_EXPORT void print_usage(std::ostream &os, std::string_view prog);

/**
 * @brief Builds the effective job: defaults, job file, environment, then flags.
 *
 * Targets given on the command line replace the job file's list.
 * @throws std::runtime_error on a bad job file, target argument or log level.
 */
AIOMERGE_EXPORT MergeJob resolve_job(const MergeArgs &args);

/**
 * @brief Merges, prints the layout table and writes the report and image.
 *
 * The JSON report is written before the image, so a failed report write
 * never leaves a fresh image behind. With @p dry_run nothing is written.
 */
AIOMERGE_EXPORT int run_merge(const MergeJob &job, bool dry_run, std::ostream &out, std::ostream &err);

/// Decodes a packaged image and prints one line per entry; 2 if anything fails to verify.
AIOMERGE_EXPORT int run_inspect(const std::filesystem::path &path, std::ostream &out, std::ostream &err);

/// resolve_job, apply_logging, then run_inspect or run_merge, mapped to an exit code.
AIOMERGE_EXPORT int run(const MergeArgs &args, std::ostream &out, std::ostream &err);

} // namespace aiomerge::cli
