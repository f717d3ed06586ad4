#pragma once

/**
 * @file merge_config.hpp
 * @brief MergeJob: one merge invocation described as a JSON job file.
 *
 * ## Loading: layered (priority low -> high)
 *
 *  1. Built-in defaults (FormatIdentity defaults, log level "info", console sink)
 *  2. Job file passed with `--job` (see format below)
 *  3. `AIOMERGE_LOG_LEVEL` / `AIOMERGE_LOG_FILE` environment overrides
 *  4. Command-line flags, applied by the CLI on top of the loaded job
 *
 * ## JSON format
 *
 * @code{.json}
 * {
 *   "base":    "main.bin",
 *   "targets": [
 *     { "path": "touch_fw.bin" },
 *     { "path": "pen_fw.bin", "offset": "0x4000" }
 *   ],
 *   "output":  "merged.bin",
 *   "report":  "merged.layout.json",
 *   "parallel_checksums": false,
 *   "format": {
 *     "version": 1, "device_type": 1, "fw_version": "0x12345678", "update_ctrl": 0,
 *     "vendor_id": "0x04F3", "product_id": "0x5608", "unique_id": "0xFFFF",
 *     "entry_fw_version": "0x1234"
 *   },
 *   "log": { "level": "info", "file": "" }
 * }
 * @endcode
 *
 * Relative paths are resolved against the job file's directory. Numeric fields
 * accept JSON integers or strings in decimal or `0x` hex. An empty or missing
 * target offset means "right after the previous entry".
 */

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "aiomerge_export.h"
#include "engine/format.hpp"
#include "utils/logger.hpp"

namespace aiomerge
{

struct TargetJob
{
    std::filesystem::path path;
    std::optional<uint32_t> offset;
};

struct LoggingConfig
{
    utils::Logger::Level level{utils::Logger::Level::L_INFO};
    std::string file; ///< Empty = console.
};

/**
 * @struct MergeJob
 * @brief Everything the CLI needs for one merge.
 *
 * Parsing throws std::runtime_error naming the offending key.
 */
struct AIOMERGE_EXPORT MergeJob
{
    std::filesystem::path base;
    std::vector<TargetJob> targets;
    std::filesystem::path output;
    std::filesystem::path report; ///< Empty = no JSON report file.
    bool parallel_checksums{false};
    engine::FormatIdentity identity{};
    LoggingConfig log{};

    static MergeJob from_json(const nlohmann::json &j, const std::filesystem::path &base_dir = {});
    static MergeJob from_json_file(const std::filesystem::path &path);

    /** @brief Applies AIOMERGE_LOG_LEVEL and AIOMERGE_LOG_FILE if set. */
    void apply_environment();
};

/**
 * @brief Parses the "format" section on top of @p defaults; absent keys keep their default.
 */
AIOMERGE_EXPORT engine::FormatIdentity parse_format_identity(const nlohmann::json &j,
                                                             engine::FormatIdentity defaults = {});

/**
 * @brief Parses a command-line target "<path>[@<offset>]".
 *
 * The offset is decimal or `0x` hex; "file.bin@" is the same as "file.bin".
 * The last '@' separates the offset so paths containing '@' still work.
 */
AIOMERGE_EXPORT TargetJob parse_target_argument(std::string_view arg);

/** @brief Switches the global logger to the configured level and sink. */
AIOMERGE_EXPORT void apply_logging(const LoggingConfig &cfg);

} // namespace aiomerge
