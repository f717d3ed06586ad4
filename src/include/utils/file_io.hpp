#pragma once
/**
 * @file file_io.hpp
 * @brief Whole-file binary reads and atomic binary writes for the merge shell.
 *
 * The merge engine only works on in-memory buffers. Loading the base/target
 * files and writing the finished image are done here, by the caller.
 */
#include <cstdint>
#include <filesystem>
#include <span>
#include <system_error>
#include <vector>

#include "aiomerge_export.h"

namespace aiomerge::utils
{

/**
 * @brief Reads an entire file into memory.
 * @param path File to read.
 * @param ec Set on failure (missing file, not a regular file, read error).
 * @return File contents; empty on failure (check @p ec, a file may legitimately be empty).
 */
AIOMERGE_EXPORT std::vector<uint8_t> read_file_bytes(const std::filesystem::path &path,
                                                     std::error_code &ec);

/**
 * @brief Atomically replaces @p target with @p data.
 *
 * Order: ensure parent dir -> refuse symlink target -> mkstemp temp file next to
 * the target -> write + fsync -> rename over the target. The temp file is
 * removed on every failure path, so the target is either the old file or the
 * complete new one.
 *
 * @param ec Cleared on success, set on failure (failure is also logged).
 * @return true if the target now holds @p data.
 */
AIOMERGE_EXPORT bool write_file_atomic(const std::filesystem::path &target,
                                       std::span<const uint8_t> data, std::error_code &ec);

} // namespace aiomerge::utils
