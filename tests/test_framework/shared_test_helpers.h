// tests/test_framework/shared_test_helpers.h
#pragma once

/**
 * @file shared_test_helpers.h
 * @brief Common helpers for test cases: scratch directories, byte buffers and
 * file contents.
 */

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "gtest/gtest.h"

namespace fs = std::filesystem;

namespace aiomerge::tests::helper
{

/**
 * @class TempDir
 * @brief A fresh directory under the system temp dir, removed with everything
 * in it when the object goes out of scope.
 */
class TempDir
{
  public:
    explicit TempDir(std::string_view prefix = "aiomerge_test");
    ~TempDir();

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    [[nodiscard]] const fs::path &path() const noexcept { return path_; }
    [[nodiscard]] fs::path operator/(std::string_view name) const { return path_ / name; }

  private:
    fs::path path_;
};

/// @p size bytes, all equal to @p value.
std::vector<uint8_t> make_filled(size_t size, uint8_t value);

/// @p size bytes of a deterministic, non-repeating-looking pattern derived from @p seed.
std::vector<uint8_t> make_pattern(size_t size, uint32_t seed);

/// Writes @p bytes to @p path, replacing it. Fails the current test on error.
void write_bytes(const fs::path &path, std::span<const uint8_t> bytes);

/// Writes @p text to @p path, replacing it. Fails the current test on error.
void write_text(const fs::path &path, std::string_view text);

/**
 * @brief Reads the entire contents of a file into a string.
 * @return True if the file was read successfully, false otherwise.
 */
bool read_file_contents(const std::string &path, std::string &out);

/**
 * @brief Counts lines of @p text, optionally only those containing
 * @p must_include and not containing @p must_exclude.
 */
size_t count_lines(std::string_view text,
                   std::optional<std::string_view> must_include = std::nullopt,
                   std::optional<std::string_view> must_exclude = std::nullopt);

/**
 * @brief Polls a file until @p expected appears in it or @p timeout expires.
 */
bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout = std::chrono::seconds(15));

} // namespace aiomerge::tests::helper
