// tests/test_framework/shared_test_helpers.cpp
/**
 * @file shared_test_helpers.cpp
 * @brief Implements common helper functions and utilities for test cases.
 */
#include "shared_test_helpers.h"

#include <atomic>
#include <fstream>
#include <random>
#include <stdexcept>
#include <sstream>
#include <system_error>
#include <thread>

#include <fmt/format.h>

#include <unistd.h>

namespace aiomerge::tests::helper
{

TempDir::TempDir(std::string_view prefix)
{
    static std::atomic<unsigned> counter{0};
    std::random_device rd;
    const fs::path root = fs::temp_directory_path();
    for (int attempt = 0; attempt < 100; ++attempt)
    {
        fs::path candidate =
            root / fmt::format("{}_{}_{}_{:08x}", prefix, ::getpid(), counter.fetch_add(1), rd());
        std::error_code ec;
        if (fs::create_directory(candidate, ec) && !ec)
        {
            path_ = std::move(candidate);
            return;
        }
    }
    throw std::runtime_error("TempDir: could not create a unique directory under " + root.string());
}

TempDir::~TempDir()
{
    std::error_code ec;
    fs::remove_all(path_, ec);
}

std::vector<uint8_t> make_filled(size_t size, uint8_t value)
{
    return std::vector<uint8_t>(size, value);
}

std::vector<uint8_t> make_pattern(size_t size, uint32_t seed)
{
    std::vector<uint8_t> out(size);
    uint32_t x = seed * 2654435761u + 1u;
    for (auto &b : out)
    {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        b = static_cast<uint8_t>(x);
    }
    return out;
}

void write_bytes(const fs::path &path, std::span<const uint8_t> bytes)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    ASSERT_TRUE(out.is_open()) << "cannot open " << path;
    out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    ASSERT_TRUE(out.good()) << "write failed: " << path;
}

void write_text(const fs::path &path, std::string_view text)
{
    std::ofstream out(path, std::ios::trunc);
    ASSERT_TRUE(out.is_open()) << "cannot open " << path;
    out << text;
    ASSERT_TRUE(out.good()) << "write failed: " << path;
}

bool read_file_contents(const std::string &path, std::string &out)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return false;
    std::ostringstream ss;
    ss << ifs.rdbuf();
    out = ss.str();
    return true;
}

size_t count_lines(std::string_view text, std::optional<std::string_view> must_include,
                   std::optional<std::string_view> must_exclude)
{
    size_t count = 0;
    size_t pos = 0;

    while (pos < text.size())
    {
        auto end = text.find('\n', pos);
        auto line = text.substr(pos, end - pos);

        if ((!must_include || line.find(*must_include) != std::string_view::npos) &&
            (!must_exclude || line.find(*must_exclude) == std::string_view::npos))
        {
            ++count;
        }

        if (end == std::string_view::npos)
            break;
        pos = end + 1;
    }

    return count;
}

bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout)
{
    auto start = std::chrono::steady_clock::now();
    while (std::chrono::steady_clock::now() - start < timeout)
    {
        std::string contents;
        if (read_file_contents(path.string(), contents))
        {
            if (contents.find(expected) != std::string::npos)
                return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return false;
}

} // namespace aiomerge::tests::helper
