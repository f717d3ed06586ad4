// file_io.cpp
#include "aio_service.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <optional>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace aiomerge::utils
{

namespace fs = std::filesystem;

namespace
{

std::error_code errno_code(int errnum)
{
    return std::make_error_code(static_cast<std::errc>(errnum));
}

bool ensure_parent_dir(const fs::path &target, std::error_code &ec)
{
    fs::path parent = target.parent_path();
    if (parent.empty())
        return true;
    fs::create_directories(parent, ec);
    if (ec)
    {
        LOGGER_ERROR("write_file_atomic: create_directories failed for {}: {}", parent.string(),
                     ec.message());
        return false;
    }
    return true;
}

/// Refuses to write through a symbolic link.
bool reject_if_symlink(const fs::path &target, std::error_code &ec)
{
    struct stat lstat_buf;
    if (::lstat(target.c_str(), &lstat_buf) != 0)
        return true; // missing target is fine
    if (!S_ISLNK(lstat_buf.st_mode))
        return true;
    ec = std::make_error_code(std::errc::operation_not_permitted);
    LOGGER_ERROR("write_file_atomic: target '{}' is a symbolic link, refusing to write",
                 target.string());
    return false;
}

/// Creates "<target>.tmp.XXXXXX" beside the target; returns (path, fd).
std::optional<std::pair<std::string, int>> create_temp(const fs::path &target, std::error_code &ec)
{
    fs::path parent = target.parent_path();
    const std::string dir = parent.empty() ? std::string(".") : parent.string();
    std::string tmpl = dir + "/" + target.filename().string() + ".tmp.XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int fd = ::mkstemp(buf.data());
    if (fd == -1)
    {
        const int errnum = errno;
        ec = errno_code(errnum);
        LOGGER_ERROR("write_file_atomic: mkstemp failed for '{}': {}", buf.data(),
                     std::strerror(errnum));
        return std::nullopt;
    }
    return std::pair{std::string(buf.data()), fd};
}

bool write_all(int fd, std::span<const uint8_t> data, std::error_code &ec)
{
    const uint8_t *p = data.data();
    size_t left = data.size();
    while (left > 0)
    {
        const ssize_t n = ::write(fd, p, left);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            ec = errno_code(errno);
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

} // namespace

std::vector<uint8_t> read_file_bytes(const fs::path &path, std::error_code &ec)
{
    ec.clear();
    if (!fs::is_regular_file(path, ec))
    {
        if (!ec)
            ec = std::make_error_code(std::errc::no_such_file_or_directory);
        return {};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
    {
        ec = std::make_error_code(std::errc::permission_denied);
        return {};
    }

    in.seekg(0, std::ios::end);
    const std::streamoff length = in.tellg();
    if (length < 0)
    {
        ec = std::make_error_code(std::errc::io_error);
        return {};
    }
    in.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(static_cast<size_t>(length));
    if (length > 0 && !in.read(reinterpret_cast<char *>(data.data()), length))
    {
        ec = std::make_error_code(std::errc::io_error);
        return {};
    }
    LOGGER_DEBUG("read {} bytes from '{}'", data.size(), path.string());
    return data;
}

bool write_file_atomic(const fs::path &target, std::span<const uint8_t> data, std::error_code &ec)
{
    ec.clear();
    if (!ensure_parent_dir(target, ec) || !reject_if_symlink(target, ec))
        return false;

    auto tmp = create_temp(target, ec);
    if (!tmp)
        return false;

    const std::string tmp_path = tmp->first;
    int fd = tmp->second;
    auto cleanup = basics::make_scope_guard([&fd, &tmp_path]() noexcept {
        if (fd != -1)
            ::close(fd);
        ::unlink(tmp_path.c_str());
    });

    if (!write_all(fd, data, ec))
    {
        LOGGER_ERROR("write_file_atomic: write to '{}' failed: {}", tmp_path, ec.message());
        return false;
    }
    if (::fsync(fd) != 0)
    {
        ec = errno_code(errno);
        LOGGER_ERROR("write_file_atomic: fsync of '{}' failed: {}", tmp_path, ec.message());
        return false;
    }
    // Keep the 0600 mkstemp default from leaking into the output image.
    if (::fchmod(fd, 0644) != 0)
    {
        ec = errno_code(errno);
        LOGGER_ERROR("write_file_atomic: fchmod of '{}' failed: {}", tmp_path, ec.message());
        return false;
    }
    const int close_rc = ::close(fd);
    fd = -1;
    if (close_rc != 0)
    {
        ec = errno_code(errno);
        LOGGER_ERROR("write_file_atomic: close of '{}' failed: {}", tmp_path, ec.message());
        return false;
    }
    if (::rename(tmp_path.c_str(), target.c_str()) != 0)
    {
        ec = errno_code(errno);
        LOGGER_ERROR("write_file_atomic: rename '{}' -> '{}' failed: {}", tmp_path, target.string(),
                     ec.message());
        return false;
    }

    cleanup.dismiss();
    LOGGER_DEBUG("wrote {} bytes to '{}'", data.size(), target.string());
    return true;
}

} // namespace aiomerge::utils
