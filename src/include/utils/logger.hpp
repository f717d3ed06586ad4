/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logging utility.
 *
 * **Design: Command-Queue Pattern**
 *
 * 1.  **Non-Blocking API**: `LOGGER_INFO(...)` and friends format the message
 *     on the calling thread and push a command onto a queue.
 * 2.  **Worker Thread**: A single background thread is the sole consumer of
 *     the queue. It performs all I/O and owns the active sink.
 * 3.  **Sink Abstraction**: Console (stderr) and file destinations share one
 *     `Sink` interface inside logger.cpp.
 * 4.  **Shutdown**: `shutdown()` drains the queue and joins the worker, so every
 *     message queued before the call is written.
 *
 * **Usage**
 * ```cpp
 * #include "utils/logger.hpp"
 * LOGGER_INFO("placed '{}' at 0x{:X}", label, offset);
 *
 * Logger &logger = Logger::instance();
 * logger.set_logfile("/tmp/aiomerge.log");
 * logger.set_level(Logger::Level::L_DEBUG);
 * logger.shutdown();
 * ```
 ******************************************************************************/

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "aiomerge_export.h"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef AIOMERGE_LOGGER_FMT_BUFFER_RESERVE
#define AIOMERGE_LOGGER_FMT_BUFFER_RESERVE (512u)
#endif

namespace aiomerge::utils
{

struct LoggerImpl;

class AIOMERGE_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    // --- Sinks ---
    // Sink switches are commands; they take effect in queue order.

    /** @brief Switch logging to stderr. */
    void set_console();

    /**
     * @brief Switch logging to a file opened in append mode.
     * @return false if the file could not be opened (the current sink stays active
     *         and the write-error callback is notified).
     */
    bool set_logfile(const std::string &utf8_path);

    /**
     * @brief Drains the queue and stops the worker. Messages logged afterwards
     * go straight to stderr.
     */
    void shutdown();

    /** @brief Blocks until every message queued before the call has been written. */
    void flush();

    void set_level(Level lvl);
    [[nodiscard]] Level level() const;

    /**
     * @brief Sets a callback invoked (from a dispatcher thread) on sink errors.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    /** @brief Parses "trace|debug|info|warn|warning|error|system" (case-insensitive). */
    static std::optional<Level> level_from_string(std::string_view name);

    /** @brief Short upper-case name used in the log line, e.g. "WARN". */
    static const char *level_name(Level lvl) noexcept;

    // --- Formatting API ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

  private:
    Logger();

    std::unique_ptr<LoggerImpl> pImpl;

    void enqueue_log(Level lvl, std::string &&body) noexcept;
    bool should_log(Level lvl) const noexcept;
};

// --- Compile-Time Log Level ---
#ifndef AIOMERGE_LOGGER_COMPILE_LEVEL
#define AIOMERGE_LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= AIOMERGE_LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(AIOMERGE_LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::string(mb.data(), mb.size()));
        }
        catch (const std::exception &ex)
        {
            enqueue_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
    }
}

} // namespace aiomerge::utils

#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::aiomerge::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::aiomerge::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::aiomerge::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::aiomerge::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::aiomerge::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::aiomerge::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
