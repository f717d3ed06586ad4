/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 *
 * @see include/utils/logger.hpp
 *
 * 1.  **Command Processing**: `Command` is a `std::variant` of a log message,
 *     a sink switch, a sink-creation error, a flush request and a callback
 *     change. Public API calls are producers that push commands.
 *
 * 2.  **Worker Thread (`worker_loop`)**: sleeps on a condition variable, swaps
 *     the whole queue into a local vector under the lock and processes the
 *     batch with the lock released.
 *
 * 3.  **Sinks**: polymorphic `Sink` objects owned by the worker. Sink creation
 *     happens on the calling thread; a failure becomes a
 *     `SinkCreationErrorCommand` that triggers the error callback.
 *
 * 4.  **Error Callback (`CallbackDispatcher`)**: user callbacks run on a
 *     separate thread so a callback that logs cannot deadlock the worker.
 ******************************************************************************/

#include "utils/logger.hpp"
#include "utils/format_tools.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <deque>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include <fcntl.h>
#include <unistd.h>
#if defined(__linux__)
#include <sys/syscall.h>
#endif

namespace aiomerge::utils
{

/**
 * @class CallbackDispatcher
 * @brief Runs user error callbacks on a dedicated thread.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher() : shutdown_requested_(false)
    {
        worker_ = std::thread([this] { this->run(); });
    }

    ~CallbackDispatcher() { shutdown(); }

    CallbackDispatcher(const CallbackDispatcher &) = delete;
    CallbackDispatcher &operator=(const CallbackDispatcher &) = delete;

    void post(std::function<void()> fn)
    {
        {
            std::lock_guard<std::mutex> lg(mutex_);
            if (shutdown_requested_.load(std::memory_order_relaxed))
                return;
            queue_.push_back(std::move(fn));
        }
        cv_.notify_one();
    }

    void shutdown()
    {
        {
            std::lock_guard<std::mutex> lg(mutex_);
            if (shutdown_requested_.exchange(true))
                return;
        }
        cv_.notify_one();
        if (worker_.joinable())
            worker_.join();
    }

  private:
    void run()
    {
        for (;;)
        {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> ul(mutex_);
                cv_.wait(ul, [this] { return shutdown_requested_.load() || !queue_.empty(); });
                if (shutdown_requested_.load() && queue_.empty())
                    return;
                fn = std::move(queue_.front());
                queue_.pop_front();
            }
            try
            {
                fn();
            }
            catch (const std::exception &e)
            {
                std::fprintf(stderr, "[aiomerge::Logger] error callback threw: %s\n", e.what());
            }
        }
    }

    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> shutdown_requested_;
};

// ============================================================================
// Internal Command and Sink Definitions
// ============================================================================

struct LogMessage
{
    Logger::Level level;
    std::chrono::system_clock::time_point timestamp;
    uint64_t thread_id;
    std::string body;
};

/**
 * @class Sink
 * @brief Abstract log destination. Only ever called from the worker thread.
 */
class Sink
{
  public:
    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;
};

static uint64_t get_native_thread_id() noexcept
{
#if defined(__linux__)
    return static_cast<uint64_t>(::syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

static std::string format_message(const LogMessage &msg)
{
    std::string time_str = format_tools::formatted_time(msg.timestamp);
    return fmt::format("[{}] [{:<6}] [{:5}] {}\n", time_str, Logger::level_name(msg.level),
                       msg.thread_id, msg.body);
}

/** @brief Writes to stderr. */
class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg) override { fmt::print(stderr, "{}", format_message(msg)); }
    void flush() override { std::fflush(stderr); }
    std::string description() const override { return "Console"; }
};

/** @brief Appends to a file through a raw POSIX descriptor. */
class FileSink : public Sink
{
  public:
    explicit FileSink(const std::string &path) : path_(path)
    {
        fd_ = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ == -1)
        {
            throw std::runtime_error(
                fmt::format("Failed to open log file '{}': {}", path, std::strerror(errno)));
        }
    }

    ~FileSink() override
    {
        if (fd_ != -1)
            ::close(fd_);
    }

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override
    {
        const std::string line = format_message(msg);
        const char *p = line.data();
        size_t left = line.size();
        while (left > 0)
        {
            const ssize_t n = ::write(fd_, p, left);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                throw std::runtime_error(
                    fmt::format("write to '{}' failed: {}", path_, std::strerror(errno)));
            }
            p += n;
            left -= static_cast<size_t>(n);
        }
    }

    void flush() override
    {
        if (::fsync(fd_) != 0 && errno != EINVAL)
        {
            throw std::runtime_error(
                fmt::format("fsync of '{}' failed: {}", path_, std::strerror(errno)));
        }
    }

    std::string description() const override { return "File: " + path_; }

  private:
    std::string path_;
    int fd_ = -1;
};

// --- Command Definitions ---
struct SetSinkCommand { std::unique_ptr<Sink> new_sink; };
struct SinkCreationErrorCommand { std::string error_message; };
struct FlushCommand { std::shared_ptr<std::promise<void>> promise; };
struct SetErrorCallbackCommand { std::function<void(const std::string &)> callback; };

using Command = std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                             SetErrorCallbackCommand>;

// ============================================================================
// Logger Pimpl
// ============================================================================

struct LoggerImpl
{
    LoggerImpl();
    ~LoggerImpl();

    void worker_loop();
    void enqueue_command(Command &&cmd);
    void shutdown();
    void report_error(const std::string &message);

    std::thread worker_thread_;
    std::vector<Command> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_completed_{false};

    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};

    // Worker-thread state.
    std::unique_ptr<Sink> sink_;
    std::function<void(const std::string &)> error_callback_;
    CallbackDispatcher callback_dispatcher_;
};

LoggerImpl::LoggerImpl() : sink_(std::make_unique<ConsoleSink>())
{
    worker_thread_ = std::thread(&LoggerImpl::worker_loop, this);
}

LoggerImpl::~LoggerImpl()
{
    // Without an explicit shutdown the worker is still running; drain it here so
    // the thread is joined before its state is destroyed.
    shutdown();
}

void LoggerImpl::report_error(const std::string &message)
{
    if (error_callback_)
    {
        auto cb = error_callback_;
        callback_dispatcher_.post([cb, message]() { cb(message); });
    }
    else
    {
        std::fprintf(stderr, "[aiomerge::Logger] %s\n", message.c_str());
    }
}

void LoggerImpl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!shutdown_requested_.load(std::memory_order_acquire))
        {
            queue_.emplace_back(std::move(cmd));
            cv_.notify_one();
            return;
        }
    }
    // Worker is gone: print log messages directly so nothing is silently lost.
    if (std::holds_alternative<LogMessage>(cmd))
    {
        fmt::print(stderr, "[aiomerge::Logger-fallback] {}", format_message(std::get<LogMessage>(cmd)));
    }
    else if (std::holds_alternative<FlushCommand>(cmd))
    {
        std::get<FlushCommand>(cmd).promise->set_value();
    }
}

void LoggerImpl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool final_pass = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            final_pass = shutdown_requested_.load();
            local_queue.swap(queue_);
        }

        for (auto &cmd : local_queue)
        {
            try
            {
                std::visit(
                    [this](auto &&arg) {
                        using T = std::decay_t<decltype(arg)>;
                        if constexpr (std::is_same_v<T, LogMessage>)
                        {
                            if (sink_ && arg.level >= level_.load(std::memory_order_relaxed))
                                sink_->write(arg);
                        }
                        else if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            const std::string old_desc = sink_ ? sink_->description() : "null";
                            if (sink_)
                                sink_->flush();
                            sink_ = std::move(arg.new_sink);
                            if (sink_)
                            {
                                sink_->write({Logger::Level::L_SYSTEM,
                                              std::chrono::system_clock::now(),
                                              get_native_thread_id(),
                                              "Log sink switched from: " + old_desc});
                            }
                        }
                        else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                        {
                            report_error(arg.error_message);
                        }
                        else if constexpr (std::is_same_v<T, FlushCommand>)
                        {
                            if (sink_)
                                sink_->flush();
                            arg.promise->set_value();
                        }
                        else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                        {
                            error_callback_ = std::move(arg.callback);
                        }
                    },
                    cmd);
            }
            catch (const std::exception &e)
            {
                if (auto *flush = std::get_if<FlushCommand>(&cmd))
                    flush->promise->set_value();
                report_error(fmt::format("Logger worker error: {}", e.what()));
            }
        }
        local_queue.clear();

        if (final_pass)
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (queue_.empty())
                break;
        }
    }

    if (sink_)
    {
        try
        {
            sink_->flush();
        }
        catch (const std::exception &e)
        {
            report_error(fmt::format("Logger final flush failed: {}", e.what()));
        }
    }
}

void LoggerImpl::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_completed_.load() || shutdown_requested_.exchange(true))
            return;
    }

    cv_.notify_one();
    if (worker_thread_.joinable())
        worker_thread_.join();

    callback_dispatcher_.shutdown();
    shutdown_completed_.store(true);
}

// ============================================================================
// Logger Public API
// ============================================================================

Logger::Logger() : pImpl(std::make_unique<LoggerImpl>()) {}

Logger::~Logger() = default;

Logger &Logger::instance()
{
    // Function-local static: thread-safe initialization, destroyed after main returns.
    static Logger instance;
    return instance;
}

void Logger::set_console()
{
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>()});
}

bool Logger::set_logfile(const std::string &utf8_path)
{
    try
    {
        pImpl->enqueue_command(SetSinkCommand{std::make_unique<FileSink>(utf8_path)});
        return true;
    }
    catch (const std::exception &e)
    {
        pImpl->enqueue_command(
            SinkCreationErrorCommand{fmt::format("Failed to create FileSink: {}", e.what())});
        return false;
    }
}

void Logger::shutdown()
{
    pImpl->shutdown();
}

void Logger::flush()
{
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    future.wait();
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb)});
}

std::optional<Logger::Level> Logger::level_from_string(std::string_view name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return Level::L_TRACE;
    if (lower == "debug") return Level::L_DEBUG;
    if (lower == "info") return Level::L_INFO;
    if (lower == "warn" || lower == "warning") return Level::L_WARNING;
    if (lower == "error") return Level::L_ERROR;
    if (lower == "system") return Level::L_SYSTEM;
    return std::nullopt;
}

const char *Logger::level_name(Level lvl) noexcept
{
    switch (lvl)
    {
    case Level::L_TRACE: return "TRACE";
    case Level::L_DEBUG: return "DEBUG";
    case Level::L_INFO: return "INFO";
    case Level::L_WARNING: return "WARN";
    case Level::L_ERROR: return "ERROR";
    case Level::L_SYSTEM: return "SYSTEM";
    default: return "UNK";
    }
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

void Logger::enqueue_log(Level lvl, std::string &&body) noexcept
{
    try
    {
        pImpl->enqueue_command(
            LogMessage{lvl, std::chrono::system_clock::now(), get_native_thread_id(), std::move(body)});
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[aiomerge::Logger] dropped message: %s\n", e.what());
    }
}

} // namespace aiomerge::utils
