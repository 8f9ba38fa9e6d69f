/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 ******************************************************************************/

#include <condition_variable>
#include <cstdio>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include "bmc_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"

#include "utils/logger_sinks.hpp"

using namespace bmapcopy::format_tools;

namespace bmapcopy::utils
{

// Represents the lifecycle state of the logger.
enum class LoggerState
{
    Uninitialized,
    Initialized,
    ShuttingDown,
    Shutdown
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

// Centralized check for configuration calls.
static bool logger_is_loggable(const char *function_name)
{
    const auto state = g_logger_state.load(std::memory_order_acquire);
    if (state == LoggerState::Uninitialized)
    {
        BMC_PANIC("Logger method '{}' was called before the Logger module was "
                  "initialized via LifecycleManager. Aborting.",
                  function_name);
    }
    return state == LoggerState::Initialized;
}

// Command Definitions
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
    std::shared_ptr<std::promise<bool>> promise;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
using Command = std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand>;

// --- Promise Helper ---
template <typename T> void promise_set_safe(const std::shared_ptr<std::promise<T>> &p, T value)
{
    if (!p)
        return;
    try
    {
        p->set_value(std::move(value));
    }
    catch (const std::future_error &e)
    {
        // Already satisfied: the waiter has its answer.
        BMC_DEBUG("Logger promise already satisfied: {}", e.what());
    }
}

// Logger Pimpl and Implementation
struct Logger::Impl
{
    Impl();
    ~Impl();
    void start_worker();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    void reject_command_due_to_shutdown(Command &cmd);
    void write_system_line(Logger::Level lvl, fmt::memory_buffer &&body);
    void report_error(const std::string &msg);
    void shutdown();

    std::thread worker_thread_;
    std::unique_ptr<Sink> sink_;
    size_t m_max_queue_size{10000};
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    std::mutex m_sink_mutex;
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_completed_{false};
    std::atomic<size_t> m_messages_dropped{0};
};

Logger::Impl::Impl() : sink_(std::make_unique<ConsoleSink>()) {}

Logger::Impl::~Impl()
{
    if (worker_thread_.joinable())
    {
        // Reached only when the lifecycle module was never shut down.
        BMC_DEBUG("**HIGH ALERT: Logger Impl destructor called without prior shutdown. Check "
                  "LifeCycle management.**");
        shutdown();
    }
}

void Logger::Impl::start_worker()
{
    if (!worker_thread_.joinable())
    {
        worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
    }
}

void Logger::Impl::reject_command_due_to_shutdown(Command &cmd)
{
    std::visit(
        [](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (!std::is_same_v<T, LogMessage>)
            {
                promise_set_safe(arg.promise, false);
            }
        },
        cmd);
}

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load(std::memory_order_acquire))
        {
            reject_command_due_to_shutdown(cmd);
            return false;
        }

        // Control commands are never dropped; log lines are dropped past the soft limit.
        if (queue_.size() >= m_max_queue_size && std::holds_alternative<LogMessage>(cmd))
        {
            m_messages_dropped.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

void Logger::Impl::write_system_line(Logger::Level lvl, fmt::memory_buffer &&body)
{
    // Caller holds m_sink_mutex.
    if (sink_)
    {
        sink_->write(LogMessage{.timestamp = std::chrono::system_clock::now(),
                                .process_id = bmapcopy::platform::get_pid(),
                                .thread_id = bmapcopy::platform::get_native_thread_id(),
                                .level = static_cast<int>(lvl),
                                .body = std::move(body)});
    }
}

// Sink failures cannot go through the sink; they go straight to stderr.
void Logger::Impl::report_error(const std::string &msg)
{
    fmt::print(stderr, "[LOGGER] error: {}\n", msg);
    std::fflush(stderr);
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);
        }

        for (auto &cmd : local_queue)
        {
            try
            {
                // Fast path: LogMessage
                if (auto *msg = std::get_if<LogMessage>(&cmd))
                {
                    std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                    if (sink_ &&
                        msg->level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                    {
                        sink_->write(*msg);
                    }
                    continue;
                }

                std::visit(
                    [this](auto &&arg)
                    {
                        using T = std::decay_t<decltype(arg)>;

                        if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                            std::string old_desc = sink_ ? sink_->description() : "null";
                            std::string new_desc =
                                arg.new_sink ? arg.new_sink->description() : "null";
                            if (sink_)
                            {
                                write_system_line(Logger::Level::L_SYSTEM,
                                                  make_buffer("Switching log sink to: {}",
                                                              new_desc));
                                sink_->flush();
                            }
                            sink_ = std::move(arg.new_sink);
                            write_system_line(Logger::Level::L_SYSTEM,
                                              make_buffer("Log sink switched from: {}", old_desc));
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                        {
                            report_error(arg.error_message);
                            promise_set_safe(arg.promise, false);
                        }
                        else if constexpr (std::is_same_v<T, FlushCommand>)
                        {
                            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                            if (sink_)
                            {
                                sink_->flush();
                            }
                            promise_set_safe(arg.promise, true);
                        }
                    },
                    cmd);
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
                reject_command_due_to_shutdown(cmd);
            }
        }
        local_queue.clear();

        const size_t dropped = m_messages_dropped.exchange(0, std::memory_order_relaxed);
        if (dropped > 0)
        {
            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            try
            {
                write_system_line(Logger::Level::L_WARNING,
                                  make_buffer("Logger queue full: dropped {} messages.", dropped));
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
            }
        }

        if (shutdown_requested_.load())
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (!queue_.empty())
            {
                continue; // Drain what arrived while this batch was written.
            }
            lock.unlock();

            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            try
            {
                write_system_line(Logger::Level::L_SYSTEM, make_buffer("Logger is shutting down."));
                if (sink_)
                {
                    sink_->flush();
                }
            }
            catch (const std::exception &e)
            {
                BMC_DEBUG("Logger final flush failed: {}", e.what());
            }
            g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
            break;
        }
    }
}

void Logger::Impl::shutdown()
{
    if (shutdown_completed_.load())
    {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.exchange(true))
        {
            return;
        }
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    shutdown_completed_.store(true);
}

// Logger Public API Implementation
Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::lifecycle_initialized() noexcept
{
    return g_logger_state.load(std::memory_order_acquire) != LoggerState::Uninitialized;
}

bool Logger::set_console()
{
    if (!logger_is_loggable("Logger::set_console"))
        return false;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    if (!pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>(), promise}))
        return false;
    return future.get();
}

bool Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
    if (!logger_is_loggable("Logger::set_logfile"))
        return false;
    try
    {
        auto promise = std::make_shared<std::promise<bool>>();
        auto future = promise->get_future();
        if (!pImpl->enqueue_command(
                SetSinkCommand{std::make_unique<FileSink>(utf8_path, use_flock), promise}))
            return false;
        return future.get();
    }
    catch (const std::exception &e)
    {
        auto promise_err = std::make_shared<std::promise<bool>>();
        auto future_err = promise_err->get_future();
        if (pImpl->enqueue_command(SinkCreationErrorCommand{
                fmt::format("Failed to create FileSink: {}", e.what()), promise_err}))
        {
            (void)future_err.get();
        }
    }
    return false;
}

void Logger::shutdown()
{
    if (!lifecycle_initialized())
    {
        return;
    }
    if (pImpl)
        pImpl->shutdown();
}

void Logger::flush()
{
    if (!logger_is_loggable("Logger::flush"))
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    if (pImpl->enqueue_command(FlushCommand{promise}))
    {
        (void)future.get();
    }
}

void Logger::set_level(Level lvl)
{
    if (!logger_is_loggable("Logger::set_level"))
        return;
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    if (!logger_is_loggable("Logger::level"))
        return Level::L_INFO;
    return pImpl->level_.load(std::memory_order_relaxed);
}

std::optional<Logger::Level> Logger::parse_level(std::string_view name) noexcept
{
    if (name == "trace")
        return Level::L_TRACE;
    if (name == "debug")
        return Level::L_DEBUG;
    if (name == "info")
        return Level::L_INFO;
    if (name == "warn" || name == "warning")
        return Level::L_WARNING;
    if (name == "error")
        return Level::L_ERROR;
    if (name == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

bool Logger::should_log(Level lvl) const noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

bool Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    try
    {
        return pImpl->enqueue_command(LogMessage{.timestamp = std::chrono::system_clock::now(),
                                                 .process_id = bmapcopy::platform::get_pid(),
                                                 .thread_id =
                                                     bmapcopy::platform::get_native_thread_id(),
                                                 .level = static_cast<int>(lvl),
                                                 .body = std::move(body)});
    }
    catch (const std::exception &e)
    {
        BMC_DEBUG("Logger failed to enqueue a message: {}", e.what());
        return false;
    }
}

bool Logger::enqueue_log(Level lvl, std::string &&body_str) noexcept
{
    try
    {
        return enqueue_log(lvl, make_buffer("{}", body_str));
    }
    catch (const std::exception &e)
    {
        BMC_DEBUG("Logger failed to enqueue a message: {}", e.what());
        return false;
    }
}

// C-style callbacks for the lifecycle API.
void do_logger_startup(const char *arg)
{
    (void)arg;
    Logger::instance().pImpl->start_worker();
    g_logger_state.store(LoggerState::Initialized, std::memory_order_release);
}

void do_logger_shutdown(const char *arg)
{
    (void)arg;
    LoggerState expected = LoggerState::Initialized;
    // Only the thread that moves Initialized -> ShuttingDown performs the shutdown.
    if (g_logger_state.compare_exchange_strong(expected, LoggerState::ShuttingDown,
                                               std::memory_order_acq_rel))
    {
        Logger::instance().shutdown();
        g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
    }
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("bmapcopy::utils::Logger");
    module.set_startup(&do_logger_startup);
    module.set_shutdown(&do_logger_shutdown, std::chrono::milliseconds(5000));
    return module;
}

} // namespace bmapcopy::utils
