/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 ******************************************************************************/
#include "utils/logger.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <future>
#include <mutex>
#include <thread>
#include <type_traits>
#include <variant>
#include <vector>

#include "kbh_platform.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

using namespace kanbanhub::format_tools;

namespace kanbanhub::utils
{

namespace
{

LogMessage make_message(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = platform::get_pid(),
                      .thread_id = platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}

} // namespace

/**
 * @class CallbackDispatcher
 * @brief Executes user-provided error callbacks on a separate thread.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher() : shutdown_requested_(false)
    {
        worker_ = std::thread([this] { this->run(); });
    }

    ~CallbackDispatcher() { shutdown(); }

    void post(std::function<void()> fn)
    {
        if (shutdown_requested_.load(std::memory_order_relaxed))
            return;
        {
            std::lock_guard<std::mutex> lg(mutex_);
            queue_.push_back(std::move(fn));
        }
        cv_.notify_one();
    }

    void shutdown()
    {
        if (shutdown_requested_.exchange(true))
        {
            return;
        }
        cv_.notify_one();
        if (worker_.joinable())
        {
            worker_.join();
        }
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
                {
                    return;
                }
                fn = std::move(queue_.front());
                queue_.pop_front();
            }
            try
            {
                fn();
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[kanbanhub] logger error callback threw: {}\n", e.what());
            }
        }
    }

    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> shutdown_requested_;
};

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
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
    std::shared_ptr<std::promise<bool>> promise;
};

using Command = std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                             SetErrorCallbackCommand>;

template <typename T> void promise_set_safe(const std::shared_ptr<std::promise<T>> &p, T value)
{
    if (!p)
        return;
    try
    {
        p->set_value(std::move(value));
    }
    catch (const std::future_error &)
    {
        // Already satisfied; the waiter has its answer.
    }
}

struct Logger::Impl
{
    Impl();
    ~Impl();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    void reject_command(Command &cmd);
    void report_error(std::string message);
    void shutdown();

    std::function<void(const std::string &)> error_callback_;
    std::unique_ptr<Sink> sink_;
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    std::mutex shutdown_mutex_;
    CallbackDispatcher callback_dispatcher_;
    std::thread worker_thread_;
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_completed_{false};
};

Logger::Impl::Impl() : sink_(std::make_unique<ConsoleSink>())
{
    worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
}

Logger::Impl::~Impl()
{
    shutdown();
}

void Logger::Impl::reject_command(Command &cmd)
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
            reject_command(cmd);
            return false;
        }
        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

// Called on the worker thread only.
void Logger::Impl::report_error(std::string message)
{
    if (error_callback_)
    {
        auto cb = error_callback_;
        callback_dispatcher_.post([cb, msg = std::move(message)]() { cb(msg); });
    }
    else
    {
        fmt::print(stderr, "[kanbanhub] logger error: {}\n", message);
    }
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool stopping = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);
            // The queue is closed to producers once shutdown is requested, so this batch
            // is the last one.
            stopping = shutdown_requested_.load();
        }

        for (auto &cmd : local_queue)
        {
            try
            {
                // Fast path: LogMessage
                if (auto *msg = std::get_if<LogMessage>(&cmd))
                {
                    if (msg->level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
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
                            std::string old_desc = sink_->description();
                            sink_->write(make_message(
                                Logger::Level::L_SYSTEM,
                                make_buffer("Switching log sink to: {}", arg.new_sink->description())));
                            sink_->flush();
                            sink_ = std::move(arg.new_sink);
                            sink_->write(make_message(Logger::Level::L_SYSTEM,
                                                      make_buffer("Log sink switched from: {}", old_desc)));
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                        {
                            report_error(arg.error_message);
                            promise_set_safe(arg.promise, false);
                        }
                        else if constexpr (std::is_same_v<T, FlushCommand>)
                        {
                            sink_->flush();
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                        {
                            error_callback_ = std::move(arg.callback);
                            promise_set_safe(arg.promise, true);
                        }
                    },
                    cmd);
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
                reject_command(cmd);
            }
        }
        local_queue.clear();

        if (stopping)
        {
            try
            {
                sink_->write(make_message(Logger::Level::L_SYSTEM, make_buffer("Logger is shutting down.")));
                sink_->flush();
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[kanbanhub] logger error during shutdown: {}\n", e.what());
            }
            break;
        }
    }
}

void Logger::Impl::shutdown()
{
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    if (shutdown_completed_.load())
    {
        return;
    }
    {
        std::lock_guard<std::mutex> qlock(queue_mutex_);
        shutdown_requested_.store(true, std::memory_order_release);
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    callback_dispatcher_.shutdown();
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

std::optional<Logger::Level> Logger::parse_level(std::string_view name)
{
    const auto lowered = to_lower(name);
    if (lowered == "trace")
        return Level::L_TRACE;
    if (lowered == "debug")
        return Level::L_DEBUG;
    if (lowered == "info")
        return Level::L_INFO;
    if (lowered == "warn" || lowered == "warning")
        return Level::L_WARNING;
    if (lowered == "error")
        return Level::L_ERROR;
    if (lowered == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

bool Logger::set_console()
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>(), promise});
    return future.get();
}

bool Logger::set_logfile(const std::string &utf8_path)
{
    try
    {
        auto promise = std::make_shared<std::promise<bool>>();
        auto future = promise->get_future();
        pImpl->enqueue_command(SetSinkCommand{std::make_unique<FileSink>(utf8_path), promise});
        return future.get();
    }
    catch (const std::system_error &e)
    {
        auto promise_err = std::make_shared<std::promise<bool>>();
        auto future_err = promise_err->get_future();
        pImpl->enqueue_command(SinkCreationErrorCommand{
            fmt::format("Failed to create FileSink: {}", e.what()), promise_err});
        (void)future_err.get();
    }
    return false;
}

void Logger::flush()
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    // Rejected commands resolve their promise immediately, so this cannot hang after
    // shutdown.
    pImpl->enqueue_command(FlushCommand{promise});
    (void)future.get();
}

void Logger::shutdown()
{
    pImpl->shutdown();
}

bool Logger::is_running() const noexcept
{
    return !pImpl->shutdown_requested_.load(std::memory_order_acquire);
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
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb), promise});
    (void)future.get();
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

void Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    Command cmd{make_message(lvl, std::move(body))};
    // enqueue_command only moves from a command it accepts.
    if (pImpl->enqueue_command(std::move(cmd)))
    {
        return;
    }
    // Shut down: write synchronously so late messages are not lost.
    try
    {
        fmt::print(stderr, "{}", Sink::render(std::get<LogMessage>(cmd)));
    }
    catch (const std::exception &)
    {
        // stderr itself failed; there is nowhere left to report to.
    }
}

} // namespace kanbanhub::utils
