/**
 * @file log_logger.hpp
 * @brief Logging facade: level gate, console rendering and hand-off to the dispatcher
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdio>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "log_types.hpp"
#include "log_entry.hpp"
#include "log_config.hpp"
#include "log_dispatcher.hpp"
#include "log_formatters.hpp"
#include "log_writers.hpp"

namespace relaylog
{

class logger;

/**
 * @brief Receives one rendered console line
 *
 * The line passed in already ends with '\n'.
 */
using console_writer = std::function<void(std::string_view line)>;

/**
 * @brief Writes console lines to stdout
 */
inline console_writer make_stdout_writer()
{
    auto out = std::make_shared<file_writer>(STDOUT_FILENO);
    return [out](std::string_view line)
    {
        if (!out->write(line)) std::perror("relaylog: console write failed");
    };
}

/**
 * @brief Logger bound to a scope tag and optionally to child context
 */
class scoped_logger
{
  public:
    scoped_logger(logger &owner, std::string scope, std::optional<log_metadata> context = std::nullopt)
    : owner_(&owner),
      scope_(std::move(scope)),
      context_(std::move(context))
    {
    }

    void debug(std::string_view message, std::optional<log_metadata> meta = std::nullopt) const;
    void info(std::string_view message, std::optional<log_metadata> meta = std::nullopt) const;
    void warn(std::string_view message, std::optional<log_metadata> meta = std::nullopt) const;
    void error(std::string_view message, std::optional<log_metadata> meta = std::nullopt) const;

    const std::string &scope() const noexcept { return scope_; }

  private:
    logger *owner_;
    std::string scope_;
    std::optional<log_metadata> context_;
};

/**
 * @brief Logger carrying context metadata merged under every call's metadata
 *
 * Keys given at the call site win over context keys.
 */
class child_logger
{
  public:
    child_logger(logger &owner, log_metadata context)
    : owner_(&owner),
      context_(std::move(context))
    {
    }

    void debug(std::string_view message, std::optional<log_metadata> meta = std::nullopt) const;
    void info(std::string_view message, std::optional<log_metadata> meta = std::nullopt) const;
    void warn(std::string_view message, std::optional<log_metadata> meta = std::nullopt) const;
    void error(std::string_view message, std::optional<log_metadata> meta = std::nullopt) const;

    scoped_logger scope(std::string name) const { return scoped_logger(*owner_, std::move(name), context_); }

    const log_metadata &context() const noexcept { return context_; }

  private:
    logger *owner_;
    log_metadata context_;
};

/**
 * @brief Measures elapsed time and logs it at debug level
 *
 * end() logs "<label> completed in <N>ms" with N rounded to whole milliseconds.
 */
class timer_handle
{
  public:
    timer_handle(logger &owner, std::string label, std::optional<std::string> scope)
    : owner_(&owner),
      label_(std::move(label)),
      scope_(std::move(scope)),
      start_(std::chrono::steady_clock::now())
    {
    }

    void end(std::optional<log_metadata> meta = std::nullopt) const;

    std::chrono::milliseconds elapsed() const;

  private:
    logger *owner_;
    std::string label_;
    std::optional<std::string> scope_;
    std::chrono::steady_clock::time_point start_;
};

/**
 * @brief The logging facade
 *
 * Every call at or above the configured level builds one log_entry. The entry is
 * handed to the dispatcher when at least one destination is active, in every mode,
 * and is rendered on the console unless the mode is silent.
 *
 * The logger does not own the dispatcher; both are created by the application and
 * the dispatcher must outlive the logger.
 *
 * @code
 * log_dispatcher dispatcher;
 * logger log(dispatcher);
 *
 * log.info("server started", log_metadata{{"port", 8080}});
 * auto db = log.scope("db");
 * db.warn("slow query");
 *
 * auto timer = log.time("rebuild index");
 * rebuild();
 * timer.end();
 *
 * log.flush();
 * @endcode
 */
class logger
{
  public:
    /**
     * @param config Fields left unset keep the built-in defaults (info, pretty, DEFAULT_SERVICE_NAME)
     * @throws config_error if @p config is invalid
     */
    explicit logger(log_dispatcher &dispatcher, log_config config = log_config::from_env());

    logger(const logger &)            = delete;
    logger &operator=(const logger &) = delete;

    void debug(std::string_view message, std::optional<log_metadata> meta = std::nullopt);
    void info(std::string_view message, std::optional<log_metadata> meta = std::nullopt);
    void warn(std::string_view message, std::optional<log_metadata> meta = std::nullopt);
    void error(std::string_view message, std::optional<log_metadata> meta = std::nullopt);

    /**
     * @brief Log at @p level
     * @param scope Scope tag, if any
     * @param context Child context merged under @p meta, if any
     */
    void log(log_level level,
             std::string_view message,
             std::optional<log_metadata> meta   = std::nullopt,
             std::optional<std::string> scope   = std::nullopt,
             const log_metadata *context        = nullptr);

    scoped_logger scope(std::string name) { return scoped_logger(*this, std::move(name)); }
    child_logger child(log_metadata context) { return child_logger(*this, std::move(context)); }
    timer_handle time(std::string label, std::optional<std::string> scope = std::nullopt)
    {
        return timer_handle(*this, std::move(label), std::move(scope));
    }

    /**
     * @brief Apply a partial configuration
     *
     * The whole config is validated first; nothing changes when it is rejected.
     * Present destinations replace the current set without flushing it.
     *
     * @throws config_error if any field is invalid
     */
    void configure(log_config config);

    /// @throws config_error if the destination is null or the options are invalid
    void add_destination(std::shared_ptr<log_destination> destination, slot_config options = {});

    /// Block until every destination drained what was logged before the call
    void flush() { dispatcher_.flush(); }
    std::future<void> flush_async() { return dispatcher_.flush_all(); }

    /// Replace the console output (the default writes to stdout)
    void set_console_writer(console_writer writer);

    log_level level() const noexcept { return level_.load(std::memory_order_relaxed); }
    log_mode mode() const noexcept { return mode_.load(std::memory_order_relaxed); }
    std::string service_name() const;

    bool should_log(log_level level) const noexcept { return level >= this->level(); }

    log_dispatcher &dispatcher() noexcept { return dispatcher_; }

  private:
    static std::optional<log_metadata> merge_metadata(std::optional<log_metadata> meta, const log_metadata *context);
    void write_console(const log_entry &entry, log_mode mode);

    log_dispatcher &dispatcher_;

    std::atomic<log_level> level_{log_level::info};
    std::atomic<log_mode> mode_{log_mode::pretty};

    mutable std::mutex config_mutex_;
    std::string service_name_{DEFAULT_SERVICE_NAME};

    std::mutex console_mutex_;
    console_writer console_;

    pretty_formatter pretty_{.use_color = true, .add_newline = true};
    json_formatter json_{.pretty_print = false, .add_newline = true, .merge_metadata = true};
};

} // namespace relaylog

#include "log_logger_impl.hpp" // IWYU pragma: keep
