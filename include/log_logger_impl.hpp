/**
 * @file log_logger_impl.hpp
 * @brief Implementation of the logging facade
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cmath>

#include "log_logger.hpp"

namespace relaylog
{

inline logger::logger(log_dispatcher &dispatcher, log_config config)
: dispatcher_(dispatcher),
  console_(make_stdout_writer())
{
    configure(std::move(config));
}

inline void logger::debug(std::string_view message, std::optional<log_metadata> meta)
{
    log(log_level::debug, message, std::move(meta));
}

inline void logger::info(std::string_view message, std::optional<log_metadata> meta)
{
    log(log_level::info, message, std::move(meta));
}

inline void logger::warn(std::string_view message, std::optional<log_metadata> meta)
{
    log(log_level::warn, message, std::move(meta));
}

inline void logger::error(std::string_view message, std::optional<log_metadata> meta)
{
    log(log_level::error, message, std::move(meta));
}

inline void logger::log(log_level level,
                        std::string_view message,
                        std::optional<log_metadata> meta,
                        std::optional<std::string> scope,
                        const log_metadata *context)
{
    if (!should_log(level)) return;

    auto entry = make_log_entry(level,
                                std::string(message),
                                service_name(),
                                std::move(scope),
                                merge_metadata(std::move(meta), context));

    // Destinations see every accepted entry, even in silent mode
    if (!dispatcher_.empty()) dispatcher_.dispatch(entry);

    const log_mode mode = this->mode();
    if (mode == log_mode::silent) return;

    write_console(*entry, mode);
}

inline std::optional<log_metadata> logger::merge_metadata(std::optional<log_metadata> meta, const log_metadata *context)
{
    if (!context) return meta;
    if (!meta) return *context;

    // Call site keys win over context keys
    if (!meta->is_object() || !context->is_object()) return meta;

    log_metadata merged = *context;
    for (auto &[key, value] : meta->get_object()) merged.get_object()[key] = std::move(value);
    return merged;
}

inline void logger::write_console(const log_entry &entry, log_mode mode)
{
    std::string line;
    if (mode == log_mode::json) json_.format_to(line, entry);
    else pretty_.format_to(line, entry);

    std::lock_guard lock(console_mutex_);
    if (console_) console_(line);
}

inline void logger::configure(log_config config)
{
    config.validate();

    if (config.level) level_.store(*config.level, std::memory_order_relaxed);
    if (config.mode) mode_.store(*config.mode, std::memory_order_relaxed);
    if (config.service_name)
    {
        std::lock_guard lock(config_mutex_);
        service_name_ = std::move(*config.service_name);
    }
    if (config.destinations) dispatcher_.reconfigure(std::move(*config.destinations));
}

inline void logger::add_destination(std::shared_ptr<log_destination> destination, slot_config options)
{
    dispatcher_.add(std::move(destination), std::move(options));
}

inline void logger::set_console_writer(console_writer writer)
{
    std::lock_guard lock(console_mutex_);
    console_ = std::move(writer);
}

inline std::string logger::service_name() const
{
    std::lock_guard lock(config_mutex_);
    return service_name_;
}

// Scoped and child loggers forward to the owner

inline void scoped_logger::debug(std::string_view message, std::optional<log_metadata> meta) const
{
    owner_->log(log_level::debug, message, std::move(meta), scope_, context_ ? &*context_ : nullptr);
}

inline void scoped_logger::info(std::string_view message, std::optional<log_metadata> meta) const
{
    owner_->log(log_level::info, message, std::move(meta), scope_, context_ ? &*context_ : nullptr);
}

inline void scoped_logger::warn(std::string_view message, std::optional<log_metadata> meta) const
{
    owner_->log(log_level::warn, message, std::move(meta), scope_, context_ ? &*context_ : nullptr);
}

inline void scoped_logger::error(std::string_view message, std::optional<log_metadata> meta) const
{
    owner_->log(log_level::error, message, std::move(meta), scope_, context_ ? &*context_ : nullptr);
}

inline void child_logger::debug(std::string_view message, std::optional<log_metadata> meta) const
{
    owner_->log(log_level::debug, message, std::move(meta), std::nullopt, &context_);
}

inline void child_logger::info(std::string_view message, std::optional<log_metadata> meta) const
{
    owner_->log(log_level::info, message, std::move(meta), std::nullopt, &context_);
}

inline void child_logger::warn(std::string_view message, std::optional<log_metadata> meta) const
{
    owner_->log(log_level::warn, message, std::move(meta), std::nullopt, &context_);
}

inline void child_logger::error(std::string_view message, std::optional<log_metadata> meta) const
{
    owner_->log(log_level::error, message, std::move(meta), std::nullopt, &context_);
}

inline std::chrono::milliseconds timer_handle::elapsed() const
{
    std::chrono::duration<double, std::milli> ms = std::chrono::steady_clock::now() - start_;
    return std::chrono::milliseconds(std::llround(ms.count()));
}

inline void timer_handle::end(std::optional<log_metadata> meta) const
{
    owner_->log(log_level::debug, fmt::format("{} completed in {}ms", label_, elapsed().count()), std::move(meta), scope_);
}

} // namespace relaylog
