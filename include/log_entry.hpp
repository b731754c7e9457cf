/**
 * @file log_entry.hpp
 * @brief Immutable log record and batch types carried through the delivery pipeline
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <chrono>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/chrono.h>
#include <tao/json/value.hpp>

#include "log_types.hpp"

namespace relaylog
{

/**
 * @brief Structured metadata attached to an entry
 *
 * Always a JSON object when present. Keys are caller supplied and may collide with
 * reserved record fields; that collision is resolved by the formatters, never here.
 */
using log_metadata = tao::json::value;

/**
 * @brief One log record
 *
 * Built once by the facade and never mutated afterwards. Slots receive it through
 * log_entry_ptr so a single record is shared read-only by every destination.
 */
struct log_entry
{
    log_level level = log_level::info;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::string service;
    std::optional<std::string> scope;
    std::optional<log_metadata> metadata;
};

using log_entry_ptr = std::shared_ptr<const log_entry>;

inline log_entry_ptr make_log_entry(log_level level,
                                    std::string message,
                                    std::string service,
                                    std::optional<std::string> scope     = std::nullopt,
                                    std::optional<log_metadata> metadata = std::nullopt)
{
    auto entry       = std::make_shared<log_entry>();
    entry->level     = level;
    entry->message   = std::move(message);
    entry->timestamp = std::chrono::system_clock::now();
    entry->service   = std::move(service);
    entry->scope     = std::move(scope);
    entry->metadata  = std::move(metadata);
    return entry;
}

/**
 * @brief Format a timestamp as ISO-8601 UTC with millisecond precision
 *
 * Produces e.g. "2025-01-31T12:00:00.123Z".
 */
inline std::string format_timestamp(std::chrono::system_clock::time_point tp)
{
    auto secs   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
    if (millis < 0)
    {
        secs -= std::chrono::seconds(1);
        millis += 1000;
    }
    std::time_t tt = std::chrono::system_clock::to_time_t(secs);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", fmt::gmtime(tt), static_cast<int>(millis));
}

/**
 * @brief One or more entries delivered together in a single write call
 *
 * Destinations always receive this type. A batch holding exactly one entry is the
 * unbatched case; is_single() lets a destination keep the simple path for it.
 * Entries are in admission order.
 */
class log_batch
{
  public:
    using container      = std::vector<log_entry_ptr>;
    using const_iterator = container::const_iterator;

    log_batch() = default;
    explicit log_batch(container entries) : entries_(std::move(entries)) {}

    size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }
    bool is_single() const noexcept { return entries_.size() == 1; }

    const log_entry &front() const { return *entries_.front(); }
    const log_entry &operator[](size_t index) const { return *entries_[index]; }

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    const container &entries() const noexcept { return entries_; }

  private:
    container entries_;
};

} // namespace relaylog
