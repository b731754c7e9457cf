/**
 * @file log_slot.hpp
 * @brief Per-destination delivery state machine: filtering, batching, rate limiting and retry
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "log_types.hpp"
#include "log_entry.hpp"
#include "log_destination.hpp"
#include "log_admission.hpp"
#include "delivery_loop.hpp"

namespace relaylog
{

/**
 * @brief Predicate deciding whether a destination wants an entry
 */
using entry_filter = std::function<bool(const log_entry &)>;

/**
 * @brief Per-destination delivery options
 *
 * Every field is optional in the sense that its default disables the feature. A
 * default constructed slot_config delivers each entry immediately, unfiltered,
 * unlimited and without retry.
 *
 * @code
 * slot_config http_options;
 * http_options.min_level      = log_level::error;
 * http_options.batch_size     = 10;
 * http_options.flush_interval = std::chrono::milliseconds(5000);
 * http_options.max_retries    = 3;
 * http_options.retry_delay    = std::chrono::milliseconds(200);
 * @endcode
 */
struct slot_config
{
    /// @name Filtering
    /// @{
    std::optional<log_level> min_level; ///< Drop entries below this level (unset = keep all)
    entry_filter filter;                ///< Drop entries for which this returns false (empty = keep all)
    /// @}

    /// @name Batching
    /// @{
    size_t batch_size = DEFAULT_BATCH_SIZE;                     ///< Flush when the queue reaches N (0 or 1 = immediate)
    std::chrono::milliseconds flush_interval{DEFAULT_FLUSH_INTERVAL}; ///< Flush a partial batch after this delay (0 = never)
    size_t max_queue_size = DEFAULT_MAX_QUEUE_SIZE;             ///< Evict oldest above N queued entries (0 = unbounded)
    /// @}

    /// @name Rate limiting
    /// @{
    uint32_t rate_limit = DEFAULT_RATE_LIMIT; ///< Max admitted entries per second (0 = unlimited)
    /// @}

    /// @name Retry
    /// @{
    uint32_t max_retries = DEFAULT_MAX_RETRIES;                  ///< Extra attempts after a failed write
    std::chrono::milliseconds retry_delay{DEFAULT_RETRY_DELAY}; ///< Wait between attempts
    /// @}

    /**
     * @brief Reject values that cannot be honoured
     * @throws config_error on a negative flush_interval or retry_delay
     */
    void validate() const
    {
        if (flush_interval.count() < 0)
        {
            throw config_error(fmt::format("flush_interval cannot be negative: {}ms", flush_interval.count()));
        }
        if (retry_delay.count() < 0)
        {
            throw config_error(fmt::format("retry_delay cannot be negative: {}ms", retry_delay.count()));
        }
    }
};

/**
 * @brief A destination together with its delivery options
 */
struct destination_config
{
    std::shared_ptr<log_destination> destination;
    slot_config options;

    void validate() const
    {
        if (!destination) throw config_error("destination cannot be null");
        options.validate();
    }
};

/**
 * @brief Counters describing what a slot did with the entries it was offered
 */
struct slot_stats
{
    uint64_t offered         = 0; ///< enqueue() calls while alive
    uint64_t admitted        = 0; ///< Entries that entered the queue
    uint64_t dropped_level   = 0; ///< Rejected by min_level
    uint64_t dropped_filter  = 0; ///< Rejected by the filter predicate
    uint64_t dropped_rate    = 0; ///< Rejected by the rate limit
    uint64_t evicted         = 0; ///< Pushed out of a full queue
    uint64_t batches_written = 0; ///< Batches the destination accepted
    uint64_t entries_written = 0; ///< Entries in accepted batches
    uint64_t write_attempts  = 0; ///< write() calls including retries
    uint64_t write_failures  = 0; ///< Failed write() calls
    uint64_t batches_dropped = 0; ///< Batches discarded after exhausting retries
    uint64_t entries_dropped = 0; ///< Entries in discarded batches
    size_t queued            = 0; ///< Entries waiting for the next flush
    bool in_flight           = false;
    bool timer_pending       = false;
};

/**
 * @brief Delivery unit coordinating one destination
 *
 * Owns the destination's queue, lazy flush timer, rate window and in-flight guard.
 * Every member function must be called on the owning delivery loop's thread; the
 * dispatcher takes care of that.
 *
 * Guarantees:
 * - entries reach the destination in admission order, batches in formation order
 * - at most one write() is outstanding at any time
 * - a flush completion fires only after every entry queued before the flush call
 *   was accepted by the destination or dropped after its last retry
 * - nothing thrown or reported by the destination escapes the slot
 *
 * @warning A destination that never completes a write keeps the in-flight guard held
 *          and every later flush on this slot pending. There is no write timeout.
 */
class log_slot : public std::enable_shared_from_this<log_slot>
{
  public:
    using completion = std::function<void()>;

    log_slot(std::shared_ptr<delivery_loop> loop, std::shared_ptr<log_destination> destination, slot_config config = {});

    log_slot(const log_slot &)            = delete;
    log_slot &operator=(const log_slot &) = delete;

    /**
     * @brief Offer one entry: filter, rate limit, queue with eviction, then flush or arm the timer
     *
     * Never blocks and never throws. Ignored once the slot is destroyed.
     */
    void enqueue(const log_entry_ptr &entry);

    /**
     * @brief Deliver everything queued so far
     * @param done Called when the drain described above is complete (may be empty)
     */
    void flush(completion done = {});

    /**
     * @brief Retire the slot: cancel the timer, discard queued entries, refuse new ones
     *
     * An in-flight write is left to finish, including its retries; its outcome no longer
     * matters to anyone. Idempotent.
     */
    void destroy();

    bool destroyed() const noexcept { return destroyed_; }
    bool in_flight() const noexcept { return in_flight_; }
    size_t waiting_flushes() const noexcept { return waiting_flushes_.size(); }
    size_t queued() const noexcept { return queue_.size(); }

    const slot_config &config() const noexcept { return config_; }
    const std::shared_ptr<log_destination> &destination() const noexcept { return destination_; }

    slot_stats stats() const;

  private:
    bool admit(const log_entry &entry);
    void arm_timer();
    void cancel_timer();

    void start_write(std::shared_ptr<const log_batch> batch, completion done);
    void attempt_write(std::shared_ptr<const log_batch> batch, uint32_t attempt, completion done);
    void on_write_result(std::shared_ptr<const log_batch> batch, uint32_t attempt, bool ok, completion done);
    void finish_write(completion done);

    std::shared_ptr<delivery_loop> loop_;
    std::shared_ptr<log_destination> destination_;
    const slot_config config_;

    evicting_queue<log_entry_ptr> queue_;
    rate_window rate_;
    delivery_loop::timer_id timer_{delivery_loop::no_timer};

    // In-flight guard and the flush requests waiting behind it
    bool in_flight_{false};
    bool flush_requested_{false};
    std::vector<completion> waiting_flushes_;

    bool destroyed_{false};
    slot_stats stats_;
};

} // namespace relaylog

#include "log_slot_impl.hpp" // IWYU pragma: keep
