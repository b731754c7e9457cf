/**
 * @file log_slot_impl.hpp
 * @brief Implementation of the per-destination delivery state machine
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <atomic>
#include <utility>

#include "log_slot.hpp"

namespace relaylog
{

inline log_slot::log_slot(std::shared_ptr<delivery_loop> loop,
                          std::shared_ptr<log_destination> destination,
                          slot_config config)
: loop_(std::move(loop)),
  destination_(std::move(destination)),
  config_(std::move(config)),
  queue_(config_.max_queue_size),
  rate_(config_.rate_limit)
{
}

inline void log_slot::enqueue(const log_entry_ptr &entry)
{
    if (destroyed_ || !entry) return;

    ++stats_.offered;
    if (!admit(*entry)) return;

    ++stats_.admitted;
    stats_.evicted += queue_.push(entry);

    if (config_.batch_size <= 1 || queue_.size() >= config_.batch_size)
    {
        flush();
    }
    else
    {
        arm_timer();
    }
}

inline bool log_slot::admit(const log_entry &entry)
{
    if (config_.min_level && entry.level < *config_.min_level)
    {
        ++stats_.dropped_level;
        return false;
    }

    if (config_.filter)
    {
        bool keep = false;
        try
        {
            keep = config_.filter(entry);
        }
        catch (...)
        {
            // A predicate that cannot decide rejects the entry
            keep = false;
        }
        if (!keep)
        {
            ++stats_.dropped_filter;
            return false;
        }
    }

    // Rate limited entries never occupy queue space and are not retried
    if (!rate_.try_acquire(delivery_loop::now()))
    {
        ++stats_.dropped_rate;
        return false;
    }

    return true;
}

inline void log_slot::flush(completion done)
{
    if (in_flight_)
    {
        // Re-evaluate once the current write is over; the queue may have grown by then.
        // Requests nobody waits on collapse into one.
        if (done) waiting_flushes_.push_back(std::move(done));
        else flush_requested_ = true;
        return;
    }

    if (queue_.empty())
    {
        if (done) done();
        return;
    }

    // A flush happening now supersedes the scheduled one
    cancel_timer();

    auto batch = std::make_shared<const log_batch>(queue_.take_all());
    start_write(std::move(batch), std::move(done));
}

inline void log_slot::destroy()
{
    if (destroyed_) return;

    destroyed_ = true;
    cancel_timer();
    queue_.clear();
}

inline slot_stats log_slot::stats() const
{
    slot_stats s    = stats_;
    s.queued        = queue_.size();
    s.in_flight     = in_flight_;
    s.timer_pending = timer_ != delivery_loop::no_timer;
    return s;
}

inline void log_slot::arm_timer()
{
    if (timer_ != delivery_loop::no_timer || config_.flush_interval.count() <= 0) return;

    std::weak_ptr<log_slot> weak = weak_from_this();
    timer_ = loop_->schedule_after(config_.flush_interval,
                                   [weak]()
                                   {
                                       auto self = weak.lock();
                                       if (!self) return;
                                       self->timer_ = delivery_loop::no_timer;
                                       self->flush();
                                   });
}

inline void log_slot::cancel_timer()
{
    if (timer_ == delivery_loop::no_timer) return;
    loop_->cancel(timer_);
    timer_ = delivery_loop::no_timer;
}

inline void log_slot::start_write(std::shared_ptr<const log_batch> batch, completion done)
{
    in_flight_ = true;
    attempt_write(std::move(batch), 0, std::move(done));
}

inline void log_slot::attempt_write(std::shared_ptr<const log_batch> batch, uint32_t attempt, completion done)
{
    ++stats_.write_attempts;

    auto self    = shared_from_this();
    auto settled = std::make_shared<std::atomic<bool>>(false);

    // The outcome may arrive on any thread; it is always handled back on the loop
    write_handler handler = [self, batch, attempt, done, settled](bool ok)
    {
        if (settled->exchange(true)) return;
        self->loop_->post([self, batch, attempt, done, ok]() { self->on_write_result(batch, attempt, ok, done); });
    };

    try
    {
        destination_->write(*batch, handler);
    }
    catch (...)
    {
        // Throwing is one way of failing an attempt
        handler(false);
    }
}

inline void log_slot::on_write_result(std::shared_ptr<const log_batch> batch, uint32_t attempt, bool ok, completion done)
{
    if (ok)
    {
        ++stats_.batches_written;
        stats_.entries_written += batch->size();
        finish_write(std::move(done));
        return;
    }

    ++stats_.write_failures;

    if (attempt < config_.max_retries)
    {
        auto self  = shared_from_this();
        auto retry = [self, batch = std::move(batch), attempt, done = std::move(done)]()
        { self->attempt_write(batch, attempt + 1, done); };

        if (config_.retry_delay.count() > 0) { loop_->schedule_after(config_.retry_delay, std::move(retry)); }
        else { loop_->post(std::move(retry)); }
        return;
    }

    // Out of retries: the batch is dropped as a whole
    ++stats_.batches_dropped;
    stats_.entries_dropped += batch->size();
    finish_write(std::move(done));
}

inline void log_slot::finish_write(completion done)
{
    in_flight_ = false;

    auto waiting = std::move(waiting_flushes_);
    waiting_flushes_.clear();
    const bool requested = flush_requested_;
    flush_requested_     = false;

    if (done) done();

    // One write now covers every request made while the previous one was out
    if (waiting.empty())
    {
        if (requested) flush();
        return;
    }

    flush(
        [waiting = std::move(waiting)]()
        {
            for (const auto &waiter : waiting) waiter();
        });
}

} // namespace relaylog
