/**
 * @file log_destinations.hpp
 * @brief Ready-made destinations and factory functions for them
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "moodycamel/blockingconcurrentqueue.h"

#include "log_types.hpp"
#include "log_entry.hpp"
#include "log_destination.hpp"
#include "log_formatters.hpp"
#include "log_writers.hpp"

namespace relaylog
{

/**
 * @brief Thread-safe in-memory capture of everything written to it
 *
 * Intended for tests and diagnostics. Besides recording batches it can simulate
 * failures and hold completions back so callers control when a write finishes.
 *
 * @code
 * auto memory = make_memory_destination();
 * dispatcher.add(memory);
 * logger.info("hello");
 * REQUIRE(memory->wait_for(1, std::chrono::seconds(1)));
 * @endcode
 */
class memory_destination : public log_destination
{
  public:
    void write(const log_batch &batch, write_handler on_complete) override
    {
        bool fail = false;
        {
            std::lock_guard lock(mutex_);
            ++write_calls_;
            ++outstanding_;
            max_outstanding_ = std::max(max_outstanding_, outstanding_);

            if (fail_next_ > 0)
            {
                --fail_next_;
                fail = true;
            }
            else if (!hold_completions_)
            {
                record(batch);
            }

            if (hold_completions_)
            {
                held_.push_back(held_write{batch.entries(), std::move(on_complete), fail});
                cv_.notify_all();
                return;
            }

            --outstanding_;
            cv_.notify_all();
        }

        if (on_complete) on_complete(!fail);
    }

    /// Make the next @p count writes report failure without recording anything
    void fail_next(size_t count)
    {
        std::lock_guard lock(mutex_);
        fail_next_ = count;
    }

    /// When enabled, writes stay outstanding until complete_next() is called
    void hold_completions(bool hold)
    {
        std::lock_guard lock(mutex_);
        hold_completions_ = hold;
    }

    /**
     * @brief Finish the oldest held write
     * @param success Outcome to report; ignored for writes already marked to fail
     * @return false if no write was held
     */
    bool complete_next(bool success = true)
    {
        held_write held;
        {
            std::lock_guard lock(mutex_);
            if (held_.empty()) return false;

            held = std::move(held_.front());
            held_.pop_front();

            success = success && !held.fail;
            if (success) record(log_batch{held.entries});
            --outstanding_;
            cv_.notify_all();
        }

        if (held.on_complete) held.on_complete(success);
        return true;
    }

    std::vector<log_entry_ptr> entries() const
    {
        std::lock_guard lock(mutex_);
        return entries_;
    }

    std::vector<std::vector<log_entry_ptr>> batches() const
    {
        std::lock_guard lock(mutex_);
        return batches_;
    }

    std::vector<std::string> messages() const
    {
        std::lock_guard lock(mutex_);
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto &entry : entries_) out.push_back(entry->message);
        return out;
    }

    size_t size() const
    {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    size_t write_calls() const
    {
        std::lock_guard lock(mutex_);
        return write_calls_;
    }

    size_t held() const
    {
        std::lock_guard lock(mutex_);
        return held_.size();
    }

    /// Highest number of writes that were outstanding at the same time
    size_t max_outstanding() const
    {
        std::lock_guard lock(mutex_);
        return max_outstanding_;
    }

    void clear()
    {
        std::lock_guard lock(mutex_);
        entries_.clear();
        batches_.clear();
    }

    /**
     * @brief Wait until at least @p count entries were accepted
     * @return false on timeout
     */
    bool wait_for(size_t count, std::chrono::milliseconds timeout) const
    {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return entries_.size() >= count; });
    }

    /// Wait until at least @p count write() calls were made
    bool wait_for_writes(size_t count, std::chrono::milliseconds timeout) const
    {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return write_calls_ >= count; });
    }

    /// Wait until at least @p count writes are held back
    bool wait_for_held(size_t count, std::chrono::milliseconds timeout) const
    {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return held_.size() >= count; });
    }

  private:
    struct held_write
    {
        log_batch::container entries;
        write_handler on_complete;
        bool fail = false;
    };

    // Caller holds mutex_
    void record(const log_batch &batch)
    {
        batches_.push_back(batch.entries());
        entries_.insert(entries_.end(), batch.begin(), batch.end());
    }

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;

    std::vector<log_entry_ptr> entries_;
    std::vector<std::vector<log_entry_ptr>> batches_;
    std::deque<held_write> held_;

    size_t write_calls_{0};
    size_t outstanding_{0};
    size_t max_outstanding_{0};
    size_t fail_next_{0};
    bool hold_completions_{false};
};

/**
 * @brief Appends each entry as one JSON line (NDJSON) to a file
 *
 * A batch becomes a single writev. A failed write throws, which the slot counts as a
 * failed attempt.
 */
class file_destination : public sync_destination
{
  public:
    /**
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit file_destination(const std::string &filename, json_formatter formatter = {})
    : writer_(filename),
      formatter_(formatter)
    {
        formatter_.add_newline = true;
    }

    explicit file_destination(file_writer writer, json_formatter formatter = {})
    : writer_(std::move(writer)),
      formatter_(formatter)
    {
        formatter_.add_newline = true;
    }

    const std::string &filename() const noexcept { return writer_.filename(); }

  protected:
    void deliver(const log_batch &batch) override
    {
        std::vector<std::string> lines;
        lines.reserve(batch.size());
        for (const auto &entry : batch) lines.push_back(formatter_.format(*entry));

        if (!writer_.write_all(lines))
        {
            throw std::runtime_error(
                fmt::format("Failed to write to log file {}: {}", writer_.filename(), std::strerror(errno)));
        }
    }

  private:
    file_writer writer_;
    json_formatter formatter_;
};

/**
 * @brief Adapts a function with the asynchronous write signature
 */
class callback_destination : public log_destination
{
  public:
    using callback = std::function<void(const log_batch &, write_handler)>;

    explicit callback_destination(callback fn) : fn_(std::move(fn))
    {
        if (!fn_) throw config_error("destination callback cannot be empty");
    }

    void write(const log_batch &batch, write_handler on_complete) override { fn_(batch, std::move(on_complete)); }

  private:
    callback fn_;
};

/**
 * @brief Runs a synchronous destination on its own worker thread
 *
 * write() only queues the batch; the outcome is reported from the worker thread once
 * deliver() returned or threw. This is the shape of a network destination: the delivery
 * loop moves on while the request is outstanding.
 *
 * Batches still queued when the adapter is destroyed are delivered before the worker
 * exits.
 */
class threaded_destination : public log_destination
{
  public:
    explicit threaded_destination(std::shared_ptr<sync_destination> inner)
    {
        if (!inner) throw config_error("destination cannot be null");
        state_         = std::make_shared<worker_state>();
        state_->inner  = std::move(inner);
        worker_thread_ = std::thread(&threaded_destination::worker_thread_func, state_);
        worker_id_     = worker_thread_.get_id();
    }

    ~threaded_destination() override
    {
        state_->shutdown.store(true, std::memory_order_release);
        state_->queue.enqueue(job{});
        if (!worker_thread_.joinable()) return;

        // The last reference can be dropped by a completion running on the worker itself
        if (std::this_thread::get_id() == worker_id_) { worker_thread_.detach(); }
        else { worker_thread_.join(); }
    }

    threaded_destination(const threaded_destination &)            = delete;
    threaded_destination &operator=(const threaded_destination &) = delete;

    void write(const log_batch &batch, write_handler on_complete) override
    {
        if (state_->shutdown.load(std::memory_order_acquire))
        {
            if (on_complete) on_complete(false);
            return;
        }
        state_->queue.enqueue(job{std::make_shared<const log_batch>(batch), std::move(on_complete)});
    }

    const std::shared_ptr<sync_destination> &inner() const noexcept { return state_->inner; }

  private:
    struct job
    {
        std::shared_ptr<const log_batch> batch; ///< nullptr is the shutdown marker
        write_handler on_complete;
    };

    // Shared with the worker so it can outlive a destructor that had to detach
    struct worker_state
    {
        std::shared_ptr<sync_destination> inner;
        moodycamel::BlockingConcurrentQueue<job> queue;
        std::atomic<bool> shutdown{false};
    };

    static void worker_thread_func(std::shared_ptr<worker_state> state)
    {
        while (true)
        {
            job current;
            state->queue.wait_dequeue(current);
            if (!current.batch) break;
            run(*state, std::move(current));
        }

        // Deliver whatever raced with the shutdown marker
        job current;
        while (state->queue.try_dequeue(current))
        {
            if (current.batch) run(*state, std::move(current));
            current = job{};
        }
    }

    // Consumes the job so nothing it captured outlives the delivery
    static void run(worker_state &state, job current)
    {
        bool ok = true;
        try
        {
            state.inner->deliver_now(*current.batch);
        }
        catch (...)
        {
            // Reported as a failed attempt, same as sync_destination::write
            ok = false;
        }
        if (current.on_complete) current.on_complete(ok);
    }

    std::shared_ptr<worker_state> state_;
    std::thread worker_thread_;
    std::thread::id worker_id_;
};

// Factory functions

inline std::shared_ptr<memory_destination> make_memory_destination()
{
    return std::make_shared<memory_destination>();
}

inline std::shared_ptr<file_destination> make_file_destination(const std::string_view &filename, json_formatter formatter = {})
{
    return std::make_shared<file_destination>(std::string(filename), formatter);
}

inline std::shared_ptr<callback_destination> make_callback_destination(callback_destination::callback fn)
{
    return std::make_shared<callback_destination>(std::move(fn));
}

inline std::shared_ptr<threaded_destination> make_threaded_destination(std::shared_ptr<sync_destination> inner)
{
    return std::make_shared<threaded_destination>(std::move(inner));
}

} // namespace relaylog
