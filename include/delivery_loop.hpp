/**
 * @file delivery_loop.hpp
 * @brief Single threaded task loop with one-shot timers that owns all delivery state
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Every slot and the dispatcher's slot collection are only ever touched from the loop's
 * worker thread. Producers on other threads post closures; destinations completing
 * asynchronously post their outcome back. The loop never waits on a destination, so
 * a destination that hangs only stalls its own slot.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

#include "moodycamel/blockingconcurrentqueue.h"
#include "robin_hood.h"

#include "log_types.hpp"

namespace relaylog
{

class delivery_loop
{
  public:
    using clock    = std::chrono::steady_clock;
    using task     = std::function<void()>;
    using timer_id = uint64_t;

    static constexpr timer_id no_timer = 0;

    delivery_loop();
    ~delivery_loop();

    delivery_loop(const delivery_loop &)            = delete;
    delivery_loop &operator=(const delivery_loop &) = delete;

    /**
     * @brief Queue a closure for execution on the loop thread
     *
     * Safe from any thread, including the loop thread itself. Closures posted from one
     * thread run in the order they were posted. Dropped once the loop is stopped.
     */
    void post(task fn);

    /**
     * @brief Run a closure once after @p delay
     * @return Handle for cancel(), never no_timer
     * @note Loop thread only.
     */
    timer_id schedule_after(clock::duration delay, task fn);

    /**
     * @brief Cancel a pending timer
     * @return true if the timer was still pending
     * @note Loop thread only. Cancelling an unknown, fired or already cancelled id is a no-op.
     */
    bool cancel(timer_id id);

    /**
     * @brief Wait until every closure posted by this thread before the call has run
     *
     * Returns immediately when called on the loop thread or after stop().
     */
    void sync();

    /**
     * @brief Stop the worker thread
     *
     * Closures and timers that have not run yet are discarded. Idempotent.
     */
    void stop();

    bool running() const noexcept { return running_.load(std::memory_order_acquire); }
    bool in_loop_thread() const noexcept { return std::this_thread::get_id() == worker_id_; }

    size_t pending_timers() const noexcept { return timers_.size(); }

    static clock::time_point now() noexcept { return clock::now(); }

  private:
    struct loop_message
    {
        enum type
        {
            TASK,
            SYNC,
            SHUTDOWN
        };
        type msg_type = TASK;
        task fn;
        std::shared_ptr<bool> sync_flag;
    };

    void worker_thread_func();
    void run_due_timers();
    void run_task(task &fn) noexcept;
    void complete_sync(const std::shared_ptr<bool> &flag);
    void drain_queue();

    moodycamel::BlockingConcurrentQueue<loop_message> queue_;

    // Timers ordered by deadline, ties broken by creation order
    std::map<std::pair<clock::time_point, timer_id>, task> timers_;
    robin_hood::unordered_map<timer_id, clock::time_point> timer_deadlines_;
    timer_id next_timer_id_{1};

    std::atomic<bool> running_{true};

    std::mutex sync_mutex_;
    std::condition_variable sync_cv_;

    // Last so every member above is constructed before the worker starts
    std::thread worker_thread_;
    std::thread::id worker_id_;
};

} // namespace relaylog

#include "delivery_loop_impl.hpp" // IWYU pragma: keep
