/**
 * @file delivery_loop_impl.hpp
 * @brief Implementation of the delivery loop worker thread and timers
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdio>
#include <exception>

#include "delivery_loop.hpp"

namespace relaylog
{

inline delivery_loop::delivery_loop()
: worker_thread_(&delivery_loop::worker_thread_func, this)
{
    worker_id_ = worker_thread_.get_id();
}

inline delivery_loop::~delivery_loop() { stop(); }

inline void delivery_loop::post(task fn)
{
    if (!running_.load(std::memory_order_acquire)) return;
    queue_.enqueue(loop_message{loop_message::TASK, std::move(fn), {}});
}

inline delivery_loop::timer_id delivery_loop::schedule_after(clock::duration delay, task fn)
{
    if (delay < clock::duration::zero()) delay = clock::duration::zero();

    timer_id id   = next_timer_id_++;
    auto deadline = clock::now() + delay;
    timers_.emplace(std::make_pair(deadline, id), std::move(fn));
    timer_deadlines_[id] = deadline;
    return id;
}

inline bool delivery_loop::cancel(timer_id id)
{
    if (id == no_timer) return false;

    auto it = timer_deadlines_.find(id);
    if (it == timer_deadlines_.end()) return false;

    timers_.erase(std::make_pair(it->second, id));
    timer_deadlines_.erase(it);
    return true;
}

inline void delivery_loop::sync()
{
    if (in_loop_thread() || !running_.load(std::memory_order_acquire)) return;

    auto done = std::make_shared<bool>(false);
    std::unique_lock lk(sync_mutex_);
    queue_.enqueue(loop_message{loop_message::SYNC, {}, done});

    // A concurrent stop() may discard the marker; re-check the running flag periodically
    while (!sync_cv_.wait_for(lk, SYNC_POLL_INTERVAL, [&] { return *done; }))
    {
        if (!running_.load(std::memory_order_acquire)) return;
    }
}

inline void delivery_loop::stop()
{
    bool expected = true;
    if (running_.compare_exchange_strong(expected, false))
    {
        // Sentinel wakes the worker if it is blocked on an empty queue
        queue_.enqueue(loop_message{loop_message::SHUTDOWN, {}, {}});
    }

    if (worker_thread_.joinable())
    {
        if (in_loop_thread()) { worker_thread_.detach(); }
        else { worker_thread_.join(); }
    }
}

inline void delivery_loop::worker_thread_func()
{
    while (running_.load(std::memory_order_acquire))
    {
        run_due_timers();

        loop_message msg;
        if (timers_.empty())
        {
            // Nothing scheduled - block until work arrives
            queue_.wait_dequeue(msg);
        }
        else
        {
            auto wait = timers_.begin()->first.first - clock::now();
            if (wait <= clock::duration::zero()) continue;

            // Round up so we never wake just before the deadline and spin
            auto wait_us = std::chrono::duration_cast<std::chrono::microseconds>(wait) + std::chrono::microseconds(1);
            if (!queue_.wait_dequeue_timed(msg, wait_us)) continue;
        }

        switch (msg.msg_type)
        {
        case loop_message::TASK:
            if (running_.load(std::memory_order_acquire)) run_task(msg.fn);
            break;
        case loop_message::SYNC: complete_sync(msg.sync_flag); break;
        case loop_message::SHUTDOWN: break;
        }
    }

    // Discard everything that did not get to run
    timers_.clear();
    timer_deadlines_.clear();
    drain_queue();
}

inline void delivery_loop::run_due_timers()
{
    while (!timers_.empty() && running_.load(std::memory_order_acquire))
    {
        auto it = timers_.begin();
        if (it->first.first > clock::now()) break;

        task fn = std::move(it->second);
        timer_deadlines_.erase(it->first.second);
        timers_.erase(it);

        run_task(fn);
    }
}

inline void delivery_loop::run_task(task &fn) noexcept
{
    if (!fn) return;
    try
    {
        fn();
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[relaylog] delivery task failed: %s\n", e.what());
    }
}

inline void delivery_loop::complete_sync(const std::shared_ptr<bool> &flag)
{
    if (!flag) return;
    std::lock_guard lk(sync_mutex_);
    *flag = true;
    sync_cv_.notify_all();
}

inline void delivery_loop::drain_queue()
{
    loop_message msg;
    while (queue_.try_dequeue(msg))
    {
        // Waiters must not block forever on a loop that is gone
        if (msg.msg_type == loop_message::SYNC) complete_sync(msg.sync_flag);
    }
}

} // namespace relaylog
