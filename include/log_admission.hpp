/**
 * @file log_admission.hpp
 * @brief Rate limiting and bounded queue primitives used by slot admission
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <utility>
#include <vector>

#include "log_types.hpp"

namespace relaylog
{

/**
 * @brief Self-resetting fixed window counter
 *
 * Nothing runs between calls: the window is checked and restarted lazily on each
 * admission. Once RATE_WINDOW_LENGTH has elapsed since the window start the counter
 * drops back to zero and the window restarts at the current time.
 *
 * @code
 * rate_window window{20}; // 20 entries per second
 * if (!window.try_acquire(std::chrono::steady_clock::now())) return; // limited
 * @endcode
 *
 * @note Not thread-safe. Owned and used by a single slot on the delivery loop.
 */
class rate_window
{
  public:
    using clock      = std::chrono::steady_clock;
    using time_point = clock::time_point;

    explicit rate_window(uint32_t limit = 0) noexcept : limit_(limit) {}

    /**
     * @brief Count one admission if the window still has room
     * @param now Current time
     * @return true if admitted, false if rate limited
     */
    bool try_acquire(time_point now) noexcept
    {
        if (limit_ == 0) return true;

        if (!started_ || now - window_start_ >= RATE_WINDOW_LENGTH)
        {
            window_start_ = now;
            count_        = 0;
            started_      = true;
        }

        if (count_ >= limit_) return false;
        ++count_;
        return true;
    }

    uint32_t limit() const noexcept { return limit_; }
    uint32_t count() const noexcept { return count_; }

  private:
    uint32_t limit_;
    uint32_t count_{0};
    bool started_{false};
    time_point window_start_{};
};

/**
 * @brief FIFO queue that silently drops its oldest elements on overflow
 *
 * With a capacity of zero the queue is unbounded. Newest elements always win.
 */
template <typename T> class evicting_queue
{
  public:
    explicit evicting_queue(size_t capacity = 0) : capacity_(capacity) {}

    /**
     * @brief Append an element, evicting from the front while over capacity
     * @return Number of elements evicted by this push
     */
    size_t push(T value)
    {
        items_.push_back(std::move(value));

        size_t evicted = 0;
        if (capacity_ > 0)
        {
            while (items_.size() > capacity_)
            {
                items_.pop_front();
                ++evicted;
            }
        }
        return evicted;
    }

    /**
     * @brief Move every element out, leaving the queue empty
     */
    std::vector<T> take_all()
    {
        std::vector<T> out;
        out.reserve(items_.size());
        for (auto &item : items_) out.push_back(std::move(item));
        items_.clear();
        return out;
    }

    void clear() noexcept { items_.clear(); }

    size_t size() const noexcept { return items_.size(); }
    bool empty() const noexcept { return items_.empty(); }
    size_t capacity() const noexcept { return capacity_; }

    const T &front() const { return items_.front(); }
    const T &back() const { return items_.back(); }

  private:
    size_t capacity_;
    std::deque<T> items_;
};

} // namespace relaylog
