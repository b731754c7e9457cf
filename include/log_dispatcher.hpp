/**
 * @file log_dispatcher.hpp
 * @brief Fans log entries out to the configured destinations
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * The dispatcher holds one log_slot per configured destination. All slot state lives on
 * the dispatcher's delivery loop; the public member functions are thread-safe and only
 * post work to it, so dispatch() never waits on a destination.
 *
 * Reconfiguring drops whatever the old slots still had queued. Call flush() first when
 * those entries matter.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

#include "log_types.hpp"
#include "log_entry.hpp"
#include "log_destination.hpp"
#include "log_slot.hpp"
#include "delivery_loop.hpp"

namespace relaylog
{

/**
 * @brief Routes entries to every active slot in configured order
 *
 * @code
 * log_dispatcher dispatcher;
 * auto memory = make_memory_destination();
 *
 * slot_config batched;
 * batched.batch_size     = 10;
 * batched.flush_interval = std::chrono::milliseconds(500);
 *
 * dispatcher.reconfigure({{memory, batched}});
 * dispatcher.dispatch(make_log_entry(log_level::info, "hello", "app"));
 * dispatcher.flush();
 * @endcode
 */
class log_dispatcher
{
  public:
    log_dispatcher();
    explicit log_dispatcher(std::vector<destination_config> configs);

    /// Stops the delivery loop. Pending timers and queued entries are discarded.
    ~log_dispatcher();

    log_dispatcher(const log_dispatcher &)            = delete;
    log_dispatcher &operator=(const log_dispatcher &) = delete;

    /**
     * @brief Offer an entry to every active slot
     *
     * Never blocks and never throws. With no active slot nothing is posted.
     */
    void dispatch(log_entry_ptr entry);
    void dispatch(log_entry entry) { dispatch(std::make_shared<const log_entry>(std::move(entry))); }

    /**
     * @brief Replace the whole destination set
     *
     * Every config is validated before anything changes. The old slots are destroyed
     * without being flushed.
     *
     * @throws config_error if any config is invalid
     */
    void reconfigure(std::vector<destination_config> configs);

    /**
     * @brief Append one destination without disturbing the others
     * @throws config_error if the destination is null or the options are invalid
     */
    void add(std::shared_ptr<log_destination> destination, slot_config options = {});

    /**
     * @brief Flush every active slot
     * @return Future that becomes ready once every slot reported completion
     */
    std::future<void> flush_all();

    /// Block until flush_all() completes. Must not be called from the delivery loop.
    void flush();

    /**
     * @brief Wait at most @p timeout for flush_all()
     * @return true if every slot completed in time
     */
    bool flush_for(std::chrono::milliseconds timeout);

    /// Wait until everything posted before the call was processed by the loop
    void sync() { loop_->sync(); }

    /// Number of active destinations as seen by producers
    size_t size() const noexcept { return active_slots_.load(std::memory_order_acquire); }
    bool empty() const noexcept { return size() == 0; }

    /**
     * @brief Snapshot of the per-slot counters in configured order
     */
    std::vector<slot_stats> stats();

  private:
    std::vector<std::shared_ptr<log_slot>> make_slots(std::vector<destination_config> &configs);
    std::vector<slot_stats> collect_stats() const;

    std::shared_ptr<delivery_loop> loop_;

    // Loop thread only
    std::vector<std::shared_ptr<log_slot>> slots_;

    // Keeps active_slots_ in step with the order of configuration posts
    std::mutex config_mutex_;
    std::atomic<size_t> active_slots_{0};
};

} // namespace relaylog

#include "log_dispatcher_impl.hpp" // IWYU pragma: keep
