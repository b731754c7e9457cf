/**
 * @file log_dispatcher_impl.hpp
 * @brief Implementation of the log dispatcher
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include "log_dispatcher.hpp"

namespace relaylog
{

inline log_dispatcher::log_dispatcher()
: loop_(std::make_shared<delivery_loop>())
{
}

inline log_dispatcher::log_dispatcher(std::vector<destination_config> configs)
: log_dispatcher()
{
    reconfigure(std::move(configs));
}

inline log_dispatcher::~log_dispatcher()
{
    // Joins the worker; nothing touches slots_ after this
    loop_->stop();

    for (auto &slot : slots_) slot->destroy();
    slots_.clear();
}

inline void log_dispatcher::dispatch(log_entry_ptr entry)
{
    if (!entry || active_slots_.load(std::memory_order_acquire) == 0) return;

    loop_->post(
        [this, entry = std::move(entry)]()
        {
            for (auto &slot : slots_) slot->enqueue(entry);
        });
}

inline std::vector<std::shared_ptr<log_slot>> log_dispatcher::make_slots(std::vector<destination_config> &configs)
{
    // Validate everything before building anything
    for (const auto &config : configs) config.validate();

    std::vector<std::shared_ptr<log_slot>> slots;
    slots.reserve(configs.size());
    for (auto &config : configs)
    {
        slots.push_back(std::make_shared<log_slot>(loop_, std::move(config.destination), std::move(config.options)));
    }
    return slots;
}

inline void log_dispatcher::reconfigure(std::vector<destination_config> configs)
{
    auto fresh = make_slots(configs);

    std::lock_guard lock(config_mutex_);
    active_slots_.store(fresh.size(), std::memory_order_release);
    loop_->post(
        [this, fresh = std::move(fresh)]() mutable
        {
            for (auto &slot : slots_) slot->destroy();
            slots_ = std::move(fresh);
        });
}

inline void log_dispatcher::add(std::shared_ptr<log_destination> destination, slot_config options)
{
    std::vector<destination_config> configs;
    configs.push_back(destination_config{std::move(destination), std::move(options)});
    auto fresh = make_slots(configs);

    std::lock_guard lock(config_mutex_);
    active_slots_.fetch_add(1, std::memory_order_acq_rel);
    loop_->post([this, slot = std::move(fresh.front())]() { slots_.push_back(slot); });
}

inline std::future<void> log_dispatcher::flush_all()
{
    struct flush_state
    {
        std::promise<void> promise;
        size_t remaining = 0;
    };

    auto state  = std::make_shared<flush_state>();
    auto result = state->promise.get_future();

    if (!loop_->running())
    {
        state->promise.set_value();
        return result;
    }

    loop_->post(
        [this, state]()
        {
            if (slots_.empty())
            {
                state->promise.set_value();
                return;
            }

            state->remaining = slots_.size();
            // Copy: a completion may run while a later reconfigure replaces slots_
            auto slots = slots_;
            for (auto &slot : slots)
            {
                slot->flush(
                    [state]()
                    {
                        if (--state->remaining == 0) state->promise.set_value();
                    });
            }
        });

    return result;
}

inline void log_dispatcher::flush() { flush_all().get(); }

inline bool log_dispatcher::flush_for(std::chrono::milliseconds timeout)
{
    return flush_all().wait_for(timeout) == std::future_status::ready;
}

inline std::vector<slot_stats> log_dispatcher::collect_stats() const
{
    std::vector<slot_stats> result;
    result.reserve(slots_.size());
    for (const auto &slot : slots_) result.push_back(slot->stats());
    return result;
}

inline std::vector<slot_stats> log_dispatcher::stats()
{
    if (loop_->in_loop_thread() || !loop_->running()) return collect_stats();

    auto promise = std::make_shared<std::promise<std::vector<slot_stats>>>();
    auto result  = promise->get_future();
    loop_->post([this, promise]() { promise->set_value(collect_stats()); });
    return result.get();
}

} // namespace relaylog
