/**
 * @file log_destination.hpp
 * @brief Destination interface consumed by the delivery slots
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <functional>
#include <memory>
#include <utility>

#include "log_entry.hpp"

namespace relaylog
{

/**
 * @brief Completion callback for one write attempt
 *
 * Receives true when the destination accepted the whole batch, false otherwise.
 */
using write_handler = std::function<void(bool success)>;

/**
 * @brief Abstract interface for log destinations
 *
 * A destination accepts a batch of one or more entries and reports the outcome through
 * the handler. The handler may be called synchronously from inside write() or later
 * from any thread, and must be called once. Throwing from write() counts as a failed
 * attempt. Either way the slot decides whether to retry; nothing is reported back to
 * the code that produced the entries.
 *
 * A slot never issues a second write() before the previous one completed, so
 * implementations see strictly sequential, ordered batches.
 */
struct log_destination
{
    virtual ~log_destination() = default;

    virtual void write(const log_batch &batch, write_handler on_complete) = 0;
};

/**
 * @brief Base for destinations that finish their work inside the call
 *
 * Implement deliver(); return normally on success, throw on failure.
 *
 * @code
 * struct stderr_destination : sync_destination
 * {
 *   protected:
 *     void deliver(const log_batch &batch) override
 *     {
 *         for (const auto &entry : batch) fmt::print(stderr, "{}\n", entry->message);
 *     }
 * };
 * @endcode
 */
class sync_destination : public log_destination
{
  public:
    void write(const log_batch &batch, write_handler on_complete) final
    {
        bool ok = true;
        try
        {
            deliver(batch);
        }
        catch (...)
        {
            // Any exception is a failed attempt; the slot owns the retry decision
            ok = false;
        }
        if (on_complete) on_complete(ok);
    }

    /**
     * @brief Deliver synchronously, bypassing the completion protocol
     *
     * Used by adapters that run a synchronous destination on another thread.
     * @throws whatever deliver() throws
     */
    void deliver_now(const log_batch &batch) { deliver(batch); }

  protected:
    virtual void deliver(const log_batch &batch) = 0;
};

} // namespace relaylog
