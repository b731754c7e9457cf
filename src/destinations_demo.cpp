/**
 * @file destinations_demo.cpp
 * @brief Per destination thresholds, filters, rate limits and retries side by side
 */
#include <atomic>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "log.hpp"

using namespace relaylog;
using namespace std::chrono_literals;

// Fails every other delivery, like a collector behind a flaky network
class flaky_destination : public sync_destination
{
  public:
    explicit flaky_destination(std::string name) : name_(std::move(name)) {}

  protected:
    void deliver(const log_batch &batch) override
    {
        if (calls_++ % 2 == 0) throw std::runtime_error("connection reset");

        for (const auto &entry : batch)
        {
            std::cerr << "  [" << name_ << "] " << string_from_log_level(entry->level) << ": " << entry->message << "\n";
        }
    }

  private:
    std::string name_;
    std::atomic<int> calls_{0};
};

int main()
{
    pretty_console console;
    console.banner({"destinations demo", "1.0.0", "development", 0});
    console.step(1, 3, "Configuring destinations");

    log_dispatcher dispatcher;
    logger log(dispatcher);

    auto memory = make_memory_destination();

    // Errors only, batched, retried through a worker thread
    slot_config errors_only;
    errors_only.min_level      = log_level::error;
    errors_only.batch_size     = 5;
    errors_only.flush_interval = 200ms;
    errors_only.max_retries    = 3;
    errors_only.retry_delay    = 50ms;

    // Audit trail: only the audit scope, bounded and rate limited
    slot_config audit;
    audit.filter         = scope_filter{"audit"};
    audit.max_queue_size = 100;
    audit.rate_limit     = 10;

    // Everything except chatty scopes
    slot_config quiet;
    quiet.filter = scope_exclude_filter{"heartbeat*"};

    try
    {
        log_config config;
        config.destinations = std::vector<destination_config>{
            {make_threaded_destination(std::make_shared<flaky_destination>("alerts")), errors_only},
            {make_file_destination("/tmp/relaylog-audit.ndjson"), audit},
            {memory, quiet},
        };
        log.configure(std::move(config));
    }
    catch (const config_error &e)
    {
        std::cerr << "Configuration rejected: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Failed to set up destinations: " << e.what() << "\n";
        return 1;
    }

    console.step(2, 3, "Logging");
    auto audit_log = log.scope("audit");
    auto heartbeat = log.scope("heartbeat.db");

    for (int i = 0; i < 25; ++i) audit_log.info("permission checked", log_metadata{{"request", i}});
    for (int i = 0; i < 5; ++i) heartbeat.info("ping");

    log.error("payment provider unreachable", log_metadata{{"provider", "acme"}});
    log.error("retry budget exhausted");
    log.warn("falling back to queue");

    log.flush();

    console.step(3, 3, "Delivery report");
    std::cerr << "memory destination kept " << memory->size() << " entries\n";
    for (const auto &stats : dispatcher.stats())
    {
        std::cerr << "offered=" << stats.offered << " written=" << stats.entries_written
                  << " rate_dropped=" << stats.dropped_rate << " filtered=" << stats.dropped_filter
                  << " failures=" << stats.write_failures << "\n";
    }

    return 0;
}
