/**
 * @file log.hpp
 * @brief Structured logging with batched, rate limited, retried delivery to pluggable destinations
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * This logging system provides:
 * - A facade with debug/info/warn/error, scoped and child loggers and elapsed-time handles
 * - Console output as colored text, one JSON object per line, or nothing at all
 * - Any number of destinations, each with its own level threshold, filter, batch size,
 *   flush interval, bounded queue, rate limit and retry policy
 * - A dedicated delivery thread; logging calls never block on a destination and never
 *   throw because of one
 *
 * Basic Usage:
 * @code
 * using namespace relaylog;
 *
 * log_dispatcher dispatcher;
 * logger log(dispatcher); // level, mode and service name from LOG_LEVEL, LOG_MODE, SERVICE_NAME
 *
 * log.info("Application started");
 * // Output: ℹ️  [2025-01-31T12:00:00.123Z] INFO  Application started
 *
 * log.warn("Disk almost full", log_metadata{{"free_mb", 512}});
 * // Output: ⚠️  [2025-01-31T12:00:00.124Z] WARN  Disk almost full {"free_mb":512}
 * @endcode
 *
 * JSON Mode:
 * @code
 * log.configure(log_config{}.with_mode("json"));
 * log.info("User logged in", log_metadata{{"user_id", 42}});
 * // Output: {"user_id":42,"level":"info","time":"2025-01-31T12:00:00.125Z","service":"app","msg":"User logged in"}
 * @endcode
 *
 * Scopes, Children and Timers:
 * @code
 * auto db = log.scope("db");
 * db.error("Connection lost");
 *
 * auto request = log.child(log_metadata{{"request_id", "abc"}});
 * request.info("Handled", log_metadata{{"status", 200}}); // request_id and status
 *
 * auto timer = log.time("import", "jobs");
 * run_import();
 * timer.end(); // debug: "import completed in 153ms"
 * @endcode
 *
 * Destination Configuration:
 * @code
 * slot_config errors_only;
 * errors_only.min_level      = log_level::error;
 * errors_only.batch_size     = 10;
 * errors_only.flush_interval = std::chrono::milliseconds(5000);
 * errors_only.max_retries    = 3;
 * errors_only.retry_delay    = std::chrono::milliseconds(200);
 *
 * slot_config audit;
 * audit.filter         = scope_filter{"audit"};
 * audit.max_queue_size = 1000;
 * audit.rate_limit     = 100;
 *
 * log_config config;
 * config.destinations = std::vector<destination_config>{
 *     {make_threaded_destination(std::make_shared<my_http_destination>()), errors_only},
 *     {make_file_destination("/var/log/audit.ndjson"), audit},
 * };
 * log.configure(std::move(config));
 *
 * // Before exit, deliver what is still queued
 * log.flush();
 * @endcode
 *
 * Writing a Destination:
 * @code
 * // Synchronous: return on success, throw on failure
 * struct stderr_destination : sync_destination
 * {
 *   protected:
 *     void deliver(const log_batch &batch) override;
 * };
 *
 * // Asynchronous: report the outcome once, from any thread
 * struct queue_destination : log_destination
 * {
 *     void write(const log_batch &batch, write_handler on_complete) override;
 * };
 * @endcode
 *
 * Delivery Guarantees:
 * - Entries reach each destination in the order they were logged
 * - A destination never sees two overlapping write() calls
 * - Failed writes are retried up to max_retries times, then the batch is dropped
 * - Rate limited, filtered and evicted entries are dropped silently
 * - Nothing survives a process restart and there is no ordering across destinations
 */
#pragma once

#include "log_types.hpp"
#include "log_utils.hpp"
#include "log_entry.hpp"
#include "log_destination.hpp"
#include "log_admission.hpp"
#include "delivery_loop.hpp"
#include "log_slot.hpp"
#include "log_dispatcher.hpp"
#include "log_formatters.hpp"
#include "log_writers.hpp"
#include "log_destinations.hpp"
#include "log_entry_filters.hpp"
#include "log_config.hpp"
#include "log_logger.hpp"
#include "log_pretty.hpp"
