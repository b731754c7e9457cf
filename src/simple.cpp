#include <iostream>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"

using namespace relaylog;
using namespace std::chrono_literals;

void print_usage(const char *prog_name)
{
    std::cerr << "Usage: " << prog_name << " [options]\n"
              << "Options:\n"
              << "  -m <mode>         Console mode: pretty, json, silent (default: silent)\n"
              << "  -f <file>         NDJSON output file (default: /tmp/relaylog.ndjson)\n"
              << "  -t <threads>      Producer threads (default: 4)\n"
              << "  -n <count>        Entries per thread (default: 10000)\n"
              << "  -b <size>         Destination batch size (default: 64)\n"
              << "  -h                Show this help\n";
}

int main(int argc, char *argv[])
{
    std::string mode        = "silent";
    std::string output_file = "/tmp/relaylog.ndjson";
    int threads             = 4;
    int per_thread          = 10000;
    size_t batch_size       = 64;

    for (int i = 1; i < argc; i++)
    {
        if (strcmp(argv[i], "-m") == 0 && i + 1 < argc) { mode = argv[++i]; }
        else if (strcmp(argv[i], "-f") == 0 && i + 1 < argc) { output_file = argv[++i]; }
        else if (strcmp(argv[i], "-t") == 0 && i + 1 < argc) { threads = std::atoi(argv[++i]); }
        else if (strcmp(argv[i], "-n") == 0 && i + 1 < argc) { per_thread = std::atoi(argv[++i]); }
        else if (strcmp(argv[i], "-b") == 0 && i + 1 < argc) { batch_size = std::strtoul(argv[++i], nullptr, 10); }
        else if (strcmp(argv[i], "-h") == 0)
        {
            print_usage(argv[0]);
            return 0;
        }
        else
        {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    log_dispatcher dispatcher;

    try
    {
        log_config config;
        config.with_level("debug").with_mode(mode);
        config.service_name = "simple";

        slot_config batched;
        batched.batch_size     = batch_size;
        batched.flush_interval = 100ms;
        config.destinations    = std::vector<destination_config>{{make_file_destination(output_file), batched}};

        logger log(dispatcher, std::move(config));

        log.info("Starting log blast", log_metadata{{"threads", threads}, {"per_thread", per_thread}, {"file", output_file}});

        auto timer = log.time("log blast", "bench");

        std::vector<std::thread> producers;
        for (int t = 0; t < threads; ++t)
        {
            producers.emplace_back(
                [&log, t, per_thread]
                {
                    auto worker = log.child(log_metadata{{"thread_id", t}}).scope("worker");
                    for (int i = 0; i < per_thread; ++i)
                    {
                        worker.debug("iteration", log_metadata{{"iteration", i}});
                    }
                });
        }
        for (auto &p : producers) p.join();

        log.flush();
        timer.end(log_metadata{{"entries", threads * per_thread}});
        log.flush();

        for (const auto &stats : dispatcher.stats())
        {
            std::cerr << "========== DESTINATION STATS ==========\n";
            std::cerr << "  Offered: " << stats.offered << "\n";
            std::cerr << "  Admitted: " << stats.admitted << "\n";
            std::cerr << "  Evicted: " << stats.evicted << "\n";
            std::cerr << "  Batches written: " << stats.batches_written << "\n";
            std::cerr << "  Entries written: " << stats.entries_written << "\n";
            std::cerr << "  Write failures: " << stats.write_failures << "\n";
            std::cerr << "  Entries dropped: " << stats.entries_dropped << "\n";
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    return 0;
}
