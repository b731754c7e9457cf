/**
 * @file test_log_destinations.cpp
 * @brief Tests for the ready-made destinations
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include <tao/json/from_string.hpp>

#include "log_destinations.hpp"
#include "log_dispatcher.hpp"

using namespace relaylog;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace
{

class temp_dir_fixture
{
  protected:
    std::string test_dir;

    temp_dir_fixture()
    {
        auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
        test_dir = "/tmp/test_destinations_" + std::to_string(getpid()) + "_" + std::to_string(tid);
        fs::create_directories(test_dir);
    }

    ~temp_dir_fixture()
    {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    std::vector<std::string> read_lines(const std::string &filename)
    {
        std::vector<std::string> lines;
        std::ifstream in(filename);
        std::string line;
        while (std::getline(in, line)) lines.push_back(line);
        return lines;
    }
};

log_batch batch_of(std::initializer_list<const char *> messages)
{
    log_batch::container entries;
    for (auto message : messages) entries.push_back(make_log_entry(log_level::info, message, "dest-test"));
    return log_batch{std::move(entries)};
}

class counting_destination : public sync_destination
{
  public:
    std::atomic<int> delivered{0};
    std::atomic<bool> fail{false};
    std::chrono::milliseconds delay{0};

  protected:
    void deliver(const log_batch &batch) override
    {
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        if (fail) throw std::runtime_error("unreachable");
        delivered += static_cast<int>(batch.size());
    }
};

// Collects completion outcomes from any thread
struct outcomes
{
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<bool> results;

    write_handler handler()
    {
        return [this](bool ok)
        {
            std::lock_guard lock(mutex);
            results.push_back(ok);
            cv.notify_all();
        };
    }

    bool wait_for(size_t count, std::chrono::milliseconds timeout)
    {
        std::unique_lock lock(mutex);
        return cv.wait_for(lock, timeout, [&] { return results.size() >= count; });
    }
};

} // namespace

TEST_CASE_METHOD(temp_dir_fixture, "File destination writes NDJSON", "[destinations][file]")
{
    const std::string filename = test_dir + "/app.log";

    SECTION("One JSON document per line")
    {
        auto file = make_file_destination(filename);
        REQUIRE(file->filename() == filename);

        outcomes done;
        file->write(batch_of({"first", "second"}), done.handler());
        file->write(batch_of({"third"}), done.handler());
        REQUIRE(done.results == std::vector<bool>{true, true});

        auto lines = read_lines(filename);
        REQUIRE(lines.size() == 3);

        auto parsed = tao::json::from_string(lines[0]);
        REQUIRE(parsed.at("msg").get_string() == "first");
        REQUIRE(parsed.at("level").get_string() == "info");
        REQUIRE(parsed.at("service").get_string() == "dest-test");
        REQUIRE(tao::json::from_string(lines[2]).at("msg").get_string() == "third");
    }

    SECTION("Appends to an existing file")
    {
        {
            std::ofstream out(filename);
            out << "existing\n";
        }

        auto file = make_file_destination(filename);
        file->write(batch_of({"appended"}), nullptr);

        auto lines = read_lines(filename);
        REQUIRE(lines.size() == 2);
        REQUIRE(lines[0] == "existing");
        REQUIRE_THAT(lines[1], Catch::Matchers::ContainsSubstring("\"msg\":\"appended\""));
    }

    SECTION("Merged layout is honoured")
    {
        json_formatter merged;
        merged.merge_metadata = true;
        auto file             = make_file_destination(filename, merged);

        file->write(log_batch{log_batch::container{
                        make_log_entry(log_level::warn, "m", "svc", std::nullopt, log_metadata{{"order", 17}})}},
                    nullptr);

        auto parsed = tao::json::from_string(read_lines(filename).at(0));
        REQUIRE(parsed.at("order").as<int>() == 17);
        REQUIRE(parsed.find("meta") == nullptr);
    }

    SECTION("Unopenable path throws")
    {
        REQUIRE_THROWS_AS(make_file_destination(test_dir + "/missing/dir/app.log"), std::runtime_error);
    }

    SECTION("Entries flow through a dispatcher")
    {
        log_dispatcher dispatcher;
        slot_config batched;
        batched.batch_size = 10;
        dispatcher.reconfigure({{make_file_destination(filename), batched}});

        for (int i = 0; i < 25; ++i)
        {
            dispatcher.dispatch(make_log_entry(log_level::info, "line " + std::to_string(i), "svc"));
        }
        dispatcher.flush();

        auto lines = read_lines(filename);
        REQUIRE(lines.size() == 25);
        REQUIRE(tao::json::from_string(lines[24]).at("msg").get_string() == "line 24");
    }
}

TEST_CASE("Callback destination", "[destinations][callback]")
{
    SECTION("Forwards batch and completion")
    {
        std::vector<std::string> seen;
        auto callback = make_callback_destination(
            [&](const log_batch &batch, write_handler on_complete)
            {
                for (const auto &entry : batch) seen.push_back(entry->message);
                on_complete(true);
            });

        outcomes done;
        callback->write(batch_of({"a", "b"}), done.handler());
        REQUIRE(seen == std::vector<std::string>{"a", "b"});
        REQUIRE(done.results == std::vector<bool>{true});
    }

    SECTION("Empty callback is rejected")
    {
        REQUIRE_THROWS_AS(make_callback_destination({}), config_error);
    }
}

TEST_CASE("Threaded destination", "[destinations][threaded]")
{
    auto inner = std::make_shared<counting_destination>();

    SECTION("Completes from the worker thread")
    {
        inner->delay = 50ms;
        auto threaded = make_threaded_destination(inner);

        outcomes done;
        const auto start = std::chrono::steady_clock::now();
        threaded->write(batch_of({"a", "b", "c"}), done.handler());
        REQUIRE(std::chrono::steady_clock::now() - start < 50ms);

        REQUIRE(done.wait_for(1, 2000ms));
        REQUIRE(done.results == std::vector<bool>{true});
        REQUIRE(inner->delivered == 3);
    }

    SECTION("A throwing delivery reports failure")
    {
        inner->fail   = true;
        auto threaded = make_threaded_destination(inner);

        outcomes done;
        threaded->write(batch_of({"a"}), done.handler());
        REQUIRE(done.wait_for(1, 2000ms));
        REQUIRE(done.results == std::vector<bool>{false});
    }

    SECTION("Queued batches are delivered before destruction completes")
    {
        inner->delay = 10ms;
        outcomes done;
        {
            auto threaded = make_threaded_destination(inner);
            for (int i = 0; i < 5; ++i) threaded->write(batch_of({"x"}), done.handler());
        }

        REQUIRE(inner->delivered == 5);
        REQUIRE(done.results.size() == 5);
    }

    SECTION("Null inner destination is rejected")
    {
        REQUIRE_THROWS_AS(make_threaded_destination(nullptr), config_error);
    }
}

namespace
{

bool wait_expired(const std::weak_ptr<threaded_destination> &weak, std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!weak.expired())
    {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

} // namespace

TEST_CASE("Threaded destination teardown", "[destinations][threaded][lifetime]")
{
    auto inner = std::make_shared<counting_destination>();
    std::weak_ptr<threaded_destination> weak;

    SECTION("Released with its dispatcher after a completed write")
    {
        {
            log_dispatcher dispatcher;
            auto threaded = make_threaded_destination(inner);
            weak          = threaded;
            dispatcher.add(std::move(threaded));

            dispatcher.dispatch(make_log_entry(log_level::info, "one", "svc"));
            dispatcher.flush();
            REQUIRE(inner->delivered == 1);
        }

        REQUIRE(wait_expired(weak, 2000ms));
    }

    SECTION("Released when the dispatcher goes away mid write")
    {
        inner->delay = 100ms;
        {
            log_dispatcher dispatcher;
            auto threaded = make_threaded_destination(inner);
            weak          = threaded;
            dispatcher.add(std::move(threaded));

            dispatcher.dispatch(make_log_entry(log_level::info, "slow", "svc"));
            dispatcher.sync();
        }

        // The worker drops the last reference once the delivery returns
        REQUIRE(wait_expired(weak, 2000ms));
        REQUIRE(inner->delivered == 1);
    }
}

TEST_CASE("Memory destination", "[destinations][memory]")
{
    auto memory = make_memory_destination();

    SECTION("Records batches and entries")
    {
        memory->write(batch_of({"a", "b"}), nullptr);
        memory->write(batch_of({"c"}), nullptr);

        REQUIRE(memory->messages() == std::vector<std::string>{"a", "b", "c"});
        REQUIRE(memory->batches().size() == 2);
        REQUIRE(memory->write_calls() == 2);

        memory->clear();
        REQUIRE(memory->size() == 0);
        REQUIRE(memory->write_calls() == 2);
    }

    SECTION("fail_next fails the next writes only")
    {
        outcomes done;
        memory->fail_next(2);
        memory->write(batch_of({"a"}), done.handler());
        memory->write(batch_of({"b"}), done.handler());
        memory->write(batch_of({"c"}), done.handler());

        REQUIRE(done.results == std::vector<bool>{false, false, true});
        REQUIRE(memory->messages() == std::vector<std::string>{"c"});
    }

    SECTION("Held completions finish in order on request")
    {
        outcomes done;
        memory->hold_completions(true);
        memory->write(batch_of({"a"}), done.handler());
        memory->write(batch_of({"b"}), done.handler());

        REQUIRE(memory->held() == 2);
        REQUIRE(memory->max_outstanding() == 2);
        REQUIRE(done.results.empty());
        REQUIRE(memory->size() == 0);

        REQUIRE(memory->complete_next());
        REQUIRE(memory->complete_next(false));
        REQUIRE_FALSE(memory->complete_next());

        REQUIRE(done.results == std::vector<bool>{true, false});
        REQUIRE(memory->messages() == std::vector<std::string>{"a"});
    }

    SECTION("wait_for times out when nothing arrives")
    {
        REQUIRE_FALSE(memory->wait_for(1, 20ms));
    }
}
