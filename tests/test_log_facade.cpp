/**
 * @file test_log_facade.cpp
 * @brief Tests for the logger facade: level gate, console modes, scopes, children and timers
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <chrono>
#include <cstdlib>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <tao/json/from_string.hpp>

#include "log.hpp"

using namespace relaylog;
using namespace Catch::Matchers;
using namespace std::chrono_literals;

namespace
{

// Captures console output instead of writing to stdout
struct console_capture
{
    std::mutex mutex;
    std::vector<std::string> lines;

    console_writer writer()
    {
        return [this](std::string_view line)
        {
            std::lock_guard lock(mutex);
            lines.emplace_back(line);
        };
    }
};

log_config base_config(log_mode mode = log_mode::json, log_level level = log_level::info)
{
    log_config config;
    config.level        = level;
    config.mode         = mode;
    config.service_name = "facade-test";
    return config;
}

// Restores an environment variable when the test ends
class env_guard
{
  public:
    explicit env_guard(const char *name) : name_(name)
    {
        const char *value = std::getenv(name);
        if (value) saved_ = value;
    }

    ~env_guard()
    {
        if (saved_) setenv(name_, saved_->c_str(), 1);
        else unsetenv(name_);
    }

  private:
    const char *name_;
    std::optional<std::string> saved_;
};

} // namespace

TEST_CASE("Logger level gate", "[facade][level]")
{
    log_dispatcher dispatcher;
    auto memory = make_memory_destination();
    dispatcher.add(memory);

    logger log(dispatcher, base_config(log_mode::silent, log_level::warn));
    REQUIRE(log.level() == log_level::warn);
    REQUIRE_FALSE(log.should_log(log_level::info));
    REQUIRE(log.should_log(log_level::error));

    log.debug("d");
    log.info("i");
    log.warn("w");
    log.error("e");
    log.flush();

    REQUIRE(memory->messages() == std::vector<std::string>{"w", "e"});

    const auto &entries = memory->entries();
    REQUIRE(entries.at(0)->level == log_level::warn);
    REQUIRE(entries.at(0)->service == "facade-test");
    REQUIRE_FALSE(entries.at(0)->scope.has_value());
}

TEST_CASE("Logger console modes", "[facade][console]")
{
    log_dispatcher dispatcher;
    console_capture console;

    SECTION("JSON mode writes one merged object per line")
    {
        logger log(dispatcher, base_config(log_mode::json));
        log.set_console_writer(console.writer());

        log.info("hello", log_metadata{{"user_id", 42}});

        REQUIRE(console.lines.size() == 1);
        const auto &line = console.lines[0];
        REQUIRE(line.back() == '\n');

        auto parsed = tao::json::from_string(line);
        REQUIRE(parsed.at("msg").get_string() == "hello");
        REQUIRE(parsed.at("level").get_string() == "info");
        REQUIRE(parsed.at("service").get_string() == "facade-test");
        REQUIRE(parsed.at("user_id").as<int>() == 42);
        REQUIRE(parsed.find("scope") == nullptr);
    }

    SECTION("Pretty mode writes a colored line")
    {
        logger log(dispatcher, base_config(log_mode::pretty));
        log.set_console_writer(console.writer());

        log.scope("db").warn("slow query", log_metadata{{"ms", 250}});

        REQUIRE(console.lines.size() == 1);
        const auto &line = console.lines[0];
        REQUIRE_THAT(line, StartsWith(log_level_icons[level_index(log_level::warn)]));
        REQUIRE_THAT(line, ContainsSubstring("WARN "));
        REQUIRE_THAT(line, ContainsSubstring(std::string(COLOR_BLUE) + "[db]" + COLOR_RESET));
        REQUIRE_THAT(line, EndsWith("slow query {\"ms\":250}\n"));
    }

    SECTION("Silent mode writes nothing but still dispatches")
    {
        auto memory = make_memory_destination();
        dispatcher.add(memory);

        logger log(dispatcher, base_config(log_mode::silent));
        log.set_console_writer(console.writer());

        log.error("quiet");
        log.flush();

        REQUIRE(console.lines.empty());
        REQUIRE(memory->messages() == std::vector<std::string>{"quiet"});
    }

    SECTION("Console and destinations both see an entry")
    {
        auto memory = make_memory_destination();
        logger log(dispatcher, base_config(log_mode::json));
        log.set_console_writer(console.writer());
        log.add_destination(memory);

        log.info("both");
        log.flush();

        REQUIRE(console.lines.size() == 1);
        REQUIRE(memory->messages() == std::vector<std::string>{"both"});
    }

    SECTION("Gated entries reach neither")
    {
        auto memory = make_memory_destination();
        logger log(dispatcher, base_config(log_mode::json, log_level::error));
        log.set_console_writer(console.writer());
        log.add_destination(memory);

        log.warn("dropped");
        log.flush();

        REQUIRE(console.lines.empty());
        REQUIRE(memory->write_calls() == 0);
    }
}

TEST_CASE("Scoped and child loggers", "[facade][scope]")
{
    log_dispatcher dispatcher;
    auto memory = make_memory_destination();
    dispatcher.add(memory);

    logger log(dispatcher, base_config(log_mode::silent, log_level::debug));

    SECTION("Scope tag is carried on every entry")
    {
        auto db = log.scope("db");
        REQUIRE(db.scope() == "db");

        db.debug("one");
        db.error("two");
        log.flush();

        auto entries = memory->entries();
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0]->scope == "db");
        REQUIRE(entries[1]->scope == "db");
        REQUIRE(entries[1]->level == log_level::error);
    }

    SECTION("Child context is merged under per-call metadata")
    {
        auto child = log.child(log_metadata{{"request_id", "r-1"}, {"user", "alice"}});
        child.info("plain");
        child.info("override", log_metadata{{"user", "bob"}, {"extra", true}});
        log.flush();

        auto entries = memory->entries();
        REQUIRE(entries.size() == 2);

        const auto &first = *entries[0]->metadata;
        REQUIRE(first.at("request_id").get_string() == "r-1");
        REQUIRE(first.at("user").get_string() == "alice");

        const auto &second = *entries[1]->metadata;
        REQUIRE(second.at("request_id").get_string() == "r-1");
        REQUIRE(second.at("user").get_string() == "bob");
        REQUIRE(second.at("extra").get_boolean());
    }

    SECTION("Child scope keeps the context")
    {
        auto scoped = log.child(log_metadata{{"tenant", 7}}).scope("billing");
        scoped.warn("invoice late");
        log.flush();

        auto entries = memory->entries();
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0]->scope == "billing");
        REQUIRE(entries[0]->metadata->at("tenant").as<int>() == 7);
    }

    SECTION("Child metadata leaves the context untouched")
    {
        auto child = log.child(log_metadata{{"k", 1}});
        child.info("a", log_metadata{{"k", 2}});
        REQUIRE(child.context().at("k").as<int>() == 1);
    }
}

TEST_CASE("Timers log elapsed time at debug", "[facade][timer]")
{
    log_dispatcher dispatcher;
    auto memory = make_memory_destination();
    dispatcher.add(memory);

    SECTION("Message carries the label and rounded milliseconds")
    {
        logger log(dispatcher, base_config(log_mode::silent, log_level::debug));

        auto timer = log.time("load config", "boot");
        std::this_thread::sleep_for(20ms);
        timer.end(log_metadata{{"files", 3}});
        log.flush();

        auto entries = memory->entries();
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0]->level == log_level::debug);
        REQUIRE(entries[0]->scope == "boot");
        REQUIRE_THAT(entries[0]->message, StartsWith("load config completed in "));
        REQUIRE_THAT(entries[0]->message, EndsWith("ms"));
        REQUIRE(entries[0]->metadata->at("files").as<int>() == 3);

        const std::string prefix = "load config completed in ";
        const auto &msg          = entries[0]->message;
        REQUIRE(std::stoi(msg.substr(prefix.size())) >= 20);
    }

    SECTION("Timer output obeys the level gate")
    {
        logger log(dispatcher, base_config(log_mode::silent, log_level::info));

        auto timer = log.time("fast");
        timer.end();
        log.flush();

        REQUIRE(memory->write_calls() == 0);
        REQUIRE(timer.elapsed() >= 0ms);
    }
}

TEST_CASE("Logger configure", "[facade][config]")
{
    log_dispatcher dispatcher;
    logger log(dispatcher, base_config(log_mode::silent));

    SECTION("Partial update keeps unspecified fields")
    {
        log_config update;
        update.with_level("debug");
        log.configure(update);

        REQUIRE(log.level() == log_level::debug);
        REQUIRE(log.mode() == log_mode::silent);
        REQUIRE(log.service_name() == "facade-test");
    }

    SECTION("Invalid level names are rejected with the accepted names")
    {
        log_config update;
        REQUIRE_THROWS_WITH(update.with_level("verbose"),
                            "Invalid log level: \"verbose\". Must be one of: debug, info, warn, error");
        REQUIRE_THROWS_WITH(update.with_mode("xml"), "Invalid log mode: \"xml\". Must be one of: pretty, json, silent");
        REQUIRE_THROWS_AS(parse_log_level("INFO"), config_error);
    }

    SECTION("A rejected config changes nothing")
    {
        auto memory = make_memory_destination();
        log.add_destination(memory);

        log_config update;
        update.level        = log_level::error;
        update.mode         = log_mode::json;
        update.service_name = "   ";
        update.destinations = std::vector<destination_config>{};

        REQUIRE_THROWS_WITH(log.configure(update), "service_name cannot be empty");
        REQUIRE(log.level() == log_level::info);
        REQUIRE(log.mode() == log_mode::silent);
        REQUIRE(log.service_name() == "facade-test");
        REQUIRE(dispatcher.size() == 1);

        update.service_name = "ok";
        update.destinations = std::vector<destination_config>{{nullptr, {}}};
        REQUIRE_THROWS_AS(log.configure(update), config_error);
        REQUIRE(log.level() == log_level::info);
        REQUIRE(dispatcher.size() == 1);
    }

    SECTION("Out of range enum values are rejected")
    {
        log_config update;
        update.level = static_cast<log_level>(9);
        REQUIRE_THROWS_AS(log.configure(update), config_error);

        log_config mode_update;
        mode_update.mode = static_cast<log_mode>(7);
        REQUIRE_THROWS_AS(log.configure(mode_update), config_error);
    }

    SECTION("Destinations replace the active set")
    {
        auto first  = make_memory_destination();
        auto second = make_memory_destination();
        log.add_destination(first);

        log_config update;
        update.destinations = std::vector<destination_config>{{second, {}}};
        log.configure(update);

        log.info("routed");
        log.flush();

        REQUIRE(first->write_calls() == 0);
        REQUIRE(second->messages() == std::vector<std::string>{"routed"});
    }

    SECTION("Service name appears on later entries")
    {
        auto memory = make_memory_destination();
        log.add_destination(memory);

        log_config update;
        update.service_name = "renamed";
        log.configure(update);

        log.info("x");
        log.flush();
        REQUIRE(memory->entries().at(0)->service == "renamed");
    }

    SECTION("flush_async completes")
    {
        auto memory = make_memory_destination();
        log.add_destination(memory);
        log.info("async");

        auto done = log.flush_async();
        REQUIRE(done.wait_for(2s) == std::future_status::ready);
        REQUIRE(memory->size() == 1);
    }
}

TEST_CASE("Configuration from the environment", "[facade][env]")
{
    env_guard level_guard("LOG_LEVEL");
    env_guard mode_guard("LOG_MODE");
    env_guard node_guard("NODE_ENV");
    env_guard service_guard("SERVICE_NAME");

    unsetenv("LOG_LEVEL");
    unsetenv("LOG_MODE");
    unsetenv("NODE_ENV");
    unsetenv("SERVICE_NAME");

    SECTION("Defaults")
    {
        auto config = log_config::from_env();
        REQUIRE(config.level == log_level::info);
        REQUIRE(config.mode == log_mode::pretty);
        REQUIRE(config.service_name == "app");
        REQUIRE_FALSE(config.destinations.has_value());
    }

    SECTION("Explicit values")
    {
        setenv("LOG_LEVEL", "debug", 1);
        setenv("LOG_MODE", "silent", 1);
        setenv("SERVICE_NAME", "orders", 1);

        auto config = log_config::from_env();
        REQUIRE(config.level == log_level::debug);
        REQUIRE(config.mode == log_mode::silent);
        REQUIRE(config.service_name == "orders");
    }

    SECTION("Production defaults to JSON unless LOG_MODE says otherwise")
    {
        setenv("NODE_ENV", "production", 1);
        REQUIRE(log_config::from_env().mode == log_mode::json);

        setenv("LOG_MODE", "pretty", 1);
        REQUIRE(log_config::from_env().mode == log_mode::pretty);
    }

    SECTION("Unusable values fall back")
    {
        setenv("LOG_LEVEL", "loud", 1);
        setenv("LOG_MODE", "xml", 1);
        setenv("SERVICE_NAME", "  ", 1);

        auto config = log_config::from_env();
        REQUIRE(config.level == log_level::info);
        REQUIRE(config.mode == log_mode::pretty);
        REQUIRE(config.service_name == "app");
    }

    SECTION("Logger picks up the environment by default")
    {
        setenv("LOG_LEVEL", "error", 1);
        setenv("LOG_MODE", "silent", 1);
        setenv("SERVICE_NAME", "env-service", 1);

        log_dispatcher dispatcher;
        logger log(dispatcher);
        REQUIRE(log.level() == log_level::error);
        REQUIRE(log.mode() == log_mode::silent);
        REQUIRE(log.service_name() == "env-service");
    }
}
