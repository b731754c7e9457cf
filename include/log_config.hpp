/**
 * @file log_config.hpp
 * @brief Facade configuration and environment derived defaults
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "log_types.hpp"
#include "log_slot.hpp"
#include "log_utils.hpp"

namespace relaylog
{

/**
 * @brief Partial configuration applied by logger::configure()
 *
 * Absent fields leave the current setting untouched. A present `destinations` replaces
 * the whole destination set, an empty vector removes every destination.
 *
 * @code
 * log_config config;
 * config.with_level("debug").with_mode("json");
 * config.service_name = "billing";
 * config.destinations = std::vector<destination_config>{{make_memory_destination(), {}}};
 * logger.configure(std::move(config));
 * @endcode
 */
struct log_config
{
    std::optional<log_level> level;
    std::optional<log_mode> mode;
    std::optional<std::string> service_name;
    std::optional<std::vector<destination_config>> destinations;

    /// @throws config_error if @p name is not a level name
    log_config &with_level(std::string_view name)
    {
        level = parse_log_level(name);
        return *this;
    }

    /// @throws config_error if @p name is not a mode name
    log_config &with_mode(std::string_view name)
    {
        mode = parse_log_mode(name);
        return *this;
    }

    /**
     * @brief Check every present field
     * @throws config_error on the first invalid field
     */
    void validate() const
    {
        if (level && (*level < log_level::debug || *level > log_level::error))
        {
            throw config_error(fmt::format("Invalid log level: \"{}\". Must be one of: debug, info, warn, error",
                                           static_cast<int>(*level)));
        }

        if (mode && *mode != log_mode::pretty && *mode != log_mode::json && *mode != log_mode::silent)
        {
            throw config_error(fmt::format("Invalid log mode: \"{}\". Must be one of: pretty, json, silent",
                                           static_cast<int>(*mode)));
        }

        if (service_name && detail::is_blank(*service_name))
        {
            throw config_error("service_name cannot be empty");
        }

        if (destinations)
        {
            for (const auto &destination : *destinations) destination.validate();
        }
    }

    /**
     * @brief Defaults taken from the process environment
     *
     * - LOG_LEVEL: a level name, otherwise info
     * - LOG_MODE: a mode name, otherwise json when NODE_ENV is "production", pretty otherwise
     * - SERVICE_NAME: any non-blank value, otherwise DEFAULT_SERVICE_NAME
     *
     * Unusable values fall back silently. Every field of the result is set except
     * destinations.
     */
    static log_config from_env()
    {
        log_config config;

        log_level level = log_level::info;
        log_level env_level;
        const char *level_env = std::getenv("LOG_LEVEL");
        if (level_env && try_parse_log_level(level_env, env_level)) level = env_level;
        config.level = level;

        const char *node_env = std::getenv("NODE_ENV");
        log_mode mode = (node_env && std::string_view(node_env) == "production") ? log_mode::json : log_mode::pretty;
        log_mode env_mode;
        const char *mode_env = std::getenv("LOG_MODE");
        if (mode_env && try_parse_log_mode(mode_env, env_mode)) mode = env_mode;
        config.mode = mode;

        const char *service = std::getenv("SERVICE_NAME");
        config.service_name = (service && !detail::is_blank(service)) ? std::string(service) : DEFAULT_SERVICE_NAME;

        return config;
    }
};

} // namespace relaylog
