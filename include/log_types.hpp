/**
 * @file log_types.hpp
 * @brief Core type definitions and constants for the logging system
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <string_view>
#include <stdexcept>
#include <chrono>

#ifndef FMT_HEADER_ONLY
    #define FMT_HEADER_ONLY
#endif
#include <fmt/format.h>

namespace relaylog
{

#ifndef RELAYLOG_VERSION_STRING
    #define RELAYLOG_VERSION_STRING "dev"
#endif

inline constexpr const char *VERSION = RELAYLOG_VERSION_STRING;

// Slot defaults. A destination configured without options gets these values:
// immediate delivery, no time based flush, unbounded queue, no rate limit, no retry.
inline constexpr size_t DEFAULT_BATCH_SIZE     = 1;
inline constexpr size_t DEFAULT_MAX_QUEUE_SIZE = 0;
inline constexpr uint32_t DEFAULT_RATE_LIMIT   = 0;
inline constexpr uint32_t DEFAULT_MAX_RETRIES  = 0;
inline constexpr auto DEFAULT_FLUSH_INTERVAL   = std::chrono::milliseconds(0);
inline constexpr auto DEFAULT_RETRY_DELAY      = std::chrono::milliseconds(0);

// Rate limiting uses a lazily reset window of this length
inline constexpr auto RATE_WINDOW_LENGTH = std::chrono::seconds(1);

// How often a blocked sync() re-checks whether the delivery loop was stopped
inline constexpr auto SYNC_POLL_INTERVAL = std::chrono::milliseconds(50);

// Facade defaults when neither configuration nor environment provide a value
inline constexpr const char *DEFAULT_SERVICE_NAME = "app";

/**
 * @brief Thrown when a configuration is rejected
 *
 * This is the only error the pipeline surfaces to callers. It is raised
 * synchronously by configure/reconfigure/add before any slot is built.
 */
class config_error : public std::invalid_argument
{
  public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Enumeration of available log levels in ascending order of severity
 */
enum class log_level : int8_t
{
    debug = 0, ///< Debugging information
    info  = 1, ///< General information
    warn  = 2, ///< Warning messages
    error = 3, ///< Error messages
};

/**
 * @brief Console rendering mode of the facade
 */
enum class log_mode : uint8_t
{
    pretty, ///< Colored human readable lines
    json,   ///< One JSON object per line
    silent, ///< No console output, destinations still receive entries
};

inline constexpr std::array<log_level, 4> all_log_levels = {log_level::debug, log_level::info, log_level::warn,
                                                            log_level::error};

// Level names for formatting
inline constexpr std::array<const char *, 4> log_level_names  = {"debug", "info", "warn", "error"};
inline constexpr std::array<const char *, 4> log_level_labels = {"DEBUG", "INFO ", "WARN ", "ERROR"};

inline constexpr std::array<const char *, 4> log_level_colors = {
    "\033[35m", // debug
    "\033[36m", // info
    "\033[33m", // warn
    "\033[31m", // error
};

inline constexpr std::array<const char *, 4> log_level_icons = {
    "\xF0\x9F\x90\x9B",          // debug
    "\xE2\x84\xB9\xEF\xB8\x8F ", // info
    "\xE2\x9A\xA0\xEF\xB8\x8F ", // warn
    "\xE2\x9D\x8C",              // error
};

inline constexpr const char *COLOR_RESET = "\033[0m";
inline constexpr const char *COLOR_GRAY  = "\033[90m";
inline constexpr const char *COLOR_BLUE  = "\033[34m";

constexpr size_t level_index(log_level level) noexcept { return static_cast<size_t>(level); }

inline const char *string_from_log_level(log_level level) { return log_level_names[level_index(level)]; }

inline const char *string_from_log_mode(log_mode mode)
{
    switch (mode)
    {
    case log_mode::pretty: return "pretty";
    case log_mode::json: return "json";
    case log_mode::silent: return "silent";
    default: return "unknown";
    }
}

/**
 * @brief Convert string to log_level
 * @param str Level name, exact lowercase match
 * @return true and sets @p out when the name is known
 */
inline bool try_parse_log_level(std::string_view str, log_level &out) noexcept
{
    for (auto level : all_log_levels)
    {
        if (str == log_level_names[level_index(level)])
        {
            out = level;
            return true;
        }
    }
    return false;
}

inline bool try_parse_log_mode(std::string_view str, log_mode &out) noexcept
{
    if (str == "pretty") out = log_mode::pretty;
    else if (str == "json") out = log_mode::json;
    else if (str == "silent") out = log_mode::silent;
    else return false;
    return true;
}

/**
 * @brief Convert string to log_level
 * @throws config_error if the name is not one of debug, info, warn, error
 */
inline log_level parse_log_level(std::string_view str)
{
    log_level level;
    if (!try_parse_log_level(str, level))
    {
        throw config_error(fmt::format("Invalid log level: \"{}\". Must be one of: debug, info, warn, error", str));
    }
    return level;
}

/**
 * @brief Convert string to log_mode
 * @throws config_error if the name is not one of pretty, json, silent
 */
inline log_mode parse_log_mode(std::string_view str)
{
    log_mode mode;
    if (!try_parse_log_mode(str, mode))
    {
        throw config_error(fmt::format("Invalid log mode: \"{}\". Must be one of: pretty, json, silent", str));
    }
    return mode;
}

} // namespace relaylog
