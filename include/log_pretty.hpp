/**
 * @file log_pretty.hpp
 * @brief Decorated console output for startup screens: boxes, sections, banners and steps
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * These helpers bypass the level gate and the destinations entirely. They are meant for
 * the handful of lines a service prints while it boots.
 *
 * @code
 * pretty_console console;
 * console.banner({.name = "orders", .version = "1.4.0", .environment = "staging"});
 * console.step(1, 3, "Connecting to the database");
 * console.module("billing", module_status::registered);
 * console.server_ready({.port = 8080, .routes = {{"Health", "/health"}}});
 * @endcode
 */
#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "log_logger.hpp"

namespace relaylog
{

inline constexpr size_t PRETTY_WIDTH = 64;

inline constexpr const char *COLOR_BRIGHT  = "\033[1m";
inline constexpr const char *COLOR_DIM     = "\033[2m";
inline constexpr const char *COLOR_GREEN   = "\033[32m";
inline constexpr const char *COLOR_MAGENTA = "\033[35m";
inline constexpr const char *COLOR_CYAN    = "\033[36m";

namespace detail
{

// Columns taken by UTF-8 text, counting one per code point
inline size_t display_width(std::string_view text) noexcept
{
    return static_cast<size_t>(
        std::count_if(text.begin(), text.end(), [](char ch) { return (static_cast<unsigned char>(ch) & 0xC0) != 0x80; }));
}

inline std::string repeat(std::string_view unit, size_t count)
{
    std::string out;
    out.reserve(unit.size() * count);
    for (size_t i = 0; i < count; ++i) out.append(unit);
    return out;
}

inline std::string colorize(std::string_view text, const char *color, bool enabled)
{
    if (!enabled) return std::string(text);
    return fmt::format("{}{}{}", color, text, COLOR_RESET);
}

} // namespace detail

/// Center @p text in @p width columns; the odd column goes to the right
inline std::string pad_center(std::string_view text, size_t width)
{
    const size_t used  = detail::display_width(text);
    const size_t total = width > used ? width - used : 0;
    const size_t left  = total / 2;
    return fmt::format("{}{}{}", std::string(left, ' '), text, std::string(total - left, ' '));
}

inline std::string draw_box_top(size_t width)
{
    return fmt::format("╔{}╗", detail::repeat("═", width > 2 ? width - 2 : 0));
}

inline std::string draw_box_bottom(size_t width)
{
    return fmt::format("╚{}╝", detail::repeat("═", width > 2 ? width - 2 : 0));
}

inline std::string draw_box_divider(size_t width)
{
    return fmt::format("╠{}╣", detail::repeat("═", width > 2 ? width - 2 : 0));
}

/// Left aligned row; content wider than the box is kept whole
inline std::string draw_box_row(std::string_view content, size_t width)
{
    const size_t inner = width > 2 ? width - 2 : 0;
    const size_t used  = detail::display_width(content);
    return fmt::format("║{}{}║", content, std::string(inner > used ? inner - used : 0, ' '));
}

/**
 * @brief Centered row, optionally colored
 *
 * Padding happens before coloring so escape codes never count towards the width.
 */
inline std::string draw_box_centered_row(std::string_view text, size_t width, const char *color = nullptr,
                                         bool use_color = true)
{
    auto padded = pad_center(text, width > 2 ? width - 2 : 0);
    if (color) padded = detail::colorize(padded, color, use_color);
    return fmt::format("║{}║", padded);
}

enum class module_status
{
    registering,
    registered,
    bootstrapping,
    bootstrapped,
};

inline const char *string_from_module_status(module_status status)
{
    switch (status)
    {
    case module_status::registering: return "registering";
    case module_status::registered: return "registered";
    case module_status::bootstrapping: return "bootstrapping";
    case module_status::bootstrapped: return "bootstrapped";
    }
    return "unknown";
}

struct banner_info
{
    std::string name;
    std::optional<std::string> version;
    std::string environment;
    int port = 0;
};

struct route_info
{
    std::string label;
    std::string path;
    std::optional<std::string> icon;
};

struct server_info
{
    int port = 0;
    std::optional<std::string> base_url; ///< defaults to http://localhost:<port>
    std::vector<route_info> routes;
};

/**
 * @brief Writes decorated lines through a console_writer
 *
 * Every call emits whole lines, each ending in '\n' and handed to the writer separately.
 */
class pretty_console
{
  public:
    bool use_color = true;

    explicit pretty_console(console_writer writer = make_stdout_writer())
    : writer_(std::move(writer))
    {
    }

    /// Title centered in a double-lined box
    void box(std::string_view title, size_t width = PRETTY_WIDTH) const
    {
        emit(draw_box_top(width));
        emit(draw_box_centered_row(fmt::format(" {} ", title), width, COLOR_BRIGHT, use_color));
        emit(draw_box_bottom(width));
    }

    /// Blank line then `━━━ title ━━━━` running to about fifty columns
    void section(std::string_view title) const
    {
        const size_t used = detail::display_width(title);
        const auto bar    = detail::repeat("━", used < 50 ? 50 - used : 0);
        emit("");
        emit(detail::colorize(fmt::format("━━━ {} ", title), COLOR_BRIGHT, use_color) +
             detail::colorize(bar, COLOR_DIM, use_color));
    }

    void line() const { emit(""); }

    void banner(const banner_info &info) const
    {
        const auto environment = upper(info.environment);

        emit(draw_box_top(PRETTY_WIDTH));
        if (info.version)
        {
            emit(draw_box_centered_row(fmt::format(" {} ", info.name), PRETTY_WIDTH, COLOR_BRIGHT, use_color));
            emit(draw_box_centered_row(fmt::format("v{}", *info.version), PRETTY_WIDTH, COLOR_DIM, use_color));
            emit(draw_box_centered_row(environment, PRETTY_WIDTH, COLOR_CYAN, use_color));
        }
        else
        {
            emit(draw_box_centered_row(fmt::format(" {} {} ", info.name, environment), PRETTY_WIDTH, COLOR_BRIGHT,
                                       use_color));
        }
        emit(draw_box_bottom(PRETTY_WIDTH));
    }

    /// `[2/5] ▶ message`
    void step(int current, int total, std::string_view message) const
    {
        emit(fmt::format("{} {} {}", detail::colorize(fmt::format("[{}/{}]", current, total), COLOR_MAGENTA, use_color),
                         detail::colorize("▶", COLOR_BLUE, use_color), message));
    }

    void module(std::string_view name, module_status status) const
    {
        const bool pending = status == module_status::registering || status == module_status::bootstrapping;
        const char *icon   = status == module_status::registering     ? "📦"
                             : status == module_status::bootstrapping ? "🔧"
                                                                       : "✓ ";

        const auto label = fmt::format("{:<14}", upper(string_from_module_status(status)));
        emit(fmt::format("   {} {} {}", icon, detail::colorize(label, pending ? COLOR_CYAN : COLOR_GREEN, use_color),
                         detail::colorize(name, COLOR_BRIGHT, use_color)));
    }

    /// Boxed "Server running at" with one row per route, surrounded by blank lines
    void server_ready(const server_info &info) const
    {
        const auto base_url = info.base_url.value_or(fmt::format("http://localhost:{}", info.port));

        emit("");
        emit(draw_box_top(PRETTY_WIDTH));
        emit(draw_box_centered_row(fmt::format(" Server running at {} ", base_url), PRETTY_WIDTH, COLOR_GREEN,
                                   use_color));
        emit(draw_box_divider(PRETTY_WIDTH));

        for (const auto &route : info.routes)
        {
            emit(draw_box_row(
                fmt::format(" {} {:<12} {}{}", route.icon.value_or("→"), route.label, base_url, route.path),
                PRETTY_WIDTH));
        }

        emit(draw_box_bottom(PRETTY_WIDTH));
        emit("");
    }

  private:
    console_writer writer_;

    void emit(std::string line) const
    {
        if (!writer_) return;
        line += '\n';
        writer_(line);
    }

    static std::string upper(std::string_view text)
    {
        std::string out(text);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
        return out;
    }
};

} // namespace relaylog
