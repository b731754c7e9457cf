/**
 * @file log_formatters.hpp
 * @brief Log entry formatting implementations
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <sstream>
#include <string>
#include <string_view>

#include <tao/json/value.hpp>
#include <tao/json/to_string.hpp>
#include <tao/json/events/from_value.hpp>
#include <tao/json/events/to_stream.hpp>
#include <tao/json/events/to_pretty_stream.hpp>

#include "log_types.hpp"
#include "log_entry.hpp"

namespace relaylog
{

/**
 * @brief JSON formatter using taocpp/json library
 *
 * Two layouts are supported:
 * - nested (default): `{"level":..,"time":..,"service":..,"scope":..,"msg":..,"meta":{..}}`,
 *   the record as destinations receive it
 * - merged: metadata keys at the top level followed by the record fields. A metadata
 *   key that collides with a record field keeps its position but carries the record's
 *   value, and that field is not repeated afterwards.
 *
 * Usage:
 * @code
 * json_formatter formatter;
 * formatter.merge_metadata = true; // console style
 * formatter.add_newline    = true; // NDJSON
 * std::string line = formatter.format(entry);
 * @endcode
 */
class json_formatter
{
  public:
    bool pretty_print   = false;
    bool add_newline    = false;
    bool merge_metadata = false;

    /**
     * @brief Produce JSON events for one entry
     *
     * Follows taocpp/json's producer pattern so the same code drives any consumer.
     */
    template <typename Consumer> void produce_entry_json(Consumer &c, const log_entry &entry) const
    {
        const bool merged = merge_metadata && entry.metadata && entry.metadata->is_object();

        // Record fields already written in place of a colliding metadata key
        unsigned written = 0;

        c.begin_object();

        if (merged)
        {
            for (const auto &[key, value] : entry.metadata->get_object())
            {
                const int field = record_field(key, entry);
                if (field >= 0)
                {
                    produce_record_field(c, field, entry);
                    written |= 1u << field;
                    continue;
                }
                c.key(key);
                tao::json::events::from_value(c, value);
                c.member();
            }
        }

        for (int field = 0; field < RECORD_FIELDS; ++field)
        {
            if ((written & (1u << field)) == 0) produce_record_field(c, field, entry);
        }

        if (entry.metadata && !merged)
        {
            c.key("meta");
            tao::json::events::from_value(c, *entry.metadata);
            c.member();
        }

        c.end_object();
    }

    void format_to(std::string &out, const log_entry &entry) const
    {
        std::ostringstream stream;

        if (pretty_print)
        {
            // Pretty print with 2-space indent
            tao::json::events::to_pretty_stream consumer(stream, 2);
            produce_entry_json(consumer, entry);
        }
        else
        {
            tao::json::events::to_stream consumer(stream);
            produce_entry_json(consumer, entry);
        }

        out += stream.str();
        if (add_newline) out += '\n';
    }

    std::string format(const log_entry &entry) const
    {
        std::string out;
        format_to(out, entry);
        return out;
    }

  private:
    static constexpr const char *RECORD_KEYS[] = {"level", "time", "service", "scope", "msg"};
    static constexpr int RECORD_FIELDS         = 5;
    static constexpr int SCOPE_FIELD           = 3;

    // Index into RECORD_KEYS, or -1 when the key is plain metadata
    static int record_field(std::string_view key, const log_entry &entry) noexcept
    {
        for (int field = 0; field < RECORD_FIELDS; ++field)
        {
            if (key != RECORD_KEYS[field]) continue;
            // scope only shadows metadata when the entry carries one
            if (field == SCOPE_FIELD && !entry.scope) return -1;
            return field;
        }
        return -1;
    }

    template <typename Consumer> static void produce_record_field(Consumer &c, int field, const log_entry &entry)
    {
        switch (field)
        {
        case 0: c.key("level"); c.string(string_from_log_level(entry.level)); break;
        case 1: c.key("time"); c.string(format_timestamp(entry.timestamp)); break;
        case 2: c.key("service"); c.string(entry.service); break;
        case SCOPE_FIELD:
            if (!entry.scope) return;
            c.key("scope");
            c.string(*entry.scope);
            break;
        default: c.key("msg"); c.string(entry.message); break;
        }
        c.member();
    }
};

/**
 * @brief Human readable single line formatter
 *
 * Layout: `<icon> [<time>] <LEVEL> [<scope>] <message> <metadata>`. The level label is
 * padded to five columns, the scope tag and metadata only appear when present and
 * metadata is rendered as compact JSON.
 */
class pretty_formatter
{
  public:
    bool use_color   = true;
    bool add_newline = false;

    void format_to(std::string &out, const log_entry &entry) const
    {
        fmt::memory_buffer buf;
        auto inserter = std::back_inserter(buf);

        const size_t idx = level_index(entry.level);

        fmt::format_to(inserter, "{} ", log_level_icons[idx]);
        append_colored(buf, fmt::format("[{}]", format_timestamp(entry.timestamp)), COLOR_GRAY);
        buf.push_back(' ');
        append_colored(buf, log_level_labels[idx], log_level_colors[idx]);

        if (entry.scope && !entry.scope->empty())
        {
            buf.push_back(' ');
            append_colored(buf, fmt::format("[{}]", *entry.scope), COLOR_BLUE);
        }

        if (!entry.message.empty()) fmt::format_to(inserter, " {}", entry.message);

        if (entry.metadata) fmt::format_to(inserter, " {}", tao::json::to_string(*entry.metadata));

        if (add_newline) buf.push_back('\n');

        out.append(buf.data(), buf.size());
    }

    std::string format(const log_entry &entry) const
    {
        std::string out;
        format_to(out, entry);
        return out;
    }

  private:
    void append_colored(fmt::memory_buffer &buf, std::string_view text, const char *color) const
    {
        if (use_color) fmt::format_to(std::back_inserter(buf), "{}{}{}", color, text, COLOR_RESET);
        else buf.append(text.data(), text.data() + text.size());
    }
};

} // namespace relaylog
