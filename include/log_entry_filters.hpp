/**
 * @file log_entry_filters.hpp
 * @brief Ready-made entry predicates for per-destination filtering
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Every filter here is a callable `bool(const log_entry &)` and converts to
 * entry_filter, so it can be assigned straight to slot_config::filter:
 *
 * @code
 * slot_config options;
 * options.filter = and_filter{}.add(max_level_filter{log_level::info}).add(scope_filter{"db", "cache"});
 * @endcode
 */
#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "robin_hood.h"

#include "log_types.hpp"
#include "log_entry.hpp"
#include "log_slot.hpp"
#include "log_utils.hpp"

namespace relaylog
{

namespace detail
{

template <typename... Names>
concept scope_names = sizeof...(Names) > 0 && (std::is_convertible_v<const Names &, std::string_view> && ...);

} // namespace detail

/**
 * @brief Filter based on minimum log level
 *
 * Same effect as slot_config::min_level; useful inside composite filters.
 */
struct level_filter final
{
    log_level min_level;

    bool operator()(const log_entry &entry) const noexcept { return entry.level >= min_level; }
};

/**
 * @brief Filter based on maximum log level
 *
 * Only accepts entries with level <= max_level.
 * Useful for debug destinations that should not receive errors (which go elsewhere).
 *
 * @code
 * options.filter = max_level_filter{log_level::debug};
 * @endcode
 */
struct max_level_filter final
{
    log_level max_level;

    bool operator()(const log_entry &entry) const noexcept { return entry.level <= max_level; }
};

/**
 * @brief Filter based on log level range
 *
 * Only accepts entries with min_level <= level <= max_level.
 */
struct level_range_filter final
{
    log_level min_level;
    log_level max_level;

    bool operator()(const log_entry &entry) const noexcept
    {
        return entry.level >= min_level && entry.level <= max_level;
    }
};

/**
 * @brief Filter based on scope name
 *
 * Accepts entries whose scope is one of the listed names. Names are matched exactly,
 * except patterns containing a leading or trailing `*`, which use wildcard matching.
 * Entries without a scope are rejected unless the list is empty.
 *
 * @note Exact names are an O(1) hash lookup; only wildcard patterns are scanned.
 */
struct scope_filter final
{
    robin_hood::unordered_set<std::string> allowed_scopes;
    std::vector<std::string> allowed_patterns;

    // Also serves as default constructor; `scope_filter{{"a", "b"}}` lands here
    scope_filter(std::vector<std::string> scopes = {})
    {
        for (auto &scope : scopes) add(std::move(scope));
    }

    template <typename... Names>
        requires detail::scope_names<Names...>
    scope_filter(const Names &...scopes)
    {
        (add(std::string(std::string_view(scopes))), ...);
    }

    void add(std::string scope)
    {
        if (scope.find('*') != std::string::npos) allowed_patterns.push_back(std::move(scope));
        else allowed_scopes.insert(std::move(scope));
    }

    bool operator()(const log_entry &entry) const
    {
        // If no scopes specified, accept all (permissive by default)
        if (allowed_scopes.empty() && allowed_patterns.empty()) return true;
        if (!entry.scope) return false;

        if (allowed_scopes.count(*entry.scope) > 0) return true;
        for (const auto &pattern : allowed_patterns)
        {
            if (detail::wildcard_match(*entry.scope, pattern)) return true;
        }
        return false;
    }
};

/**
 * @brief Filter that excludes specific scopes
 *
 * Accepts everything except entries whose scope matches one of the listed names or
 * wildcard patterns. Entries without a scope are never excluded.
 */
struct scope_exclude_filter final
{
    robin_hood::unordered_set<std::string> excluded_scopes;
    std::vector<std::string> excluded_patterns;

    scope_exclude_filter(std::vector<std::string> scopes = {})
    {
        for (auto &scope : scopes) add(std::move(scope));
    }

    template <typename... Names>
        requires detail::scope_names<Names...>
    scope_exclude_filter(const Names &...scopes)
    {
        (add(std::string(std::string_view(scopes))), ...);
    }

    void add(std::string scope)
    {
        if (scope.find('*') != std::string::npos) excluded_patterns.push_back(std::move(scope));
        else excluded_scopes.insert(std::move(scope));
    }

    bool operator()(const log_entry &entry) const
    {
        if (!entry.scope) return true; // No scope = not excluded

        if (excluded_scopes.count(*entry.scope) > 0) return false;
        for (const auto &pattern : excluded_patterns)
        {
            if (detail::wildcard_match(*entry.scope, pattern)) return false;
        }
        return true;
    }
};

/**
 * @brief Filter on the message text
 *
 * @code
 * options.filter = message_filter{"*timeout*"}; // messages containing "timeout"
 * options.filter = message_filter{"GET *"};     // messages starting with "GET "
 * @endcode
 */
struct message_filter final
{
    std::string pattern;

    bool operator()(const log_entry &entry) const { return detail::wildcard_match(entry.message, pattern); }
};

/**
 * @brief Composite filter that requires ALL sub-filters to pass
 *
 * @code
 * // Only errors from the network scope
 * auto filter = and_filter{}
 *     .add(level_filter{log_level::error})
 *     .add(scope_filter{"network"});
 * @endcode
 */
struct and_filter final
{
    std::vector<entry_filter> filters;

    /**
     * @brief Add a filter to the AND chain
     * @return Reference to this for chaining
     */
    template <typename Filter> and_filter &add(Filter filter)
    {
        filters.emplace_back(std::move(filter));
        return *this;
    }

    bool operator()(const log_entry &entry) const
    {
        // Empty AND filter accepts all (all zero conditions are met)
        for (const auto &filter : filters)
        {
            if (filter && !filter(entry)) return false;
        }
        return true;
    }
};

/**
 * @brief Composite filter that requires ANY sub-filter to pass
 *
 * @code
 * // Errors from anywhere OR anything from the debug scope
 * auto filter = or_filter{}
 *     .add(level_filter{log_level::error})
 *     .add(scope_filter{"debug"});
 * @endcode
 */
struct or_filter final
{
    std::vector<entry_filter> filters;

    template <typename Filter> or_filter &add(Filter filter)
    {
        filters.emplace_back(std::move(filter));
        return *this;
    }

    bool operator()(const log_entry &entry) const
    {
        // Empty OR filter rejects all (no conditions to meet)
        for (const auto &filter : filters)
        {
            if (filter && filter(entry)) return true;
        }
        return false;
    }
};

/**
 * @brief Inverted filter - accepts what the wrapped filter rejects
 *
 * @code
 * // Everything except debug messages
 * auto filter = not_filter{level_range_filter{log_level::debug, log_level::debug}};
 * @endcode
 */
template <typename Filter> struct not_filter final
{
    Filter wrapped;

    bool operator()(const log_entry &entry) const { return !wrapped(entry); }
};

template <typename Filter> not_filter(Filter) -> not_filter<Filter>;

} // namespace relaylog
