/**
 * @file log_utils.hpp
 * @brief Common utilities for the relaylog logging library
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <string_view>

namespace relaylog
{

namespace detail
{

/**
 * @brief Simple wildcard pattern matching utility
 *
 * Supports patterns with * at the beginning and/or end:
 * - "prefix*" matches strings starting with "prefix"
 * - "*suffix" matches strings ending with "suffix"
 * - "*infix*" matches strings containing "infix"
 * - "exact" matches only "exact"
 *
 * @param text The text to match against
 * @param pattern The pattern with optional wildcards
 * @return true if the text matches the pattern
 */
inline bool wildcard_match(std::string_view text, std::string_view pattern) noexcept
{
    if (pattern.empty()) return text.empty();

    bool prefix_match = pattern.back() == '*';
    bool suffix_match = pattern.front() == '*';

    std::string_view literal = pattern;
    if (prefix_match) literal.remove_suffix(1);
    if (suffix_match && !literal.empty()) literal.remove_prefix(1);

    if (literal.empty()) return true; // "*" matches everything

    if (prefix_match && suffix_match) return text.find(literal) != std::string_view::npos;
    if (prefix_match) return text.substr(0, literal.size()) == literal;
    if (suffix_match) return text.size() >= literal.size() && text.substr(text.size() - literal.size()) == literal;
    return text == literal;
}

/**
 * @brief True when @p text is empty or only contains whitespace
 */
inline bool is_blank(std::string_view text) noexcept
{
    return text.find_first_not_of(" \t\n\r\f\v") == std::string_view::npos;
}

} // namespace detail

} // namespace relaylog
