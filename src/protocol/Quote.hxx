// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <string>
#include <string_view>

/**
 * Wrap a command argument in double quotes, escaping backslashes
 * and double quotes.
 */
[[gnu::pure]]
std::string
QuoteArgument(std::string_view src) noexcept;

/**
 * Wrap a value inside a filter expression in single quotes,
 * escaping backslashes and single quotes.
 */
[[gnu::pure]]
std::string
QuoteFilterValue(std::string_view src) noexcept;
