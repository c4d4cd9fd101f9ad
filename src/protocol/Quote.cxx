// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Quote.hxx"

static std::string
Quote(std::string_view src, char quote) noexcept
{
	std::string result;
	result.reserve(src.size() + 2);

	result.push_back(quote);

	for (char ch : src) {
		if (ch == '\\' || ch == quote)
			result.push_back('\\');
		result.push_back(ch);
	}

	result.push_back(quote);
	return result;
}

std::string
QuoteArgument(std::string_view src) noexcept
{
	return Quote(src, '"');
}

std::string
QuoteFilterValue(std::string_view src) noexcept
{
	return Quote(src, '\'');
}
