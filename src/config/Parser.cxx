// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Parser.hxx"
#include "util/RuntimeError.hxx"

#include <cstdlib>
#include <string_view>

long
ParseLong(const char *s)
{
	char *endptr;
	long value = strtol(s, &endptr, 10);
	if (endptr == s || *endptr != 0)
		throw std::runtime_error("Failed to parse number");

	return value;
}

unsigned
ParseUnsigned(const char *s)
{
	auto value = ParseLong(s);
	if (value < 0)
		throw std::runtime_error("Value must not be negative");

	return (unsigned)value;
}

unsigned
ParsePositive(const char *s)
{
	auto value = ParseLong(s);
	if (value <= 0)
		throw std::runtime_error("Value must be positive");

	return (unsigned)value;
}

std::chrono::steady_clock::duration
ParseDuration(const char *s)
{
	char *endptr;
	const long value = strtol(s, &endptr, 10);
	if (endptr == s)
		throw std::runtime_error("Failed to parse number");

	if (value < 0)
		throw std::runtime_error("Value must not be negative");

	const std::string_view suffix{endptr};
	if (suffix.empty() || suffix == "s")
		return std::chrono::seconds(value);
	else if (suffix == "ms")
		return std::chrono::milliseconds(value);
	else
		throw FmtRuntimeError("Unknown duration suffix: \"{}\"", suffix);
}
