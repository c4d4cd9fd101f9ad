// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Version.hxx"

#include <fmt/format.h>

#include <charconv>

using std::string_view_literals::operator""sv;

static constexpr std::string_view GREETING_PREFIX = "OK MPD "sv;

std::string
ProtocolVersion::ToString() const noexcept
{
	return fmt::format("{}.{}.{}", major, minor, patch);
}

bool
IsGreeting(std::string_view line) noexcept
{
	return line.starts_with(GREETING_PREFIX);
}

/**
 * Parse a decimal number at the beginning of #s and remove it.
 */
static bool
ShiftNumber(std::string_view &s, unsigned &value) noexcept
{
	auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
	if (ec != std::errc{})
		return false;

	s.remove_prefix(ptr - s.data());
	return true;
}

std::optional<ProtocolVersion>
ParseGreeting(std::string_view line) noexcept
{
	if (!IsGreeting(line))
		return std::nullopt;

	std::string_view s = line.substr(GREETING_PREFIX.size());

	ProtocolVersion version;
	if (!ShiftNumber(s, version.major) || !s.starts_with('.'))
		return std::nullopt;

	s.remove_prefix(1);
	if (!ShiftNumber(s, version.minor))
		return std::nullopt;

	if (s.starts_with('.')) {
		s.remove_prefix(1);
		if (!ShiftNumber(s, version.patch))
			return std::nullopt;
	}

	if (!s.empty())
		return std::nullopt;

	return version;
}
