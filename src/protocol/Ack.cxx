// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Ack.hxx"

#include <charconv>

using std::string_view_literals::operator""sv;

bool
IsAckLine(std::string_view line) noexcept
{
	return line.starts_with("ACK"sv);
}

bool
IsTerminalLine(std::string_view line) noexcept
{
	return line.starts_with("OK"sv) || IsAckLine(line);
}

/**
 * Parse a decimal number at the beginning of #s and remove it.
 * Returns 0 if there is none.
 */
static unsigned
ShiftNumber(std::string_view &s) noexcept
{
	unsigned value = 0;
	auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
	if (ec != std::errc{})
		return 0;

	s.remove_prefix(ptr - s.data());
	return value;
}

ProtocolError
ParseAck(std::string_view line)
{
	unsigned code = 0, list_index = 0;
	std::string_view command;

	std::string_view s = line;
	if (s.starts_with("ACK ["sv)) {
		s.remove_prefix(5);
		code = ShiftNumber(s);

		if (s.starts_with('@')) {
			s.remove_prefix(1);
			list_index = ShiftNumber(s);
		}

		if (s.starts_with("] {"sv)) {
			s.remove_prefix(3);

			const auto end = s.find('}');
			if (end != s.npos)
				command = s.substr(0, end);
		}
	}

	return ProtocolError(static_cast<enum ack>(code), list_index,
			     command, std::string{line});
}
