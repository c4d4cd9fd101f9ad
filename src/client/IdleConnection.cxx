// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "IdleConnection.hxx"
#include "Error.hxx"
#include "Response.hxx"

#include <fmt/format.h>

std::string
MakeIdleCommand(unsigned mask) noexcept
{
	std::string command = "idle";

	if ((mask & IDLE_ALL) == IDLE_ALL)
		return command;

	const char *const*names = idle_get_names();
	for (unsigned i = 0; names[i] != nullptr; ++i) {
		if (mask & (1U << i)) {
			command.push_back(' ');
			command += names[i];
		}
	}

	return command;
}

unsigned
ParseIdleResponse(std::span<const std::string> lines)
{
	unsigned mask = 0;

	for (const auto &line : lines) {
		if (line == "OK")
			continue;

		const auto [key, value] = ParsePair(line);
		if (key != "changed")
			continue;

		const unsigned flag = idle_parse_name(value);
		if (flag == 0)
			throw ClientError(ClientErrorCode::MALFORMED,
					  fmt::format("Received unknown idle event: {}",
						      value));

		mask |= flag;
	}

	if (mask == 0)
		throw ClientError(ClientErrorCode::MALFORMED,
				  "Missing 'changed' line");

	return mask;
}

unsigned
IdleConnection::IdleForEventMask(unsigned mask)
{
	return ParseIdleResponse(Run({MakeIdleCommand(mask)}));
}

IdleEvent
IdleConnection::IdleForEvents(unsigned mask)
{
	const auto lines = Run({MakeIdleCommand(mask)});

	/* the first "changed" line wins */
	for (const auto &line : lines) {
		if (line == "OK")
			continue;

		const auto [key, value] = ParsePair(line);
		if (key == "changed")
			return IdleEvent(ParseIdleResponse({&line, 1}));
	}

	throw ClientError(ClientErrorCode::MALFORMED,
			  "Missing 'changed' line");
}
