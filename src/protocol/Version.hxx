// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <compare>
#include <optional>
#include <string>
#include <string_view>

/**
 * The protocol version announced in the server's greeting.
 */
struct ProtocolVersion {
	unsigned major = 0, minor = 0, patch = 0;

	constexpr auto operator<=>(const ProtocolVersion &) const noexcept = default;

	std::string ToString() const noexcept;
};

/**
 * The oldest server version supported by this library.
 */
static constexpr ProtocolVersion MIN_PROTOCOL_VERSION{0, 22, 0};

/**
 * Does the line look like a server greeting ("OK MPD ...")?
 */
[[gnu::pure]]
bool
IsGreeting(std::string_view line) noexcept;

/**
 * Parse the version from a greeting line such as "OK MPD 0.23.5".
 * The patch level is optional.
 *
 * @return the version or std::nullopt if the line is malformed
 */
[[gnu::pure]]
std::optional<ProtocolVersion>
ParseGreeting(std::string_view line) noexcept;
