// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <cstddef>

/**
 * Each connection is dedicated to one purpose.
 */
enum class ConnectionMode {
	/**
	 * Waits for "idle" events.
	 */
	IDLE,

	/**
	 * Queries and playback control.
	 */
	COMMAND,

	/**
	 * Downloads artwork with "albumart" and "readpicture".
	 */
	ARTWORK,
};

/**
 * The maximum number of bytes received from the socket at a time.
 */
constexpr std::size_t
GetReceiveSize(ConnectionMode mode) noexcept
{
	return mode == ConnectionMode::ARTWORK ? 8192 : 4096;
}

[[gnu::const]]
const char *
ToString(ConnectionMode mode) noexcept;
