// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <chrono>
#include <string>
#include <vector>

struct ConfigBlock;

/**
 * Settings shared by all connections to one MPD server.
 */
struct ClientConfig {
	static constexpr unsigned DEFAULT_PORT = 6600;

	static constexpr std::chrono::steady_clock::duration DEFAULT_TIMEOUT =
		std::chrono::seconds(3);

	static constexpr std::chrono::steady_clock::duration DEFAULT_RECONNECT_INTERVAL =
		std::chrono::seconds(5);

	/**
	 * A host name, a numeric address or the path of a local
	 * socket (starting with '/', or '@' for an abstract socket).
	 */
	std::string host = "localhost";

	unsigned port = DEFAULT_PORT;

	/**
	 * Sent with the "password" command after connecting unless
	 * empty.
	 */
	std::string password;

	/**
	 * The commands tried, in this order, to download artwork.
	 */
	std::vector<std::string> artwork_commands{"albumart", "readpicture"};

	/**
	 * Limits the connect phase; reads are never timed out.
	 */
	std::chrono::steady_clock::duration timeout = DEFAULT_TIMEOUT;

	/**
	 * How long the idle loop waits before reconnecting.
	 */
	std::chrono::steady_clock::duration reconnect_interval =
		DEFAULT_RECONNECT_INTERVAL;

	ClientConfig() = default;

	/**
	 * Load settings from a configuration block, keeping the
	 * defaults for missing ones.  Throws on error.
	 */
	explicit ClientConfig(const ConfigBlock &block);

	/**
	 * Apply the values of the MPD_HOST and MPD_PORT environment
	 * variables.  MPD_HOST may have the form "password@host".
	 * Both arguments may be nullptr.
	 *
	 * Throws on error.
	 */
	void ApplyEnvironment(const char *mpd_host, const char *mpd_port);

	/**
	 * Like ApplyEnvironment(), but with getenv().
	 */
	void LoadEnvironment();
};

/**
 * Split a whitespace-separated list of artwork commands and check
 * that each one is known.  Throws on error.
 */
std::vector<std::string>
ParseArtworkCommands(const char *s);
