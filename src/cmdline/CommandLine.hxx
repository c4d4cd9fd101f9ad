// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MPDLINK_COMMAND_LINE_HXX
#define MPDLINK_COMMAND_LINE_HXX

#include <span>

struct CommandLineOptions {
	/**
	 * The configuration file specified with "--config".
	 */
	const char *config_file = nullptr;

	/**
	 * Overrides the configured host.
	 */
	const char *host = nullptr;

	/**
	 * Overrides the configured port; 0 if not specified.
	 */
	unsigned port = 0;

	bool verbose = false;

	/**
	 * The command name followed by its arguments.
	 */
	std::span<const char *const> arguments;
};

/**
 * Throws on error.
 */
void
ParseCommandLine(int argc, char **argv, CommandLineOptions &options);

#endif
