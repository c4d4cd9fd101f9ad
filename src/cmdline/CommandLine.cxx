// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "CommandLine.hxx"
#include "OptionDef.hxx"
#include "OptionParser.hxx"
#include "config/Parser.hxx"
#include "util/RuntimeError.hxx"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <stdexcept>

enum Option {
	OPTION_CONFIG,
	OPTION_HOST,
	OPTION_PORT,
	OPTION_VERBOSE,
	OPTION_VERSION,
	OPTION_HELP,
	OPTION_HELP2,
};

static constexpr OptionDef option_defs[] = {
	{"config", 'c', "FILE", "read settings from this file"},
	{"host", 0, "HOST", "connect to this host or local socket"},
	{"port", 'p', "PORT", "connect to this port"},
	{"verbose", 'v', "verbose logging"},
	{"version", 'V', "print version number"},
	{"help", 'h', "show help options"},
	{nullptr, '?', nullptr}, // hidden, standard alias for --help
};

[[noreturn]]
static void version()
{
	printf("mpdlink " MPDLINK_VERSION "\n"
	       "\n"
	       "Copyright The Music Player Daemon Project\n"
	       "License GPLv2+: GNU GPL version 2 or later <http://gnu.org/licenses/gpl.html>\n"
	       "This is free software: you are free to change and redistribute it.\n"
	       "There is NO WARRANTY, to the extent permitted by law.\n");

	std::exit(EXIT_SUCCESS);
}

static void PrintOption(const OptionDef &opt)
{
	char long_option[32];
	if (opt.HasValue())
		snprintf(long_option, sizeof(long_option), "%s %s",
			 opt.GetLongOption(), opt.GetValueName());
	else
		snprintf(long_option, sizeof(long_option), "%s",
			 opt.GetLongOption());

	if (opt.HasShortOption())
		printf("  -%c, --%-16s%s\n",
		       opt.GetShortOption(),
		       long_option,
		       opt.GetDescription());
	else
		printf("      --%-16s%s\n",
		       long_option,
		       opt.GetDescription());
}

[[noreturn]]
static void help()
{
	printf("Usage:\n"
	       "  mpdlink [OPTION...] COMMAND [ARG...]\n"
	       "\n"
	       "A client for the Music Player Daemon.\n"
	       "\n"
	       "Commands:\n"
	       "  status             show the player status and the current song\n"
	       "  stats              show database statistics\n"
	       "  outputs            list audio outputs\n"
	       "  playlists          list stored playlists\n"
	       "  queue              list the songs in the queue\n"
	       "  run CMD...         send raw commands (as a command list)\n"
	       "  idle [EVENT...]    wait for a change\n"
	       "  watch              print changes until interrupted\n"
	       "  artwork FILE OUT   download the artwork of FILE\n"
	       "  play [FILE]        start playback\n"
	       "  pause              pause playback\n"
	       "  next               play the next song\n"
	       "  previous           play the previous song\n"
	       "  stop               stop playback\n"
	       "\n"
	       "Options:\n");

	for (const auto &i : option_defs)
		if (i.HasDescription()) // hide hidden options from help print
			PrintOption(i);

	std::exit(EXIT_SUCCESS);
}

void
ParseCommandLine(int argc, char **argv, CommandLineOptions &options)
{
	OptionParser parser(option_defs, argc, argv);
	while (auto o = parser.Next()) {
		switch (Option(o.index)) {
		case OPTION_CONFIG:
			options.config_file = o.value;
			break;

		case OPTION_HOST:
			options.host = o.value;
			break;

		case OPTION_PORT:
			try {
				options.port = ParsePositive(o.value);
			} catch (...) {
				std::throw_with_nested(FmtRuntimeError("Malformed port: {}",
								       o.value));
			}
			break;

		case OPTION_VERBOSE:
			options.verbose = true;
			break;

		case OPTION_VERSION:
			version();

		case OPTION_HELP:
		case OPTION_HELP2:
			help();
		}
	}

	options.arguments = parser.GetRemaining();
	if (options.arguments.empty())
		throw std::runtime_error("No command specified; try --help");
}
