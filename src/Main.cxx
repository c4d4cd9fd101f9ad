// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "cmdline/CommandLine.hxx"
#include "client/ArtworkConnection.hxx"
#include "client/CommandConnection.hxx"
#include "client/IdleConnection.hxx"
#include "client/IdleLoop.hxx"
#include "client/Queries.hxx"
#include "config/Block.hxx"
#include "config/Check.hxx"
#include "config/ClientConfig.hxx"
#include "config/File.hxx"
#include "protocol/IdleFlags.hxx"
#include "system/Error.hxx"
#include "util/Domain.hxx"
#include "util/Exception.hxx"
#include "util/RuntimeError.hxx"
#include "util/ScopeExit.hxx"
#include "LogBackend.hxx"
#include "Log.hxx"

#include <fmt/core.h>

#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

static constexpr Domain main_domain("main");

static ClientConfig
LoadConfig(const CommandLineOptions &options)
{
	ClientConfig config;

	if (options.config_file != nullptr) {
		const auto block = ReadConfigFile(options.config_file);
		config = ClientConfig{block};
		CheckUnusedParams(block);
	}

	config.LoadEnvironment();

	if (options.host != nullptr)
		config.host = options.host;

	if (options.port != 0)
		config.port = options.port;

	return config;
}

static const char *
ToString(PlayerState state) noexcept
{
	switch (state) {
	case PlayerState::STOP:
		return "stop";

	case PlayerState::PAUSE:
		return "pause";

	case PlayerState::PLAY:
		return "play";
	}

	return "unknown";
}

static void
PrintSong(const Song &song)
{
	if (song.position)
		fmt::print("{:>4} ", *song.position + 1);

	fmt::print("{} - {} ({})\n", song.artist, song.title, song.file);
}

static void
PrintStatus(const PlayerStatus &status)
{
	if (status.state)
		fmt::print("state: {}\n", ToString(*status.state));
	if (status.volume)
		fmt::print("volume: {}\n", *status.volume);
	if (status.elapsed)
		fmt::print("elapsed: {:.1f}\n", *status.elapsed);
	if (status.consume)
		fmt::print("consume: {}\n", *status.consume ? "on" : "off");
	if (status.random)
		fmt::print("random: {}\n", *status.random ? "on" : "off");
	if (status.repeat)
		fmt::print("repeat: {}\n", *status.repeat ? "on" : "off");
	if (status.song) {
		fmt::print("song: ");
		PrintSong(*status.song);
	}
}

static void
PrintStats(const DatabaseStats &stats)
{
	const auto print = [](const char *name,
			      const std::optional<unsigned long> &value){
		if (value)
			fmt::print("{}: {}\n", name, *value);
	};

	print("artists", stats.artists);
	print("albums", stats.albums);
	print("songs", stats.songs);
	print("uptime", stats.uptime);
	print("playtime", stats.playtime);
	print("last update", stats.last_update);
}

static unsigned
ParseIdleMask(std::span<const char *const> names)
{
	unsigned mask = 0;
	for (const char *name : names) {
		const unsigned flag = idle_parse_name(name);
		if (flag == 0)
			throw FmtRuntimeError("Unknown idle event: {}", name);
		mask |= flag;
	}

	return mask;
}

static void
WriteFile(const char *path, std::span<const std::byte> data)
{
	const int fd = open(path, O_WRONLY|O_CREAT|O_TRUNC|O_CLOEXEC, 0666);
	if (fd < 0)
		throw MakeErrno(fmt::format("Failed to create {}", path).c_str());

	AtScopeExit(fd) { close(fd); };

	while (!data.empty()) {
		const auto nbytes = write(fd, data.data(), data.size());
		if (nbytes < 0)
			throw MakeErrno(fmt::format("Failed to write {}", path).c_str());

		data = data.subspan(static_cast<std::size_t>(nbytes));
	}
}

/**
 * Prints idle events to stdout and errors to the log.
 */
class PrintIdleListener final : public IdleListener {
public:
	/* virtual methods from IdleListener */
	void OnIdleEvent(IdleEvent event) noexcept override {
		fmt::print("changed: {}\n", idle_event_name(event));
		std::fflush(stdout);
	}

	void OnIdleError(std::exception_ptr error) noexcept override {
		LogError(error, "Idle connection failed");
	}
};

/**
 * Run the idle loop until SIGINT or SIGTERM is received.
 */
static void
Watch(const ClientConfig &config)
{
	EnableLogTimestamp();

	sigset_t signals;
	sigemptyset(&signals);
	sigaddset(&signals, SIGINT);
	sigaddset(&signals, SIGTERM);

	/* block the signals before starting the thread so it
	   inherits the mask and sigwait() below receives them */
	if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0)
		throw std::runtime_error("pthread_sigmask() failed");

	PrintIdleListener listener;
	IdleLoop loop(config, 0, listener);
	loop.Start();

	int sig;
	sigwait(&signals, &sig);

	FmtDebug(main_domain, "received signal {}, stopping", sig);
	loop.Stop();
}

static void
RunCommand(const ClientConfig &config, std::span<const char *const> args)
{
	const std::string_view command{args.front()};
	args = args.subspan(1);

	const auto expect_arguments = [&](std::size_t min, std::size_t max){
		if (args.size() < min || args.size() > max)
			throw FmtRuntimeError("Wrong number of arguments for \"{}\"",
					      command);
	};

	if (command == "status"sv) {
		expect_arguments(0, 0);
		CommandConnection c(config);
		c.WithConnection([&]{ PrintStatus(GetStatus(c)); });
	} else if (command == "stats"sv) {
		expect_arguments(0, 0);
		CommandConnection c(config);
		c.WithConnection([&]{ PrintStats(GetStats(c)); });
	} else if (command == "outputs"sv) {
		expect_arguments(0, 0);
		CommandConnection c(config);
		c.WithConnection([&]{
			for (const auto &i : GetOutputs(c))
				fmt::print("{}: {} ({}) {}\n", i.id, i.name, i.plugin,
					   i.enabled ? "enabled" : "disabled");
		});
	} else if (command == "playlists"sv) {
		expect_arguments(0, 0);
		CommandConnection c(config);
		c.WithConnection([&]{
			for (const auto &i : GetPlaylists(c))
				fmt::print("{}\n", i.name);
		});
	} else if (command == "queue"sv) {
		expect_arguments(0, 0);
		CommandConnection c(config);
		c.WithConnection([&]{
			for (const auto &i : GetSongs(c, QueueSource{}))
				PrintSong(i);
		});
	} else if (command == "run"sv) {
		expect_arguments(1, SIZE_MAX);
		const std::vector<std::string> commands(args.begin(), args.end());

		CommandConnection c(config);
		c.WithConnection([&]{
			for (const auto &line : c.Run(commands))
				fmt::print("{}\n", line);
		});
	} else if (command == "idle"sv) {
		const unsigned mask = ParseIdleMask(args);

		IdleConnection c(config);
		c.WithConnection([&]{
			const unsigned events = c.IdleForEventMask(mask);
			for (const char *const*name = idle_get_names(); *name != nullptr; ++name)
				if (events & idle_parse_name(*name))
					fmt::print("changed: {}\n", *name);
		});
	} else if (command == "watch"sv) {
		expect_arguments(0, 0);
		Watch(config);
	} else if (command == "artwork"sv) {
		expect_arguments(2, 2);

		ArtworkConnection c(config);
		const auto data = c.WithConnection([&]{
			return c.GetArtworkData(args[0]);
		});

		WriteFile(args[1], data);
		FmtInfo(main_domain, "wrote {} bytes to {}", data.size(), args[1]);
	} else if (command == "play"sv) {
		expect_arguments(0, 1);

		CommandConnection c(config);
		c.WithConnection([&]{
			if (args.empty()) {
				c.Run({"play"});
				return;
			}

			Song song;
			song.file = args[0];
			c.Play(song);
		});
	} else if (command == "pause"sv) {
		expect_arguments(0, 0);
		CommandConnection c(config);
		c.WithConnection([&]{ c.Pause(true); });
	} else if (command == "next"sv) {
		expect_arguments(0, 0);
		CommandConnection c(config);
		c.WithConnection([&]{ c.Next(); });
	} else if (command == "previous"sv) {
		expect_arguments(0, 0);
		CommandConnection c(config);
		c.WithConnection([&]{ c.Previous(); });
	} else if (command == "stop"sv) {
		expect_arguments(0, 0);
		CommandConnection c(config);
		c.WithConnection([&]{ c.Stop(); });
	} else
		throw FmtRuntimeError("Unknown command: \"{}\"", command);
}

int
main(int argc, char *argv[]) noexcept
try {
	CommandLineOptions options;
	ParseCommandLine(argc, argv, options);

	SetLogThreshold(options.verbose ? LogLevel::DEBUG : LogLevel::NOTICE);

	const auto config = LoadConfig(options);
	RunCommand(config, options.arguments);
	return EXIT_SUCCESS;
} catch (...) {
	LogError(std::current_exception());
	return EXIT_FAILURE;
}
