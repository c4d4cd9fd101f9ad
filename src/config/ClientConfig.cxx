// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "ClientConfig.hxx"
#include "Block.hxx"
#include "Parser.hxx"
#include "util/CharUtil.hxx"
#include "util/RuntimeError.hxx"

#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <string_view>

static constexpr unsigned MAX_PORT = 65535;

static unsigned
ParsePort(const char *s)
{
	const unsigned port = ParsePositive(s);
	if (port > MAX_PORT)
		throw FmtRuntimeError("Port number out of range: {}", port);

	return port;
}

[[gnu::pure]]
static bool
IsArtworkCommand(std::string_view name) noexcept
{
	return name == "albumart" || name == "readpicture";
}

std::vector<std::string>
ParseArtworkCommands(const char *s)
{
	std::vector<std::string> result;

	const std::string_view src{s};
	std::size_t i = 0;
	while (i < src.size()) {
		if (IsWhitespaceOrNull(src[i])) {
			++i;
			continue;
		}

		std::size_t end = i;
		while (end < src.size() && !IsWhitespaceOrNull(src[end]))
			++end;

		const auto name = src.substr(i, end - i);
		if (!IsArtworkCommand(name))
			throw FmtRuntimeError("Unsupported artwork command: \"{}\"",
					      name);

		result.emplace_back(name);
		i = end;
	}

	if (result.empty())
		throw std::runtime_error("No artwork command configured");

	return result;
}

ClientConfig::ClientConfig(const ConfigBlock &block)
{
	if (const auto *p = block.GetBlockParam("host")) {
		if (p->value.empty())
			throw FmtRuntimeError("Empty host on line {}", p->line);
		host = p->value;
	}

	if (const auto *p = block.GetBlockParam("port"))
		port = p->With(ParsePort);

	password = block.GetBlockValue("password", "");

	if (const auto *p = block.GetBlockParam("artwork_commands"))
		artwork_commands = p->With(ParseArtworkCommands);

	timeout = block.GetDuration("timeout", std::chrono::milliseconds(1),
				    DEFAULT_TIMEOUT);
	reconnect_interval = block.GetDuration("reconnect_interval",
					       std::chrono::milliseconds(1),
					       DEFAULT_RECONNECT_INTERVAL);
}

void
ClientConfig::ApplyEnvironment(const char *mpd_host, const char *mpd_port)
{
	if (mpd_host != nullptr && *mpd_host != 0) {
		std::string_view value{mpd_host};

		/* a leading '@' denotes an abstract socket, not an
		   empty password */
		const auto at = value.find('@', 1);
		if (at != value.npos && at + 1 < value.size()) {
			password = value.substr(0, at);
			value = value.substr(at + 1);
		}

		host = value;
	}

	if (mpd_port != nullptr && *mpd_port != 0) {
		try {
			port = ParsePort(mpd_port);
		} catch (...) {
			std::throw_with_nested(std::runtime_error("Malformed MPD_PORT"));
		}
	}
}

void
ClientConfig::LoadEnvironment()
{
	ApplyEnvironment(std::getenv("MPD_HOST"), std::getenv("MPD_PORT"));
}
