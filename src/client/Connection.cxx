// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Connection.hxx"
#include "Domain.hxx"
#include "Error.hxx"
#include "SocketIO.hxx"
#include "net/SocketConnect.hxx"
#include "protocol/Quote.hxx"
#include "Log.hxx"

#include <fmt/format.h>

#include <chrono>
#include <exception>

using std::string_view_literals::operator""sv;

const char *
ToString(ConnectionMode mode) noexcept
{
	switch (mode) {
	case ConnectionMode::IDLE:
		return "idle";

	case ConnectionMode::COMMAND:
		return "command";

	case ConnectionMode::ARTWORK:
		return "artwork";
	}

	return "unknown";
}

Connection::Connection(const ClientConfig &_config,
		       ConnectionMode _mode) noexcept
	:config(_config), mode(_mode),
	 reader(*this, GetReceiveSize(_mode))
{
}

Connection::~Connection() noexcept
{
	DisconnectLocked();
}

bool
Connection::IsConnected() const noexcept
{
	const std::lock_guard lock{socket_mutex};
	return socket.IsDefined();
}

std::optional<ProtocolVersion>
Connection::GetVersion() const noexcept
{
	const std::lock_guard lock{socket_mutex};
	return version;
}

void
Connection::Connect()
{
	const std::lock_guard lock{mutex};
	ConnectLocked();
}

void
Connection::ConnectLocked()
{
	if (socket.IsDefined())
		return;

	std::optional<ProtocolVersion> new_version;

	try {
		auto s = ResolveConnectSocket(config.host.c_str(), config.port,
					      std::chrono::duration_cast<std::chrono::milliseconds>(config.timeout));

		{
			const std::lock_guard lock{socket_mutex};
			socket = std::move(s);
		}

		reader.Reset();

		const auto greeting = ReadLine();
		new_version = ParseGreeting(greeting);
		if (!new_version)
			throw ClientError(ClientErrorCode::MALFORMED,
					  "Missing OK MPD line from server greeting");
	} catch (...) {
		DisconnectLocked();
		std::throw_with_nested(ClientError(ClientErrorCode::CONNECTION,
						   fmt::format("Failed to connect to MPD '{}'",
							       config.host)));
	}

	if (*new_version < MIN_PROTOCOL_VERSION) {
		DisconnectLocked();
		throw ClientError(ClientErrorCode::UNSUPPORTED_VERSION,
				  fmt::format("Unsupported MPD server version {}, minimum required version is {}",
					      new_version->ToString(),
					      MIN_PROTOCOL_VERSION.ToString()));
	}

	{
		const std::lock_guard lock{socket_mutex};
		version = new_version;
	}

	if (!config.password.empty()) {
		const std::string command = "password " + QuoteArgument(config.password);

		/* an "ACK" means the password is wrong; don't keep
		   an unauthenticated connection around */
		try {
			RunLocked({&command, 1});
		} catch (...) {
			DisconnectLocked();
			throw;
		}
	}

	FmtDebug(client_domain, "connected to '{}' (protocol {}, {} mode)",
		 config.host, new_version->ToString(), ToString(mode));
}

void
Connection::Disconnect() noexcept
{
	const std::lock_guard lock{mutex};
	DisconnectLocked();
}

void
Connection::DisconnectLocked() noexcept
{
	{
		const std::lock_guard lock{socket_mutex};
		if (!socket.IsDefined())
			return;

		socket.Close();
		version.reset();
	}

	reader.Reset();

	FmtDebug(client_domain, "disconnected from '{}' ({} mode)",
		 config.host, ToString(mode));
}

void
Connection::Interrupt() noexcept
{
	const std::lock_guard lock{socket_mutex};
	if (socket.IsDefined())
		socket.Shutdown();
}

[[gnu::pure]]
static bool
IsIdleCommand(std::string_view name) noexcept
{
	return name == "idle"sv || name == "noidle"sv;
}

[[gnu::pure]]
static bool
IsArtworkCommand(std::string_view name) noexcept
{
	return name == "albumart"sv || name == "readpicture"sv;
}

void
Connection::CheckMode(std::string_view command) const
{
	const auto name = command.substr(0, command.find(' '));

	const bool allowed = IsIdleCommand(name)
		? mode == ConnectionMode::IDLE
		: (IsArtworkCommand(name)
		   ? mode == ConnectionMode::ARTWORK
		   : true);

	if (!allowed)
		throw ClientError(ClientErrorCode::WRONG_MODE,
				  fmt::format("Command \"{}\" is not allowed on a {} connection",
					      name, ToString(mode)));
}

std::size_t
Connection::Read(std::span<std::byte> dest)
{
	return SocketReader{socket}.Read(dest);
}

void
Connection::WriteLine(std::string_view line)
{
	if (!socket.IsDefined())
		throw ClientError(ClientErrorCode::CONNECTION, "Not connected");

	std::string buffer;
	buffer.reserve(line.size() + 1);
	buffer.append(line);
	buffer.push_back('\n');

	SendFull(socket, std::as_bytes(std::span{buffer}));
}

std::string
Connection::ReadLine()
{
	if (!socket.IsDefined())
		throw ClientError(ClientErrorCode::CONNECTION, "Not connected");

	return reader.ReadLine();
}

std::vector<std::byte>
Connection::ReadFixed(std::size_t length)
{
	if (!socket.IsDefined())
		throw ClientError(ClientErrorCode::CONNECTION, "Not connected");

	return reader.ReadFixed(length);
}

std::vector<std::string>
Connection::ReadResponse()
{
	std::vector<std::string> lines;

	while (true) {
		auto line = ReadLine();
		if (IsAckLine(line))
			throw ParseAck(line);

		const bool terminal = IsTerminalLine(line);
		lines.emplace_back(std::move(line));
		if (terminal)
			return lines;
	}
}

std::vector<std::string>
Connection::RunLocked(std::span<const std::string> commands)
{
	if (commands.empty())
		return {};

	for (const auto &i : commands)
		CheckMode(i);

	const bool list = commands.size() > 1;

	std::string payload;
	if (list)
		payload = "command_list_begin\n";

	bool first = true;
	for (const auto &i : commands) {
		if (!first)
			payload.push_back('\n');
		first = false;

		payload += i;
	}

	if (list)
		payload += "\ncommand_list_end";

	return DisconnectOnError([this, &payload]{
		WriteLine(payload);
		return ReadResponse();
	});
}

std::vector<std::string>
Connection::Run(std::span<const std::string> commands)
{
	const std::lock_guard lock{mutex};
	return RunLocked(commands);
}
