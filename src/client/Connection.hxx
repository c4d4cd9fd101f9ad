// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "Mode.hxx"
#include "ResponseReader.hxx"
#include "config/ClientConfig.hxx"
#include "io/Reader.hxx"
#include "net/UniqueSocketDescriptor.hxx"
#include "protocol/Ack.hxx"
#include "protocol/Version.hxx"
#include "thread/Mutex.hxx"
#include "util/ScopeExit.hxx"

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * One connection to a MPD server, dedicated to one
 * #ConnectionMode.
 *
 * The connection is either fully disconnected or fully connected;
 * every failure which leaves the stream in an undefined state
 * disconnects.  All methods may be called from any thread, but
 * only one protocol exchange runs at a time.
 */
class Connection : Reader {
	const ClientConfig config;

	const ConnectionMode mode;

	/**
	 * Serializes protocol exchanges.  It is held while waiting
	 * for a response.
	 */
	mutable Mutex mutex;

	/**
	 * Protects #socket against concurrent Interrupt() calls.
	 */
	mutable Mutex socket_mutex;

	UniqueSocketDescriptor socket;

	ResponseReader reader;

	std::optional<ProtocolVersion> version;

public:
	Connection(const ClientConfig &_config, ConnectionMode _mode) noexcept;
	virtual ~Connection() noexcept;

	Connection(const Connection &) = delete;
	Connection &operator=(const Connection &) = delete;

	const ClientConfig &GetConfig() const noexcept {
		return config;
	}

	ConnectionMode GetMode() const noexcept {
		return mode;
	}

	[[gnu::pure]]
	bool IsConnected() const noexcept;

	/**
	 * The protocol version of the server; empty if not connected.
	 */
	[[gnu::pure]]
	std::optional<ProtocolVersion> GetVersion() const noexcept;

	/**
	 * Have bytes been received which were not yet consumed by a
	 * response?  Always false while disconnected.
	 */
	[[gnu::pure]]
	bool HasBufferedData() const noexcept {
		return !reader.IsEmpty();
	}

	/**
	 * Connect to the server, check its greeting and send the
	 * password (if one is configured).  Does nothing if already
	 * connected.
	 *
	 * Throws #ClientError with #ClientErrorCode::CONNECTION
	 * (with the cause nested) if the server cannot be reached,
	 * #ClientErrorCode::UNSUPPORTED_VERSION if it is too old and
	 * #ProtocolError if it rejects the password.  On error, the
	 * connection remains disconnected.
	 */
	void Connect();

	/**
	 * Close the socket and discard all buffered data.  Does
	 * nothing if not connected.
	 */
	void Disconnect() noexcept;

	/**
	 * Shut down the socket, causing a blocking read in another
	 * thread to fail with #ClientErrorCode::CLOSED.  The socket
	 * remains allocated until Disconnect() is called.
	 */
	void Interrupt() noexcept;

	/**
	 * Send commands and collect the response lines up to and
	 * including the terminating "OK".  More than one command is
	 * wrapped in a command list.
	 *
	 * Throws #ProtocolError if the server responds with "ACK",
	 * #ClientError with #ClientErrorCode::WRONG_MODE (before
	 * sending anything) if a command is not allowed on this
	 * connection and other exceptions on I/O errors (after
	 * disconnecting).
	 */
	std::vector<std::string> Run(std::span<const std::string> commands);

	std::vector<std::string> Run(std::initializer_list<std::string> commands) {
		return Run(std::span<const std::string>{commands.begin(), commands.size()});
	}

	/**
	 * Connect, invoke the function, disconnect.  The connection
	 * is closed even if the function throws.
	 */
	template<typename F>
	decltype(auto) WithConnection(F &&f) {
		Connect();
		AtScopeExit(this) { Disconnect(); };
		return f();
	}

protected:
	/**
	 * Throws #ClientError with #ClientErrorCode::WRONG_MODE if
	 * the command is not allowed on this connection.
	 */
	void CheckMode(std::string_view command) const;

	Mutex &GetMutex() const noexcept {
		return mutex;
	}

	/*
	 * The following methods require the caller to hold the
	 * mutex.
	 */

	void ConnectLocked();
	void DisconnectLocked() noexcept;

	/**
	 * Send one line (without the trailing newline).
	 *
	 * Throws #ClientError with #ClientErrorCode::CONNECTION if
	 * not connected.
	 */
	void WriteLine(std::string_view line);

	std::string ReadLine();
	std::vector<std::byte> ReadFixed(std::size_t length);

	/**
	 * Read lines up to and including the terminating "OK".
	 *
	 * Throws #ProtocolError on "ACK".
	 */
	std::vector<std::string> ReadResponse();

	std::vector<std::string> RunLocked(std::span<const std::string> commands);

	/**
	 * Invoke the function, and disconnect if it throws an
	 * exception other than #ProtocolError.
	 */
	template<typename F>
	decltype(auto) DisconnectOnError(F &&f) {
		try {
			return f();
		} catch (const ProtocolError &) {
			/* the connection is still usable */
			throw;
		} catch (...) {
			DisconnectLocked();
			throw;
		}
	}

private:
	/* virtual methods from class Reader */
	std::size_t Read(std::span<std::byte> dest) override;
};
