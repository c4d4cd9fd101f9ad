// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MPDLINK_ACK_H
#define MPDLINK_ACK_H

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

/**
 * Error codes of "ACK" responses.  Servers may send codes not
 * listed here.
 */
enum ack : unsigned {
	ACK_ERROR_NOT_LIST = 1,
	ACK_ERROR_ARG = 2,
	ACK_ERROR_PASSWORD = 3,
	ACK_ERROR_PERMISSION = 4,
	ACK_ERROR_UNKNOWN = 5,

	ACK_ERROR_NO_EXIST = 50,
	ACK_ERROR_PLAYLIST_MAX = 51,
	ACK_ERROR_SYSTEM = 52,
	ACK_ERROR_PLAYLIST_LOAD = 53,
	ACK_ERROR_UPDATE_ALREADY = 54,
	ACK_ERROR_PLAYER_SYNC = 55,
	ACK_ERROR_EXIST = 56,
};

/**
 * The server has rejected a command with an "ACK" response.  The
 * exception message is the raw "ACK" line.
 */
class ProtocolError : public std::runtime_error {
	enum ack code;

	/**
	 * The position of the failed command within a command list;
	 * 0 for a single command.
	 */
	unsigned list_index = 0;

	/**
	 * The name of the failed command as reported by the server;
	 * may be empty.
	 */
	std::string command;

public:
	template<typename M>
	ProtocolError(enum ack _code, M &&msg)
		:std::runtime_error(std::forward<M>(msg)), code(_code) {}

	template<typename M>
	ProtocolError(enum ack _code, unsigned _list_index,
		      std::string_view _command, M &&msg)
		:std::runtime_error(std::forward<M>(msg)), code(_code),
		 list_index(_list_index), command(_command) {}

	enum ack GetCode() const noexcept {
		return code;
	}

	unsigned GetListIndex() const noexcept {
		return list_index;
	}

	const std::string &GetCommand() const noexcept {
		return command;
	}
};

/**
 * Does this response line begin with "ACK"?
 */
[[gnu::pure]]
bool
IsAckLine(std::string_view line) noexcept;

/**
 * Does this response line terminate a response, i.e. does it begin
 * with "OK" or "ACK"?
 */
[[gnu::pure]]
bool
IsTerminalLine(std::string_view line) noexcept;

/**
 * Convert an "ACK [code@index] {command} message" line to a
 * #ProtocolError.  Parts which cannot be parsed are left at zero or
 * empty; the raw line is always preserved.
 */
ProtocolError
ParseAck(std::string_view line);

#endif
