// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MPDLINK_CLIENT_ERROR_HXX
#define MPDLINK_CLIENT_ERROR_HXX

#include <stdexcept>
#include <utility>

enum class ClientErrorCode {
	/**
	 * The connection could not be established, or the operation
	 * requires a connection which does not exist.
	 */
	CONNECTION,

	/**
	 * The server has closed the connection in the middle of a
	 * response.
	 */
	CLOSED,

	/**
	 * The server has sent something which is not valid MPD
	 * protocol.
	 */
	MALFORMED,

	/**
	 * The requested operation is not supported for the given
	 * arguments.
	 */
	UNSUPPORTED,

	/**
	 * The command is not allowed on this kind of connection.
	 */
	WRONG_MODE,

	/**
	 * The server's protocol version is too old.
	 */
	UNSUPPORTED_VERSION,
};

class ClientError final : public std::runtime_error {
	ClientErrorCode code;

public:
	template<typename M>
	ClientError(ClientErrorCode _code, M &&msg)
		:std::runtime_error(std::forward<M>(msg)), code(_code) {}

	ClientErrorCode GetCode() const noexcept {
		return code;
	}
};

#endif
