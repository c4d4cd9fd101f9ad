// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "io/BufferedReader.hxx"

#include <cstddef>
#include <string>
#include <vector>

class Reader;

/**
 * Splits the byte stream received from the server into response
 * lines and binary payloads.  The buffer is shared between both,
 * so bytes received beyond a line are available to the following
 * ReadFixed() call and vice versa.
 */
class ResponseReader {
	BufferedReader reader;

public:
	/**
	 * @param receive_size the maximum number of bytes to
	 * receive from the #Reader at a time
	 */
	ResponseReader(Reader &_reader, std::size_t receive_size) noexcept
		:reader(_reader, receive_size) {}

	/**
	 * Discard all buffered data.
	 */
	void Reset() noexcept {
		reader.Reset();
	}

	[[gnu::pure]]
	bool IsEmpty() const noexcept {
		return reader.empty();
	}

	/**
	 * Read the next line without the trailing "\n" (and "\r").
	 *
	 * Throws #ClientError with #ClientErrorCode::CLOSED if the
	 * peer closes the connection before the line is complete,
	 * and #ClientErrorCode::MALFORMED if the line is not valid
	 * UTF-8.
	 */
	std::string ReadLine();

	/**
	 * Read exactly the given number of bytes.
	 *
	 * Throws #ClientError with #ClientErrorCode::CLOSED if the
	 * peer closes the connection prematurely.
	 */
	std::vector<std::byte> ReadFixed(std::size_t length);
};
