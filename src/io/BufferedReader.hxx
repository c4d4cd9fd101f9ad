// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "util/DynamicFifoBuffer.hxx"

#include <cstddef>
#include <span>
#include <stdexcept>

class Reader;

/**
 * Thrown by #BufferedReader when a line does not fit into the
 * buffer.
 */
class LineTooLongError : public std::runtime_error {
public:
	LineTooLongError()
		:std::runtime_error("Line too long") {}
};

/**
 * Adds a growable input buffer to a #Reader, allowing to read lines
 * and fixed-size blocks from the same stream.
 */
class BufferedReader {
	/**
	 * Lines longer than this are rejected.
	 */
	static constexpr std::size_t MAX_SIZE = 512 * 1024;

	Reader &reader;

	DynamicFifoBuffer<std::byte> buffer;

	/**
	 * The maximum number of bytes requested from the #Reader in
	 * one call.
	 */
	const std::size_t read_size;

	bool eof = false;

	unsigned line_number = 0;

public:
	explicit BufferedReader(Reader &_reader,
				std::size_t _read_size=16384) noexcept
		:reader(_reader), buffer(_read_size), read_size(_read_size) {}

	/**
	 * Reset the internal state, discarding all buffered data.
	 * Should be called after the underlying #Reader has been
	 * replaced or rewound.
	 */
	void Reset() noexcept {
		buffer.Clear();
		eof = false;
		line_number = 0;
	}

	/**
	 * Read more data from the #Reader into the buffer.
	 *
	 * Throws on error.
	 *
	 * @param need_more true if the caller needs more data; if
	 * false, this may return true even at end-of-stream
	 * @return false if no more data is available
	 */
	bool Fill(bool need_more);

	[[gnu::pure]]
	std::span<std::byte> Read() const noexcept {
		return buffer.Read();
	}

	void Consume(std::size_t n) noexcept {
		buffer.Consume(n);
	}

	[[gnu::pure]]
	bool empty() const noexcept {
		return buffer.empty();
	}

	/**
	 * Read (and consume) data from the input buffer into the
	 * given buffer.  Does not attempt to refill the buffer.
	 */
	std::size_t ReadFromBuffer(std::span<std::byte> dest) noexcept;

	/**
	 * Read data into the given buffer and consume it from our
	 * buffer.  Throw an exception if the request cannot be
	 * fulfilled.
	 */
	void ReadFull(std::span<std::byte> dest);

	/**
	 * Read one line and return it without the line terminator
	 * ("\n" or "\r\n").  At the end of the stream, an unterminated
	 * last line is returned as well.  The returned pointer is
	 * valid until the next call.
	 *
	 * @return the null-terminated line or nullptr on end-of-stream
	 */
	char *ReadLine();

	/**
	 * Like ReadLine(), but an unterminated line at the end of the
	 * stream is not returned.
	 */
	char *ReadTerminatedLine();

	unsigned GetLineNumber() const noexcept {
		return line_number;
	}
};
