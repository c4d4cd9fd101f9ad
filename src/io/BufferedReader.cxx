// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "BufferedReader.hxx"
#include "Reader.hxx"

#include <algorithm> // for std::copy_n()
#include <cstring>
#include <stdexcept>

/**
 * Find the first line in the buffer, null-terminate it (removing
 * the "\n" and an optional "\r" before it) and consume it.
 *
 * @return the line or nullptr if the buffer contains no newline
 */
static char *
ReadBufferedLine(DynamicFifoBuffer<std::byte> &buffer) noexcept
{
	auto r = buffer.Read();
	char *data = reinterpret_cast<char *>(r.data());
	char *newline = reinterpret_cast<char *>(std::memchr(data, '\n', r.size()));
	if (newline == nullptr)
		return nullptr;

	buffer.Consume(newline + 1 - data);

	if (newline > data && newline[-1] == '\r')
		--newline;
	*newline = 0;
	return data;
}

bool
BufferedReader::Fill(bool need_more)
{
	if (eof)
		return !need_more;

	if (buffer.GetAvailable() >= MAX_SIZE)
		throw LineTooLongError();

	const auto w = buffer.Write(read_size).first(read_size);

	std::size_t nbytes = reader.Read(w);
	if (nbytes == 0) {
		eof = true;
		return !need_more;
	}

	buffer.Append(nbytes);
	return true;
}

std::size_t
BufferedReader::ReadFromBuffer(std::span<std::byte> dest) noexcept
{
	const auto src = Read();
	std::size_t nbytes = std::min(src.size(), dest.size());
	std::copy_n(src.data(), nbytes, dest.data());
	Consume(nbytes);
	return nbytes;
}

void
BufferedReader::ReadFull(std::span<std::byte> dest)
{
	while (true) {
		std::size_t nbytes = ReadFromBuffer(dest);
		dest = dest.subspan(nbytes);
		if (dest.empty())
			break;

		if (!Fill(true))
			throw std::runtime_error("Premature end of file");
	}
}

char *
BufferedReader::ReadTerminatedLine()
{
	do {
		char *line = ReadBufferedLine(buffer);
		if (line != nullptr) {
			++line_number;
			return line;
		}
	} while (Fill(true));

	return nullptr;
}

char *
BufferedReader::ReadLine()
{
	char *line = ReadTerminatedLine();
	if (line != nullptr || buffer.empty())
		return line;

	/* terminate the last line */
	const auto r = buffer.Read();
	const std::size_t length = r.size();
	buffer.Write(1);

	line = reinterpret_cast<char *>(buffer.Read().data());
	line[length] = 0;
	buffer.Clear();
	++line_number;
	return line;
}
