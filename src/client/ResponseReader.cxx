// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "ResponseReader.hxx"
#include "Error.hxx"
#include "util/UTF8.hxx"

#include <exception>

std::string
ResponseReader::ReadLine()
{
	const char *line;
	try {
		line = reader.ReadTerminatedLine();
	} catch (const LineTooLongError &) {
		std::throw_with_nested(ClientError(ClientErrorCode::MALFORMED,
						   "Response line too long"));
	}

	if (line == nullptr)
		throw ClientError(ClientErrorCode::CLOSED,
				  "Connection closed by server");

	std::string_view value{line};
	if (!ValidateUTF8(value))
		throw ClientError(ClientErrorCode::MALFORMED,
				  "Response line is not valid UTF-8");

	return std::string{value};
}

std::vector<std::byte>
ResponseReader::ReadFixed(std::size_t length)
{
	std::vector<std::byte> result(length);

	std::span<std::byte> dest{result};
	while (true) {
		dest = dest.subspan(reader.ReadFromBuffer(dest));
		if (dest.empty())
			break;

		if (!reader.Fill(true))
			throw ClientError(ClientErrorCode::CLOSED,
					  "Connection closed by server");
	}

	return result;
}
