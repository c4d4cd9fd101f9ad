// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "ArtworkConnection.hxx"
#include "Error.hxx"
#include "Response.hxx"
#include "protocol/Quote.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <fmt/format.h>

#include <charconv>
#include <exception>
#include <optional>

static constexpr Domain artwork_domain("artwork");

static std::size_t
ParseSize(std::string_view s)
{
	std::size_t value;
	auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
	if (ec != std::errc{} || ptr != s.data() + s.size())
		throw ClientError(ClientErrorCode::MALFORMED,
				  fmt::format("Malformed chunk size: {}", s));

	return value;
}

std::vector<std::byte>
ArtworkConnection::FetchChunksLocked(std::string_view file,
				     std::string_view command)
{
	std::vector<std::byte> data;
	std::size_t offset = 0;
	std::optional<std::size_t> total;

	while (true) {
		WriteLine(fmt::format("{} {} {}",
				      command, QuoteArgument(file), offset));

		std::optional<std::size_t> chunk_size;
		while (!chunk_size) {
			const auto line = ReadLine();
			if (IsAckLine(line))
				throw ParseAck(line);

			if (IsTerminalLine(line))
				throw ClientError(ClientErrorCode::MALFORMED,
						  "Missing chunk size");

			const auto [key, value] = ParsePair(line);
			if (key == "size")
				total = ParseSize(value);
			else if (key == "binary")
				chunk_size = ParseSize(value);
		}

		if (total && (offset > *total ||
			      *chunk_size > *total - offset))
			throw ClientError(ClientErrorCode::MALFORMED,
					  fmt::format("Chunk of {} bytes at offset {} exceeds size {}",
						      *chunk_size, offset, *total));

		const auto chunk = ReadFixed(*chunk_size);
		data.insert(data.end(), chunk.begin(), chunk.end());

		/* skip the newline after the binary data, up to
		   "OK" */
		while (true) {
			const auto line = ReadLine();
			if (IsAckLine(line))
				throw ParseAck(line);

			if (IsTerminalLine(line))
				break;
		}

		offset += *chunk_size;

		if (!total || offset >= *total)
			break;

		if (*chunk_size == 0)
			throw ClientError(ClientErrorCode::MALFORMED,
					  "Empty chunk before end of artwork");
	}

	FmtDebug(artwork_domain, "received {} bytes of '{}' with {}",
		 data.size(), file, command);
	return data;
}

std::vector<std::byte>
ArtworkConnection::FetchChunks(std::string_view file,
			       std::string_view command)
{
	CheckMode(command);

	const std::lock_guard lock{GetMutex()};
	return DisconnectOnError([&]{
		return FetchChunksLocked(file, command);
	});
}

std::vector<std::byte>
ArtworkConnection::GetArtworkData(std::string_view file)
{
	std::exception_ptr last_error;

	for (const auto &command : GetConfig().artwork_commands) {
		try {
			return FetchChunks(file, command);
		} catch (const ProtocolError &e) {
			FmtDebug(artwork_domain, "{} '{}' failed: {}",
				 command, file, e.what());
			last_error = std::current_exception();
		}
	}

	if (last_error)
		std::rethrow_exception(last_error);

	throw ClientError(ClientErrorCode::MALFORMED, "No artwork found");
}
