// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "Connection.hxx"

#include <cstddef>
#include <string_view>
#include <vector>

/**
 * A connection which downloads cover art.  MPD sends large files
 * in chunks; each chunk is requested with its offset.
 */
class ArtworkConnection final : public Connection {
public:
	explicit ArtworkConnection(const ClientConfig &_config) noexcept
		:Connection(_config, ConnectionMode::ARTWORK) {}

	/**
	 * Download the artwork of the given song, trying each of the
	 * configured commands until one succeeds.  A #ProtocolError
	 * moves on to the next command; all other errors are
	 * propagated immediately.
	 *
	 * Throws the last #ProtocolError if all commands fail.
	 */
	std::vector<std::byte> GetArtworkData(std::string_view file);

	/**
	 * Download the artwork of the given song with one command
	 * ("albumart" or "readpicture").
	 */
	std::vector<std::byte> FetchChunks(std::string_view file,
					   std::string_view command);

private:
	std::vector<std::byte> FetchChunksLocked(std::string_view file,
						 std::string_view command);
};
