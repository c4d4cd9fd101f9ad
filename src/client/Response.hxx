// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "Media.hxx"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/*
 * Parsers for the "key: value" lines of a response.  All of them
 * ignore the terminating "OK" line and unknown keys.  They throw
 * #ClientError with #ClientErrorCode::MALFORMED on structural errors.
 */

using ResponseLines = std::span<const std::string>;

/**
 * Split a "key: value" line at the first colon.  Both parts are
 * stripped, and the key is converted to lower case.
 */
std::pair<std::string, std::string>
ParsePair(std::string_view line);

/**
 * Split the lines into groups, each beginning with a line whose
 * key is the given one.  Lines before the first such line are
 * discarded.
 */
std::vector<std::vector<std::string>>
ChunkLines(ResponseLines lines, std::string_view key);

/**
 * Parse one song.  Missing tags get fallback values.
 *
 * @param index the position to use if there is no "Pos"
 */
Song
ParseSong(ResponseLines lines, std::optional<unsigned> index=std::nullopt);

Album
ParseAlbum(ResponseLines lines);

Artist
ParseArtist(ResponseLines lines);

/**
 * Parse a list of songs, one per "file" line.
 *
 * @param indexed use the index within the response as position
 * for songs without "Pos"
 */
std::vector<Song>
ParseSongs(ResponseLines lines, bool indexed=false);

std::vector<Album>
ParseAlbums(ResponseLines lines);

std::vector<Artist>
ParseArtists(ResponseLines lines);

/**
 * Parse the response of "listplaylists".
 */
std::vector<Playlist>
ParsePlaylists(ResponseLines lines);

/**
 * Parse the response of "outputs".
 */
std::vector<Output>
ParseOutputs(ResponseLines lines);

/**
 * Parse the combined response of "status" and "currentsong".
 */
PlayerStatus
ParseStatus(ResponseLines lines);

/**
 * Parse the response of "stats".
 */
DatabaseStats
ParseStats(ResponseLines lines);
