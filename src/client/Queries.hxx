// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "Media.hxx"
#include "Source.hxx"

#include <vector>

class Connection;

/*
 * Queries which are allowed on every kind of connection.  They
 * throw on error, see Connection::Run().
 */

/**
 * Query "status" and "currentsong" in one command list.
 */
PlayerStatus
GetStatus(Connection &c);

DatabaseStats
GetStats(Connection &c);

/**
 * Returns all albums in the database (represented by their first
 * track), without duplicates.
 */
std::vector<Album>
GetAlbums(Connection &c, SortDescriptor sort={});

/**
 * Returns the albums of an artist, sorted by date.
 *
 * Throws #ClientError with #ClientErrorCode::UNSUPPORTED unless the
 * source is the database or the queue.
 */
std::vector<Album>
GetAlbumsBy(Connection &c, const Artist &artist, const Source &source);

/**
 * Returns the album artists of all albums, without duplicates.
 */
std::vector<Artist>
GetArtists(Connection &c, SortDescriptor sort={});

/**
 * Returns all songs of the source.  Each song's position is its
 * index in the source unless the server specifies one.  The sort
 * order only applies to the database.
 */
std::vector<Song>
GetSongs(Connection &c, const Source &source, SortDescriptor sort={});

/**
 * Returns the songs of an album.
 *
 * Throws #ClientError with #ClientErrorCode::UNSUPPORTED unless the
 * source is the database or the queue.
 */
std::vector<Song>
GetSongsIn(Connection &c, const Album &album, const Source &source);

std::vector<Playlist>
GetPlaylists(Connection &c);

std::vector<Output>
GetOutputs(Connection &c);

void
Ping(Connection &c);
