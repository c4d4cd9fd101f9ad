// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "Media.hxx"

#include <optional>
#include <string>
#include <variant>

/**
 * The whole song database.
 */
struct DatabaseSource {};

/**
 * The play queue ("current playlist").
 */
struct QueueSource {};

/**
 * A stored playlist.
 */
struct PlaylistSource {
	Playlist playlist;
};

/**
 * The stored playlist named #FAVORITES_PLAYLIST.
 */
struct FavoritesSource {};

/**
 * Where songs are listed from or added to.
 */
using Source = std::variant<DatabaseSource, QueueSource,
			    PlaylistSource, FavoritesSource>;

/**
 * Returns the stored playlist behind the given source, or nothing
 * for the database and the queue.
 */
[[gnu::pure]]
std::optional<Playlist>
GetSourcePlaylist(const Source &source) noexcept;

enum class SortOption {
	ARTIST,
	ALBUM,
	SONG,
	MODIFIED,
};

enum class SortDirection {
	ASCENDING,
	DESCENDING,
};

struct SortDescriptor {
	SortOption option = SortOption::ARTIST;
	SortDirection direction = SortDirection::ASCENDING;

	/**
	 * Format the argument of the "sort" keyword, e.g.
	 * "-albumsort".
	 */
	[[gnu::pure]]
	std::string ToArgument() const noexcept;
};
