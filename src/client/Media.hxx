// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>

static constexpr const char *UNKNOWN_ARTIST = "Unknown Artist";
static constexpr const char *UNKNOWN_TITLE = "Unknown Title";
static constexpr const char *UNKNOWN_ALBUM = "Unknown Album";

struct Artist {
	/**
	 * The URI of the first song by this artist.
	 */
	std::string file;

	std::string name;

	std::optional<std::string> name_sort;

	/**
	 * Artists are identified by their name.
	 */
	const std::string &GetId() const noexcept {
		return name;
	}
};

struct Album {
	/**
	 * The URI of the first song of this album.
	 */
	std::string file;

	std::string title;

	std::optional<std::string> title_sort;

	Artist artist;

	std::optional<std::string> date;

	/**
	 * Albums are identified by "ARTIST - TITLE".
	 */
	std::string GetId() const noexcept {
		return artist.name + " - " + title;
	}
};

struct Song {
	/**
	 * The URI of the song within the music directory.
	 */
	std::string file;

	/**
	 * The queue id ("Id"), only set for songs in the queue.
	 */
	std::optional<unsigned> id;

	/**
	 * The position in the queue or in the playlist.
	 */
	std::optional<unsigned> position;

	std::string artist;
	std::optional<std::string> artist_sort;

	std::string title;
	std::optional<std::string> title_sort;

	/**
	 * In seconds; 0 if unknown.
	 */
	double duration = 0;

	unsigned disc = 1, track = 1;

	std::optional<std::string> date;
	std::optional<std::string> genre;
	std::optional<std::string> composer;
	std::optional<std::string> performer;
	std::optional<std::string> conductor;
	std::optional<std::string> ensemble;
	std::optional<std::string> mood;
	std::optional<std::string> comment;

	Album album;

	const std::string &GetId() const noexcept {
		return file;
	}
};

/**
 * Anything which can be played.
 */
using Media = std::variant<Song, Album, Artist>;

struct Playlist {
	std::string name;

	bool operator==(const Playlist &) const noexcept = default;
};

/**
 * The stored playlist which holds the user's favorite songs.
 */
static constexpr const char *FAVORITES_PLAYLIST = "Favorites";

struct Output {
	unsigned id;

	std::string name;

	std::string plugin;

	bool enabled = false;

	/**
	 * Runtime attributes ("attribute: NAME=VALUE").
	 */
	std::map<std::string, std::string, std::less<>> attributes;

	[[gnu::pure]]
	bool IsHttpd() const noexcept {
		return plugin == "httpd";
	}
};

enum class PlayerState {
	STOP,
	PAUSE,
	PLAY,
};

/**
 * The response of "status" and "currentsong".  Attributes the
 * server did not send are empty.
 */
struct PlayerStatus {
	std::optional<PlayerState> state;

	std::optional<bool> consume, random, repeat;

	/**
	 * The elapsed time of the current song in seconds.
	 */
	std::optional<double> elapsed;

	std::optional<int> volume;

	std::optional<Song> song;
};

/**
 * The response of "stats".
 */
struct DatabaseStats {
	std::optional<unsigned long> artists, albums, songs;

	/**
	 * Daemon uptime in seconds.
	 */
	std::optional<unsigned long> uptime;

	/**
	 * Sum of all song durations in seconds.
	 */
	std::optional<unsigned long> playtime;

	/**
	 * Time stamp of the last database update (seconds since
	 * the epoch).
	 */
	std::optional<unsigned long> last_update;
};
