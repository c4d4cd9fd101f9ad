// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "Connection.hxx"
#include "Media.hxx"
#include "Source.hxx"

#include <optional>
#include <span>
#include <string_view>

/**
 * A connection for playback control, queue and playlist editing.
 * Source combinations which MPD cannot handle (e.g. adding songs
 * to the database) throw #ClientError with
 * #ClientErrorCode::UNSUPPORTED before anything is sent.
 */
class CommandConnection final : public Connection {
public:
	explicit CommandConnection(const ClientConfig &_config) noexcept
		:Connection(_config, ConnectionMode::COMMAND) {}

	/**
	 * Replace the queue with the given stored playlist, or with
	 * the whole database if none is given.
	 */
	void LoadPlaylist(const std::optional<Playlist> &playlist=std::nullopt);

	void ClearQueue();

	/**
	 * Create an empty stored playlist.
	 */
	void CreatePlaylist(std::string_view name);

	void RenamePlaylist(const Playlist &playlist, std::string_view name);

	void RemovePlaylist(const Playlist &playlist);

	/**
	 * Start a database update.
	 *
	 * @param force rescan unmodified files, too
	 */
	void Update(bool force=false);

	/**
	 * Append songs to the queue or to a stored playlist, skipping
	 * those which are already there.
	 */
	void Add(std::span<const Song> songs, const Source &source);

	/**
	 * Remove songs from the queue or from a stored playlist.
	 */
	void Remove(std::span<const Song> songs, const Source &source);

	/**
	 * Move a song (which must have a position) to a new position
	 * in the queue or in a stored playlist.
	 */
	void Move(const Song &song, unsigned position, const Source &source);

	/**
	 * Play a song, an album or all songs of an artist.  Songs
	 * which are not yet in the queue are appended.
	 */
	void Play(const Media &media);

	void Pause(bool value);
	void Previous();
	void Next();
	void Stop();

	void SetConsume(bool value);
	void SetRandom(bool value);
	void SetRepeat(bool value);

	/**
	 * Seek within the current song.
	 *
	 * @param position the new position in seconds
	 */
	void Seek(double position);

	void SetVolume(int volume);

	void ToggleOutput(const Output &output);

private:
	/**
	 * Play the given songs, appending those which are not yet in
	 * the queue.
	 */
	void PlaySongs(std::span<const Song> songs);
};

/**
 * Build "delete" commands for the given queue positions, merging
 * adjacent positions into ranges.  The commands are ordered from
 * the end of the queue to its beginning, so earlier deletions don't
 * shift later ones.
 */
std::vector<std::string>
MakeQueueDeleteCommands(std::vector<unsigned> positions);
