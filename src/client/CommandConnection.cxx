// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "CommandConnection.hxx"
#include "Error.hxx"
#include "Queries.hxx"
#include "Response.hxx"
#include "protocol/Filter.hxx"
#include "protocol/Quote.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <functional>

template<typename... Ts>
struct Overloaded : Ts... {
	using Ts::operator()...;
};

/**
 * Throw if songs cannot be added to, removed from or moved within
 * the source.
 */
static void
CheckEditable(const Source &source, const char *what)
{
	if (std::holds_alternative<DatabaseSource>(source))
		throw ClientError(ClientErrorCode::UNSUPPORTED,
				  fmt::format("Cannot {} the database", what));
}

[[gnu::pure]]
static bool
ContainsFile(std::span<const Song> songs, std::string_view file) noexcept
{
	return std::any_of(songs.begin(), songs.end(), [file](const Song &s){
		return s.file == file;
	});
}

void
CommandConnection::LoadPlaylist(const std::optional<Playlist> &playlist)
{
	if (playlist)
		Run({"clear", "load " + QuoteArgument(playlist->name)});
	else
		Run({"clear", "add /"});
}

void
CommandConnection::ClearQueue()
{
	Run({"clear"});
}

void
CommandConnection::CreatePlaylist(std::string_view name)
{
	const auto quoted = QuoteArgument(name);

	/* "save" stores the current queue; empty the new playlist
	   right away */
	Run({"save " + quoted, "playlistclear " + quoted});
}

void
CommandConnection::RenamePlaylist(const Playlist &playlist,
				  std::string_view name)
{
	Run({"rename " + QuoteArgument(playlist.name) + " " + QuoteArgument(name)});
}

void
CommandConnection::RemovePlaylist(const Playlist &playlist)
{
	Run({"rm " + QuoteArgument(playlist.name)});
}

void
CommandConnection::Update(bool force)
{
	Run({force ? "rescan" : "update"});
}

void
CommandConnection::Add(std::span<const Song> songs, const Source &source)
{
	CheckEditable(source, "add songs to");

	if (songs.empty())
		return;

	const auto existing = GetSongs(*this, source);
	const auto playlist = GetSourcePlaylist(source);

	std::vector<std::string> commands;
	for (const auto &song : songs) {
		if (ContainsFile(existing, song.file))
			continue;

		if (playlist)
			commands.emplace_back("playlistadd " +
					      QuoteArgument(playlist->name) + " " +
					      QuoteArgument(song.file));
		else
			commands.emplace_back("add " + QuoteArgument(song.file));
	}

	Run(commands);
}

std::vector<std::string>
MakeQueueDeleteCommands(std::vector<unsigned> positions)
{
	std::sort(positions.begin(), positions.end(), std::greater<>());
	positions.erase(std::unique(positions.begin(), positions.end()),
			positions.end());

	std::vector<std::string> commands;

	for (std::size_t i = 0; i < positions.size(); ++i) {
		const unsigned start = positions[i];
		unsigned end = start;
		while (i + 1 < positions.size() && positions[i + 1] + 1 == end)
			end = positions[++i];

		if (start == end)
			commands.emplace_back(fmt::format("delete {}", start));
		else
			commands.emplace_back(fmt::format("delete {}:{}",
							  end, start + 1));
	}

	return commands;
}

void
CommandConnection::Remove(std::span<const Song> songs, const Source &source)
{
	CheckEditable(source, "remove songs from");

	if (songs.empty())
		return;

	std::vector<unsigned> positions;
	for (const auto &song : GetSongs(*this, source))
		if (song.position && ContainsFile(songs, song.file))
			positions.push_back(*song.position);

	if (positions.empty())
		return;

	const auto playlist = GetSourcePlaylist(source);
	if (!playlist) {
		Run(MakeQueueDeleteCommands(std::move(positions)));
		return;
	}

	/* stored playlists have no range deletion; delete from the
	   end so the remaining positions stay valid */
	std::sort(positions.begin(), positions.end(), std::greater<>());

	const auto name = QuoteArgument(playlist->name);
	std::vector<std::string> commands;
	for (const unsigned position : positions)
		commands.emplace_back(fmt::format("playlistdelete {} {}",
						  name, position));

	Run(commands);
}

void
CommandConnection::Move(const Song &song, unsigned position,
			const Source &source)
{
	if (!song.position)
		throw ClientError(ClientErrorCode::UNSUPPORTED,
				  "Cannot move song without a position");

	CheckEditable(source, "move songs within");

	if (const auto playlist = GetSourcePlaylist(source))
		Run({fmt::format("playlistmove {} {} {}",
				 QuoteArgument(playlist->name),
				 *song.position, position)});
	else
		Run({fmt::format("move {} {}", *song.position, position)});
}

void
CommandConnection::PlaySongs(std::span<const Song> songs)
{
	if (songs.empty())
		throw ClientError(ClientErrorCode::MALFORMED,
				  "No songs found for the specified media");

	const auto queue = GetSongs(*this, QueueSource{});

	std::optional<unsigned> id;
	std::vector<std::string> commands;

	for (std::size_t i = 0; i < songs.size(); ++i) {
		const auto &song = songs[i];
		const auto existing = std::find_if(queue.begin(), queue.end(),
						   [&song](const Song &s){
							   return s.file == song.file;
						   });

		if (existing != queue.end()) {
			if (i == 0)
				id = existing->id;
		} else
			commands.emplace_back("addid " + QuoteArgument(song.file));
	}

	if (!commands.empty()) {
		const auto lines = Run(commands);

		/* without a queued first song, play the first one
		   which was added */
		if (!id) {
			for (const auto &line : lines) {
				if (line == "OK")
					continue;

				const auto [key, value] = ParsePair(line);
				if (key == "id") {
					unsigned n;
					auto [ptr, ec] = std::from_chars(value.data(),
									 value.data() + value.size(),
									 n);
					if (ec == std::errc{})
						id = n;
					break;
				}
			}
		}
	}

	if (!id)
		throw ClientError(ClientErrorCode::MALFORMED,
				  "Failed to determine song ID to play");

	Run({fmt::format("playid {}", *id)});
}

void
CommandConnection::Play(const Media &media)
{
	std::visit(Overloaded{
		[this](const Song &song){
			if (song.id)
				Run({fmt::format("playid {}", *song.id)});
			else
				PlaySongs({&song, 1});
		},
		[this](const Album &album){
			PlaySongs(GetSongsIn(*this, album, DatabaseSource{}));
		},
		[this](const Artist &artist){
			const auto lines =
				Run({"find " + QuoteTagFilter("artist", artist.name)});
			PlaySongs(ParseSongs(lines));
		},
	}, media);
}

void
CommandConnection::Pause(bool value)
{
	Run({value ? "pause 1" : "pause 0"});
}

void
CommandConnection::Previous()
{
	Run({"previous"});
}

void
CommandConnection::Next()
{
	Run({"next"});
}

void
CommandConnection::Stop()
{
	Run({"stop"});
}

void
CommandConnection::SetConsume(bool value)
{
	Run({value ? "consume 1" : "consume 0"});
}

void
CommandConnection::SetRandom(bool value)
{
	Run({value ? "random 1" : "random 0"});
}

void
CommandConnection::SetRepeat(bool value)
{
	Run({value ? "repeat 1" : "repeat 0"});
}

void
CommandConnection::Seek(double position)
{
	Run({fmt::format("seekcur {}", position)});
}

void
CommandConnection::SetVolume(int volume)
{
	Run({fmt::format("setvol {}", volume)});
}

void
CommandConnection::ToggleOutput(const Output &output)
{
	Run({fmt::format("toggleoutput {}", output.id)});
}
