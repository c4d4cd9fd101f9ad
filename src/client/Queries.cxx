// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Queries.hxx"
#include "Connection.hxx"
#include "Error.hxx"
#include "Response.hxx"
#include "protocol/Filter.hxx"
#include "protocol/Quote.hxx"

#include <set>

/**
 * Remove elements with an id which was already seen, preserving
 * the order.
 */
template<typename T>
static std::vector<T>
Deduplicate(std::vector<T> &&src)
{
	std::set<std::string, std::less<>> seen;
	std::vector<T> result;

	for (auto &i : src)
		if (seen.emplace(i.GetId()).second)
			result.emplace_back(std::move(i));

	return result;
}

PlayerStatus
GetStatus(Connection &c)
{
	return ParseStatus(c.Run({"status", "currentsong"}));
}

DatabaseStats
GetStats(Connection &c)
{
	return ParseStats(c.Run({"stats"}));
}

std::vector<Album>
GetAlbums(Connection &c, SortDescriptor sort)
{
	const auto lines = c.Run({
		"find " + QuoteTagFilter("track", "1") +
		" sort " + sort.ToArgument(),
	});

	return Deduplicate(ParseAlbums(lines));
}

std::vector<Album>
GetAlbumsBy(Connection &c, const Artist &artist, const Source &source)
{
	const auto filter = QuoteTagFilter("albumartist", artist.name);

	std::string command;
	if (std::holds_alternative<DatabaseSource>(source))
		command = "find " + filter + " sort date";
	else if (std::holds_alternative<QueueSource>(source))
		command = "playlistfind " + filter + " sort date";
	else
		throw ClientError(ClientErrorCode::UNSUPPORTED,
				  "Only database and queue sources are supported for retrieving albums by artist");

	return Deduplicate(ParseAlbums(c.Run({std::move(command)})));
}

std::vector<Artist>
GetArtists(Connection &c, SortDescriptor sort)
{
	std::vector<Artist> artists;
	for (auto &album : GetAlbums(c, sort))
		artists.emplace_back(std::move(album.artist));

	return Deduplicate(std::move(artists));
}

std::vector<Song>
GetSongs(Connection &c, const Source &source, SortDescriptor sort)
{
	std::string command;

	if (std::holds_alternative<DatabaseSource>(source))
		command = "find " + QuoteTagFilter("title", "", "!=") +
			" sort " + sort.ToArgument();
	else if (std::holds_alternative<QueueSource>(source))
		command = "playlistinfo";
	else
		command = "listplaylistinfo " +
			QuoteArgument(GetSourcePlaylist(source)->name);

	return ParseSongs(c.Run({std::move(command)}), true);
}

std::vector<Song>
GetSongsIn(Connection &c, const Album &album, const Source &source)
{
	AndQueryFilter filter;
	filter.AddTag("album", album.title);
	filter.AddTag("albumartist", album.artist.name);

	std::string command;
	if (std::holds_alternative<DatabaseSource>(source))
		command = "find " + QuoteFilter(filter) + " sort track";
	else if (std::holds_alternative<QueueSource>(source))
		command = "playlistfind " + QuoteFilter(filter);
	else
		throw ClientError(ClientErrorCode::UNSUPPORTED,
				  "Only database and queue sources are supported for retrieving songs in an album");

	return ParseSongs(c.Run({std::move(command)}));
}

std::vector<Playlist>
GetPlaylists(Connection &c)
{
	return ParsePlaylists(c.Run({"listplaylists"}));
}

std::vector<Output>
GetOutputs(Connection &c)
{
	return ParseOutputs(c.Run({"outputs"}));
}

void
Ping(Connection &c)
{
	c.Run({"ping"});
}
