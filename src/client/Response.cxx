// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Response.hxx"
#include "Error.hxx"
#include "util/ASCII.hxx"
#include "util/StringStrip.hxx"

#include <charconv>

using std::string_view_literals::operator""sv;

/**
 * Parse the decimal number at the beginning of the string.
 * Trailing garbage (e.g. "/12" in a "Track" value) is ignored.
 */
template<typename T>
static std::optional<T>
ParseNumber(std::string_view s) noexcept
{
	T value{};
	auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
	if (ec != std::errc{})
		return std::nullopt;

	return value;
}

template<typename T>
static std::optional<T>
ParseNumber(const std::optional<std::string> &s) noexcept
{
	if (!s)
		return std::nullopt;

	return ParseNumber<T>(std::string_view{*s});
}

[[gnu::pure]]
static bool
IsOK(std::string_view line) noexcept
{
	return line == "OK"sv;
}

std::pair<std::string, std::string>
ParsePair(std::string_view line)
{
	const auto colon = line.find(':');
	if (colon == line.npos)
		throw ClientError(ClientErrorCode::MALFORMED,
				  "Line does not contain a colon");

	return {
		ToLowerASCII(Strip(line.substr(0, colon))),
		std::string{Strip(line.substr(colon + 1))},
	};
}

/**
 * Does the line have the given (lower case) key?
 */
[[gnu::pure]]
static bool
HasKey(std::string_view line, std::string_view key) noexcept
{
	return line.size() > key.size() && line[key.size()] == ':' &&
		StringStartsWithCaseASCII(line, key);
}

std::vector<std::vector<std::string>>
ChunkLines(ResponseLines lines, std::string_view key)
{
	std::vector<std::vector<std::string>> chunks;

	for (const auto &line : lines) {
		if (HasKey(line, key))
			chunks.emplace_back();
		else if (chunks.empty())
			continue;

		chunks.back().push_back(line);
	}

	return chunks;
}

namespace {

/**
 * Collects the song attributes of a response.  Later values
 * overwrite earlier ones.
 */
struct SongFields {
	std::optional<std::string> file, id, pos;
	std::optional<std::string> artist, artist_sort;
	std::optional<std::string> title, title_sort, name;
	std::optional<std::string> duration, disc, track, date;
	std::optional<std::string> genre, composer, performer, conductor;
	std::optional<std::string> ensemble, mood, comment;
	std::optional<std::string> album, album_sort;
	std::optional<std::string> album_artist, album_artist_sort;

	explicit SongFields(ResponseLines lines);

	void Set(std::string_view key, std::string &&value) noexcept;

	const std::string &GetFile() const;

	std::string GetArtistName() const {
		return album_artist.value_or(artist.value_or(UNKNOWN_ARTIST));
	}

	Artist ToArtist() const {
		return {GetFile(), GetArtistName(), album_artist_sort};
	}

	Album ToAlbum() const {
		return {
			GetFile(),
			album.value_or(UNKNOWN_ALBUM),
			album_sort,
			ToArtist(),
			date,
		};
	}

	Song ToSong(std::optional<unsigned> index) const;
};

struct SongKey {
	std::string_view key;
	std::optional<std::string> SongFields::*field;
};

static constexpr SongKey song_keys[] = {
	{ "file"sv, &SongFields::file },
	{ "id"sv, &SongFields::id },
	{ "pos"sv, &SongFields::pos },
	{ "artist"sv, &SongFields::artist },
	{ "artistsort"sv, &SongFields::artist_sort },
	{ "title"sv, &SongFields::title },
	{ "titlesort"sv, &SongFields::title_sort },
	{ "name"sv, &SongFields::name },
	{ "duration"sv, &SongFields::duration },
	{ "disc"sv, &SongFields::disc },
	{ "track"sv, &SongFields::track },
	{ "date"sv, &SongFields::date },
	{ "genre"sv, &SongFields::genre },
	{ "composer"sv, &SongFields::composer },
	{ "performer"sv, &SongFields::performer },
	{ "conductor"sv, &SongFields::conductor },
	{ "ensemble"sv, &SongFields::ensemble },
	{ "mood"sv, &SongFields::mood },
	{ "comment"sv, &SongFields::comment },
	{ "album"sv, &SongFields::album },
	{ "albumsort"sv, &SongFields::album_sort },
	{ "albumartist"sv, &SongFields::album_artist },
	{ "albumartistsort"sv, &SongFields::album_artist_sort },
};

SongFields::SongFields(ResponseLines lines)
{
	for (const auto &line : lines) {
		if (IsOK(line))
			continue;

		auto [key, value] = ParsePair(line);
		Set(key, std::move(value));
	}
}

void
SongFields::Set(std::string_view key, std::string &&value) noexcept
{
	for (const auto &i : song_keys) {
		if (i.key == key) {
			this->*i.field = std::move(value);
			return;
		}
	}
}

const std::string &
SongFields::GetFile() const
{
	if (!file)
		throw ClientError(ClientErrorCode::MALFORMED,
				  "Missing file field");

	return *file;
}

Song
SongFields::ToSong(std::optional<unsigned> index) const
{
	Song song;
	song.file = GetFile();
	song.id = ParseNumber<unsigned>(id);
	song.position = ParseNumber<unsigned>(pos);
	if (!song.position)
		song.position = index;

	if (name && !artist && !title) {
		/* a radio stream which only provides "Name" */
		const std::string_view n{*name};
		const auto separator = n.find(" - "sv);
		if (separator != n.npos) {
			song.artist = n.substr(0, separator);
			song.title = n.substr(separator + 3);
		} else {
			song.artist = UNKNOWN_ARTIST;
			song.title = *name;
		}
	} else {
		song.artist = artist.value_or(UNKNOWN_ARTIST);
		song.title = title.value_or(UNKNOWN_TITLE);
	}

	song.artist_sort = artist_sort;
	song.title_sort = title_sort;
	song.duration = ParseNumber<double>(duration).value_or(0);
	song.disc = ParseNumber<unsigned>(disc).value_or(1);
	song.track = ParseNumber<unsigned>(track).value_or(1);
	song.date = date;
	song.genre = genre;
	song.composer = composer;
	song.performer = performer;
	song.conductor = conductor;
	song.ensemble = ensemble;
	song.mood = mood;
	song.comment = comment;
	song.album = ToAlbum();
	return song;
}

} // anonymous namespace

Song
ParseSong(ResponseLines lines, std::optional<unsigned> index)
{
	return SongFields{lines}.ToSong(index);
}

Album
ParseAlbum(ResponseLines lines)
{
	return SongFields{lines}.ToAlbum();
}

Artist
ParseArtist(ResponseLines lines)
{
	return SongFields{lines}.ToArtist();
}

std::vector<Song>
ParseSongs(ResponseLines lines, bool indexed)
{
	const auto chunks = ChunkLines(lines, "file"sv);

	std::vector<Song> songs;
	songs.reserve(chunks.size());

	unsigned index = 0;
	for (const auto &chunk : chunks) {
		songs.emplace_back(ParseSong(chunk,
					     indexed
					     ? std::optional<unsigned>{index}
					     : std::nullopt));
		++index;
	}

	return songs;
}

std::vector<Album>
ParseAlbums(ResponseLines lines)
{
	std::vector<Album> albums;
	for (const auto &chunk : ChunkLines(lines, "file"sv))
		albums.emplace_back(ParseAlbum(chunk));
	return albums;
}

std::vector<Artist>
ParseArtists(ResponseLines lines)
{
	std::vector<Artist> artists;
	for (const auto &chunk : ChunkLines(lines, "file"sv))
		artists.emplace_back(ParseArtist(chunk));
	return artists;
}

std::vector<Playlist>
ParsePlaylists(ResponseLines lines)
{
	std::vector<Playlist> playlists;

	for (const auto &line : lines) {
		if (IsOK(line))
			break;

		auto [key, value] = ParsePair(line);
		if (key == "playlist"sv)
			playlists.push_back({std::move(value)});
	}

	return playlists;
}

static Output
ParseOutput(ResponseLines lines)
{
	Output output{};
	bool have_id = false;

	for (const auto &line : lines) {
		if (IsOK(line))
			continue;

		auto [key, value] = ParsePair(line);
		if (key == "outputid"sv) {
			const auto id = ParseNumber<unsigned>(std::string_view{value});
			if (!id)
				throw ClientError(ClientErrorCode::MALFORMED,
						  "Malformed output id");

			output.id = *id;
			have_id = true;
		} else if (key == "outputname"sv)
			output.name = std::move(value);
		else if (key == "plugin"sv)
			output.plugin = std::move(value);
		else if (key == "outputenabled"sv)
			output.enabled = value == "1"sv;
		else if (key == "attribute"sv) {
			const std::string_view a{value};
			const auto eq = a.find('=');
			if (eq != a.npos)
				output.attributes.insert_or_assign(std::string{a.substr(0, eq)},
								   std::string{a.substr(eq + 1)});
		}
	}

	if (!have_id)
		throw ClientError(ClientErrorCode::MALFORMED,
				  "Missing output id");

	return output;
}

std::vector<Output>
ParseOutputs(ResponseLines lines)
{
	std::vector<Output> outputs;
	for (const auto &chunk : ChunkLines(lines, "outputid"sv))
		outputs.emplace_back(ParseOutput(chunk));
	return outputs;
}

static PlayerState
ParsePlayerState(std::string_view s)
{
	if (s == "play"sv)
		return PlayerState::PLAY;
	else if (s == "pause"sv)
		return PlayerState::PAUSE;
	else if (s == "stop"sv)
		return PlayerState::STOP;
	else
		throw ClientError(ClientErrorCode::MALFORMED,
				  "Invalid player state: " + std::string{s});
}

PlayerStatus
ParseStatus(ResponseLines lines)
{
	PlayerStatus status;
	bool have_song = false;

	for (const auto &line : lines) {
		if (IsOK(line))
			continue;

		auto [key, value] = ParsePair(line);
		const std::string_view v{value};

		if (key == "state"sv)
			status.state = ParsePlayerState(v);
		else if (key == "consume"sv)
			status.consume = v == "1"sv;
		else if (key == "random"sv)
			status.random = v == "1"sv;
		else if (key == "repeat"sv)
			status.repeat = v == "1"sv;
		else if (key == "elapsed"sv)
			status.elapsed = ParseNumber<double>(v);
		else if (key == "volume"sv)
			status.volume = ParseNumber<int>(v);
		else if (key == "file"sv)
			have_song = true;
	}

	if (have_song)
		status.song = ParseSong(lines);

	return status;
}

DatabaseStats
ParseStats(ResponseLines lines)
{
	DatabaseStats stats;

	for (const auto &line : lines) {
		if (IsOK(line))
			continue;

		const auto [key, value] = ParsePair(line);
		const auto n = ParseNumber<unsigned long>(std::string_view{value});

		if (key == "artists"sv)
			stats.artists = n;
		else if (key == "albums"sv)
			stats.albums = n;
		else if (key == "songs"sv)
			stats.songs = n;
		else if (key == "uptime"sv)
			stats.uptime = n;
		else if (key == "db_playtime"sv)
			stats.playtime = n;
		else if (key == "db_update"sv)
			stats.last_update = n;
	}

	return stats;
}
