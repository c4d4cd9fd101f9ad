// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "MockServer.hxx"
#include "client/CommandConnection.hxx"
#include "client/Queries.hxx"
#include "client/Error.hxx"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

struct Exchange {
	std::string command;
	std::string response;
};

} // anonymous namespace

/**
 * A server handler which expects the given commands (command lists
 * joined with newlines) and sends the given responses.
 */
static MockServer::Handler
Script(std::vector<Exchange> script)
{
	return [script = std::move(script)](MockSession &s, unsigned){
		s.SendGreeting();

		for (const auto &i : script) {
			EXPECT_EQ(s.ReceiveCommand(), i.command);
			s.Send(i.response);
		}

		EXPECT_FALSE(s.ReceiveLine());
	};
}

static Song
MakeSong(const char *file, std::optional<unsigned> position=std::nullopt)
{
	Song song;
	song.file = file;
	song.position = position;
	return song;
}

static ClientErrorCode
GetErrorCode(auto &&f)
{
	try {
		f();
	} catch (const ClientError &e) {
		return e.GetCode();
	}

	ADD_FAILURE() << "no ClientError thrown";
	return ClientErrorCode::CONNECTION;
}

TEST(Queries, Status)
{
	MockServer server{Script({
		{
			"status\ncurrentsong",
			"volume: 20\nstate: pause\nelapsed: 1.5\n"
			"file: a.flac\nTitle: A\nPos: 0\nId: 1\nOK\n",
		},
		{
			"stats",
			"artists: 1\nalbums: 2\nsongs: 3\nOK\n",
		},
	})};

	CommandConnection c{server.MakeConfig()};
	c.Connect();

	const auto status = GetStatus(c);
	EXPECT_EQ(status.state, PlayerState::PAUSE);
	EXPECT_EQ(status.volume, 20);
	ASSERT_TRUE(status.song);
	EXPECT_EQ(status.song->title, "A");

	const auto stats = GetStats(c);
	EXPECT_EQ(stats.songs, 3UL);
}

TEST(Queries, Albums)
{
	MockServer server{Script({
		{
			R"q(find "(track == '1')" sort -albumsort)q",
			"file: 1.flac\nAlbum: B\nAlbumArtist: X\n"
			"file: 2.flac\nAlbum: B\nAlbumArtist: X\n"
			"file: 3.flac\nAlbum: A\nAlbumArtist: Y\nOK\n",
		},
		{
			R"q(find "(track == '1')" sort albumartistsort)q",
			"file: 1.flac\nAlbum: B\nAlbumArtist: X\n"
			"file: 3.flac\nAlbum: A\nAlbumArtist: X\nOK\n",
		},
		{
			R"q(playlistfind "(albumartist == 'X')" sort date)q",
			"file: 1.flac\nAlbum: B\nAlbumArtist: X\nOK\n",
		},
	})};

	CommandConnection c{server.MakeConfig()};
	c.Connect();

	/* duplicates are removed */
	const auto albums = GetAlbums(c, {SortOption::ALBUM, SortDirection::DESCENDING});
	ASSERT_EQ(albums.size(), 2U);
	EXPECT_EQ(albums[0].GetId(), "X - B");
	EXPECT_EQ(albums[1].GetId(), "Y - A");

	const auto artists = GetArtists(c);
	ASSERT_EQ(artists.size(), 1U);
	EXPECT_EQ(artists[0].name, "X");

	const auto by = GetAlbumsBy(c, artists[0], QueueSource{});
	ASSERT_EQ(by.size(), 1U);
	EXPECT_EQ(by[0].title, "B");

	EXPECT_EQ(GetErrorCode([&]{ GetAlbumsBy(c, artists[0], FavoritesSource{}); }),
		  ClientErrorCode::UNSUPPORTED);
}

TEST(Queries, Songs)
{
	MockServer server{Script({
		{
			R"q(find "(title != '')" sort titlesort)q",
			"file: a.flac\nTitle: A\nOK\n",
		},
		{
			"listplaylistinfo \"Road Trip\"",
			"file: a.flac\nfile: b.flac\nOK\n",
		},
		{
			R"q(find "((album == 'Animals') AND (albumartist == 'Pink Floyd'))" sort track)q",
			"file: 1.flac\nTrack: 1\nfile: 2.flac\nTrack: 2\nOK\n",
		},
		{
			R"q(playlistfind "((album == 'Animals') AND (albumartist == 'Pink Floyd'))")q",
			"file: 2.flac\nTrack: 2\nPos: 7\nOK\n",
		},
	})};

	CommandConnection c{server.MakeConfig()};
	c.Connect();

	auto songs = GetSongs(c, DatabaseSource{}, {SortOption::SONG});
	ASSERT_EQ(songs.size(), 1U);
	EXPECT_EQ(songs[0].position, 0U);

	songs = GetSongs(c, PlaylistSource{{"Road Trip"}});
	ASSERT_EQ(songs.size(), 2U);
	EXPECT_EQ(songs[1].file, "b.flac");
	EXPECT_EQ(songs[1].position, 1U);

	Album album;
	album.title = "Animals";
	album.artist.name = "Pink Floyd";

	songs = GetSongsIn(c, album, DatabaseSource{});
	ASSERT_EQ(songs.size(), 2U);
	EXPECT_EQ(songs[1].track, 2U);

	songs = GetSongsIn(c, album, QueueSource{});
	ASSERT_EQ(songs.size(), 1U);
	EXPECT_EQ(songs[0].position, 7U);

	EXPECT_EQ(GetErrorCode([&]{ GetSongsIn(c, album, FavoritesSource{}); }),
		  ClientErrorCode::UNSUPPORTED);
}

TEST(CommandConnection, PlayNewSong)
{
	MockServer server{Script({
		{"playlistinfo", "file: b.flac\nPos: 0\nId: 5\nOK\n"},
		{"addid \"a.flac\"", "Id: 6\nOK\n"},
		{"playid 6", "OK\n"},
	})};

	CommandConnection c{server.MakeConfig()};
	c.Connect();
	c.Play(MakeSong("a.flac"));
}

TEST(CommandConnection, PlayQueuedSong)
{
	MockServer server{Script({
		{"playid 3", "OK\n"},
		{"playlistinfo", "file: b.flac\nPos: 0\nId: 5\nOK\n"},
		{"playid 5", "OK\n"},
	})};

	CommandConnection c{server.MakeConfig()};
	c.Connect();

	auto song = MakeSong("x.flac");
	song.id = 3;
	c.Play(song);

	c.Play(MakeSong("b.flac"));
}

TEST(CommandConnection, PlayArtist)
{
	MockServer server{Script({
		{R"q(find "(artist == 'Band')")q", "file: a.flac\nfile: b.flac\nOK\n"},
		{"playlistinfo", "file: b.flac\nPos: 0\nId: 5\nOK\n"},
		{"addid \"a.flac\"", "Id: 9\nOK\n"},
		{"playid 9", "OK\n"},
	})};

	CommandConnection c{server.MakeConfig()};
	c.Connect();

	Artist artist;
	artist.name = "Band";
	c.Play(artist);
}

TEST(CommandConnection, Add)
{
	MockServer server{Script({
		{"listplaylistinfo \"Mix\"", "file: a.flac\nOK\n"},
		{"playlistadd \"Mix\" \"c.flac\"", "OK\n"},
		{"playlistinfo", "OK\n"},
		{"add \"a.flac\"\nadd \"c.flac\"", "OK\n"},
	})};

	CommandConnection c{server.MakeConfig()};
	c.Connect();

	const std::vector<Song> songs{MakeSong("a.flac"), MakeSong("c.flac")};

	/* songs which are already there are skipped */
	c.Add(songs, PlaylistSource{{"Mix"}});
	c.Add(songs, QueueSource{});
}

TEST(CommandConnection, Remove)
{
	MockServer server{Script({
		{"playlistinfo", "file: a.flac\nfile: b.flac\nfile: c.flac\nfile: d.flac\nOK\n"},
		{"delete 2:4\ndelete 0", "OK\n"},
		{"listplaylistinfo \"Favorites\"", "file: a.flac\nfile: b.flac\nfile: c.flac\nOK\n"},
		{"playlistdelete \"Favorites\" 2\nplaylistdelete \"Favorites\" 0", "OK\n"},
	})};

	CommandConnection c{server.MakeConfig()};
	c.Connect();

	c.Remove(std::vector<Song>{MakeSong("a.flac"), MakeSong("c.flac"), MakeSong("d.flac")},
		 QueueSource{});
	c.Remove(std::vector<Song>{MakeSong("a.flac"), MakeSong("c.flac")},
		 FavoritesSource{});
}

TEST(CommandConnection, Playback)
{
	MockServer server{Script({
		{"pause 1", "OK\n"},
		{"next", "OK\n"},
		{"previous", "OK\n"},
		{"stop", "OK\n"},
		{"setvol 50", "OK\n"},
		{"seekcur 12.5", "OK\n"},
		{"random 1", "OK\n"},
		{"repeat 0", "OK\n"},
		{"consume 1", "OK\n"},
		{"toggleoutput 2", "OK\n"},
		{"move 4 1", "OK\n"},
		{"playlistmove \"Mix\" 4 1", "OK\n"},
	})};

	CommandConnection c{server.MakeConfig()};
	c.Connect();

	c.Pause(true);
	c.Next();
	c.Previous();
	c.Stop();
	c.SetVolume(50);
	c.Seek(12.5);
	c.SetRandom(true);
	c.SetRepeat(false);
	c.SetConsume(true);

	Output output{};
	output.id = 2;
	c.ToggleOutput(output);

	c.Move(MakeSong("a.flac", 4), 1, QueueSource{});
	c.Move(MakeSong("a.flac", 4), 1, PlaylistSource{{"Mix"}});
}

TEST(CommandConnection, Playlists)
{
	MockServer server{Script({
		{"save \"New\"\nplaylistclear \"New\"", "OK\n"},
		{"rename \"New\" \"Old\"", "OK\n"},
		{"clear\nload \"Old\"", "OK\n"},
		{"clear\nadd /", "OK\n"},
		{"rm \"Old\"", "OK\n"},
		{"update", "updating_db: 1\nOK\n"},
		{"rescan", "updating_db: 2\nOK\n"},
	})};

	CommandConnection c{server.MakeConfig()};
	c.Connect();

	c.CreatePlaylist("New");
	c.RenamePlaylist({"New"}, "Old");
	c.LoadPlaylist(Playlist{"Old"});
	c.LoadPlaylist();
	c.RemovePlaylist({"Old"});
	c.Update();
	c.Update(true);
}

TEST(CommandConnection, Unsupported)
{
	CommandConnection c{ClientConfig{}};
	const std::vector<Song> songs{MakeSong("a.flac", 0)};

	EXPECT_EQ(GetErrorCode([&]{ c.Add(songs, DatabaseSource{}); }),
		  ClientErrorCode::UNSUPPORTED);
	EXPECT_EQ(GetErrorCode([&]{ c.Remove(songs, DatabaseSource{}); }),
		  ClientErrorCode::UNSUPPORTED);
	EXPECT_EQ(GetErrorCode([&]{ c.Move(songs.front(), 1, DatabaseSource{}); }),
		  ClientErrorCode::UNSUPPORTED);
	EXPECT_EQ(GetErrorCode([&]{ c.Move(MakeSong("b.flac"), 1, QueueSource{}); }),
		  ClientErrorCode::UNSUPPORTED);
}
