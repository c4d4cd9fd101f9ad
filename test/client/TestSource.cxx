// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "client/Source.hxx"
#include "client/CommandConnection.hxx"

#include <gtest/gtest.h>

TEST(Source, Playlist)
{
	EXPECT_FALSE(GetSourcePlaylist(DatabaseSource{}));
	EXPECT_FALSE(GetSourcePlaylist(QueueSource{}));
	EXPECT_EQ(GetSourcePlaylist(PlaylistSource{{"Road Trip"}}),
		  (Playlist{"Road Trip"}));
	EXPECT_EQ(GetSourcePlaylist(FavoritesSource{}),
		  (Playlist{"Favorites"}));
}

TEST(Source, Sort)
{
	EXPECT_EQ(SortDescriptor{}.ToArgument(), "albumartistsort");
	EXPECT_EQ((SortDescriptor{SortOption::ALBUM, SortDirection::ASCENDING}).ToArgument(),
		  "albumsort");
	EXPECT_EQ((SortDescriptor{SortOption::SONG, SortDirection::DESCENDING}).ToArgument(),
		  "-titlesort");
	EXPECT_EQ((SortDescriptor{SortOption::MODIFIED, SortDirection::DESCENDING}).ToArgument(),
		  "-Last-Modified");
}

TEST(QueueDelete, Ranges)
{
	using V = std::vector<std::string>;

	EXPECT_TRUE(MakeQueueDeleteCommands({}).empty());
	EXPECT_EQ(MakeQueueDeleteCommands({3}), V{"delete 3"});

	/* highest positions first so earlier ones stay valid;
	   consecutive positions are merged into one range */
	EXPECT_EQ(MakeQueueDeleteCommands({1, 2, 3, 7}),
		  (V{"delete 7", "delete 1:4"}));
	EXPECT_EQ(MakeQueueDeleteCommands({9, 0, 5, 4, 4, 8}),
		  (V{"delete 8:10", "delete 4:6", "delete 0"}));
}
