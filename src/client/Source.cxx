// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Source.hxx"

std::optional<Playlist>
GetSourcePlaylist(const Source &source) noexcept
{
	if (const auto *p = std::get_if<PlaylistSource>(&source))
		return p->playlist;

	if (std::holds_alternative<FavoritesSource>(source))
		return Playlist{FAVORITES_PLAYLIST};

	return std::nullopt;
}

[[gnu::const]]
static const char *
ToString(SortOption option) noexcept
{
	switch (option) {
	case SortOption::ARTIST:
		return "albumartistsort";

	case SortOption::ALBUM:
		return "albumsort";

	case SortOption::SONG:
		return "titlesort";

	case SortOption::MODIFIED:
		return "Last-Modified";
	}

	return "albumartistsort";
}

std::string
SortDescriptor::ToArgument() const noexcept
{
	std::string result;
	if (direction == SortDirection::DESCENDING)
		result.push_back('-');
	result += ToString(option);
	return result;
}
