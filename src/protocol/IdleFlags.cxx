// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

/*
 * Support library for the "idle" command.
 *
 */

#include "IdleFlags.hxx"
#include "util/ASCII.hxx"

#include <bit>

static const char *const idle_names[] = {
	"database",
	"stored_playlist",
	"playlist",
	"player",
	"mixer",
	"output",
	"options",
	"sticker",
	"update",
	"subscription",
	"message",
	"neighbor",
	"mount",
	"partition",
	nullptr,
};

const char*const*
idle_get_names() noexcept
{
	return idle_names;
}

unsigned
idle_parse_name(std::string_view name) noexcept
{
	for (unsigned i = 0; idle_names[i] != nullptr; ++i)
		if (StringEqualsCaseASCII(name, idle_names[i]))
			return 1 << i;

	return 0;
}

const char *
idle_event_name(IdleEvent event) noexcept
{
	return idle_names[std::countr_zero(static_cast<unsigned>(event))];
}
