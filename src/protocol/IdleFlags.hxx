// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

/*
 * Names and bit masks for the subsystems reported by the "idle"
 * command.
 */

#ifndef MPDLINK_IDLE_FLAGS_HXX
#define MPDLINK_IDLE_FLAGS_HXX

#include <string_view>

/** song database has been updated*/
static constexpr unsigned IDLE_DATABASE = 0x1;

/** a stored playlist has been modified, created, deleted or renamed */
static constexpr unsigned IDLE_STORED_PLAYLIST = 0x2;

/** the queue has been modified */
static constexpr unsigned IDLE_PLAYLIST = 0x4;

/** the player state has changed: play, stop, pause, seek, ... */
static constexpr unsigned IDLE_PLAYER = 0x8;

/** the volume has been modified */
static constexpr unsigned IDLE_MIXER = 0x10;

/** an audio output device has been enabled or disabled */
static constexpr unsigned IDLE_OUTPUT = 0x20;

/** options have changed: crossfade; random; repeat; ... */
static constexpr unsigned IDLE_OPTIONS = 0x40;

/** a sticker has been modified. */
static constexpr unsigned IDLE_STICKER = 0x80;

/** a database update has started or finished. */
static constexpr unsigned IDLE_UPDATE = 0x100;

/** a client has subscribed or unsubscribed to/from a channel */
static constexpr unsigned IDLE_SUBSCRIPTION = 0x200;

/** a message on the subscribed channel was received */
static constexpr unsigned IDLE_MESSAGE = 0x400;

/** a neighbor was found or lost */
static constexpr unsigned IDLE_NEIGHBOR = 0x800;

/** the mount list has changed */
static constexpr unsigned IDLE_MOUNT = 0x1000;

/** the partition list has changed */
static constexpr unsigned IDLE_PARTITION = 0x2000;

/** all of the above */
static constexpr unsigned IDLE_ALL = 0x3fff;

/**
 * One subsystem reported by "changed: NAME".  The values are the
 * IDLE_* bits.
 */
enum class IdleEvent : unsigned {
	DATABASE = IDLE_DATABASE,
	STORED_PLAYLIST = IDLE_STORED_PLAYLIST,
	PLAYLIST = IDLE_PLAYLIST,
	PLAYER = IDLE_PLAYER,
	MIXER = IDLE_MIXER,
	OUTPUT = IDLE_OUTPUT,
	OPTIONS = IDLE_OPTIONS,
	STICKER = IDLE_STICKER,
	UPDATE = IDLE_UPDATE,
	SUBSCRIPTION = IDLE_SUBSCRIPTION,
	MESSAGE = IDLE_MESSAGE,
	NEIGHBOR = IDLE_NEIGHBOR,
	MOUNT = IDLE_MOUNT,
	PARTITION = IDLE_PARTITION,
};

/**
 * Get idle names
 */
[[gnu::const]]
const char*const*
idle_get_names() noexcept;

/**
 * Parse an idle name and return its mask.  Returns 0 if the given
 * name is unknown.
 */
[[gnu::pure]]
unsigned
idle_parse_name(std::string_view name) noexcept;

/**
 * Returns the protocol name of the given event.
 */
[[gnu::const]]
const char *
idle_event_name(IdleEvent event) noexcept;

#endif
