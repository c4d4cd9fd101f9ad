// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MPDLINK_CONFIG_PARSER_HXX
#define MPDLINK_CONFIG_PARSER_HXX

#include <chrono>

/**
 * Throws on error.
 */
long
ParseLong(const char *s);

/**
 * Throws on error.
 */
unsigned
ParseUnsigned(const char *s);

/**
 * Throws on error.
 */
unsigned
ParsePositive(const char *s);

/**
 * Parse a duration.  A plain number is in seconds; the suffixes
 * "ms" and "s" select the unit explicitly.
 *
 * Throws on error.
 */
std::chrono::steady_clock::duration
ParseDuration(const char *s);

#endif
