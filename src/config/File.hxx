// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

struct ConfigBlock;
class BufferedReader;

/**
 * Parse settings from a reader.  Each line has the form
 * `name "value"`; empty lines and lines starting with '#' are
 * ignored.
 *
 * Throws on error.
 */
ConfigBlock
ReadConfig(BufferedReader &reader);

/**
 * Load a configuration file.
 *
 * Throws on error; the message names the file and the line.
 */
ConfigBlock
ReadConfigFile(const char *path);
