// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

struct ConfigBlock;

/**
 * Log a warning for each setting which was never queried.
 */
void
CheckUnusedParams(const ConfigBlock &block) noexcept;
