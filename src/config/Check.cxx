// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Check.hxx"
#include "Block.hxx"
#include "Domain.hxx"
#include "Log.hxx"

void
CheckUnusedParams(const ConfigBlock &block) noexcept
{
	for (const auto &i : block.block_params)
		if (!i.used)
			FmtWarning(config_domain,
				   "option '{}' on line {} was not recognized",
				   i.name, i.line);
}
