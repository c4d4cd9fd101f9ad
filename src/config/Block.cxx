// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Block.hxx"
#include "Parser.hxx"
#include "util/RuntimeError.hxx"

#include <exception>
#include <stdexcept>

void
BlockParam::ThrowWithNested() const
{
	std::throw_with_nested(FmtRuntimeError("Error in setting \"{}\" on line {}",
					       name, line));
}

unsigned
BlockParam::GetUnsignedValue() const
{
	return With(ParseUnsigned);
}

std::chrono::steady_clock::duration
BlockParam::GetDuration(std::chrono::steady_clock::duration min_value) const
{
	return With([min_value](const char *s){
		auto duration = ParseDuration(s);
		if (duration < min_value)
			throw std::invalid_argument{"Value is too small"};

		return duration;
	});
}

const BlockParam *
ConfigBlock::GetBlockParam(const char *name) const noexcept
{
	for (const auto &i : block_params) {
		if (i.name == name) {
			i.used = true;
			return &i;
		}
	}

	return nullptr;
}

const char *
ConfigBlock::GetBlockValue(const char *name,
			   const char *default_value) const noexcept
{
	const BlockParam *bp = GetBlockParam(name);
	if (bp == nullptr)
		return default_value;

	return bp->value.c_str();
}

unsigned
ConfigBlock::GetBlockValue(const char *name, unsigned default_value) const
{
	const BlockParam *bp = GetBlockParam(name);
	if (bp == nullptr)
		return default_value;

	return bp->GetUnsignedValue();
}

std::chrono::steady_clock::duration
ConfigBlock::GetDuration(const char *name,
			 std::chrono::steady_clock::duration min_value,
			 std::chrono::steady_clock::duration default_value) const
{
	const BlockParam *bp = GetBlockParam(name);
	if (bp == nullptr)
		return default_value;

	return bp->GetDuration(min_value);
}
