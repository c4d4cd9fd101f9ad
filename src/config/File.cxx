// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "File.hxx"
#include "Block.hxx"
#include "util/Tokenizer.hxx"
#include "util/StringStrip.hxx"
#include "util/Domain.hxx"
#include "util/RuntimeError.hxx"
#include "io/FileReader.hxx"
#include "io/BufferedReader.hxx"
#include "Log.hxx"

#include <algorithm>
#include <cassert>
#include <exception>
#include <stdexcept>

static constexpr char CONF_COMMENT = '#';

static constexpr Domain config_file_domain("config_file");

/**
 * Read a string value as the last token of a line.  Throws on error.
 */
static auto
ExpectValueAndEnd(Tokenizer &tokenizer)
{
	auto value = tokenizer.NextString();
	if (!value)
		throw std::runtime_error("Value missing");

	if (!tokenizer.IsEnd() && tokenizer.CurrentChar() != CONF_COMMENT)
		throw std::runtime_error("Unknown tokens after value");

	return value;
}

static void
config_read_name_value(ConfigBlock &block, char *input, unsigned line)
{
	Tokenizer tokenizer(input);

	const char *name = tokenizer.NextWord();
	assert(name != nullptr);

	auto value = ExpectValueAndEnd(tokenizer);

	/* not GetBlockParam(), which would mark the setting as used */
	const auto bp = std::find_if(block.block_params.begin(),
				     block.block_params.end(),
				     [name](const BlockParam &i){
					     return i.name == name;
				     });
	if (bp != block.block_params.end())
		throw FmtRuntimeError("\"{}\" is duplicate, first defined on line {}",
				      name, bp->line);

	block.AddBlockParam(name, value, line);
}

ConfigBlock
ReadConfig(BufferedReader &reader)
{
	ConfigBlock block(reader.GetLineNumber() + 1);

	while (true) {
		char *line = reader.ReadLine();
		if (line == nullptr)
			break;

		line = StripLeft(line);
		if (*line == 0 || *line == CONF_COMMENT)
			continue;

		config_read_name_value(block, line, reader.GetLineNumber());
	}

	return block;
}

ConfigBlock
ReadConfigFile(const char *path)
{
	assert(path != nullptr);

	FmtDebug(config_file_domain, "loading file {}", path);

	FileReader file(path);

	BufferedReader reader(file);

	try {
		return ReadConfig(reader);
	} catch (...) {
		std::throw_with_nested(FmtRuntimeError("Error in {} line {}",
						       path,
						       reader.GetLineNumber()));
	}
}
