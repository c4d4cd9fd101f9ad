// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "OptionParser.hxx"
#include "OptionDef.hxx"
#include "util/RuntimeError.hxx"

#include <string_view>

static const char *
Shift(std::span<const char *const> &s) noexcept
{
	const char *value = s.front();
	s = s.subspan(1);
	return value;
}

inline const char *
OptionParser::CheckShiftValue(const char *s, const OptionDef &option)
{
	if (!option.HasValue())
		return nullptr;

	if (args.empty())
		throw FmtRuntimeError("Value expected after {}", s);

	return Shift(args);
}

inline OptionParser::Result
OptionParser::IdentifyOption(const char *s)
{
	assert(s != nullptr);
	assert(*s == '-');

	if (s[1] == '-') {
		const std::string_view arg{s + 2};

		for (const auto &i : options) {
			if (!i.HasLongOption())
				continue;

			const std::string_view name{i.GetLongOption()};
			if (!arg.starts_with(name))
				continue;

			const char *t = s + 2 + name.size();
			const char *value;

			if (*t == 0)
				value = CheckShiftValue(s, i);
			else if (*t == '=' && i.HasValue())
				value = t + 1;
			else
				continue;

			return {int(&i - options.data()), value};
		}
	} else if (s[1] != 0 && s[2] == 0) {
		const char ch = s[1];
		for (const auto &i : options) {
			if (i.HasShortOption() && ch == i.GetShortOption()) {
				const char *value = CheckShiftValue(s, i);
				return {int(&i - options.data()), value};
			}
		}
	}

	throw FmtRuntimeError("Unknown option: {}", s);
}

OptionParser::Result
OptionParser::Next()
{
	while (!args.empty()) {
		const char *arg = Shift(args);

		if (!options_done && arg[0] == '-' && arg[1] != 0) {
			if (arg[1] == '-' && arg[2] == 0) {
				options_done = true;
				continue;
			}

			return IdentifyOption(arg);
		}

		/* everything after the command name belongs to the
		   command */
		options_done = true;
		*remaining_tail++ = arg;
	}

	return {-1, nullptr};
}
