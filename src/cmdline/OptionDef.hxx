// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MPDLINK_CMDLINE_OPTIONDEF_HXX
#define MPDLINK_CMDLINE_OPTIONDEF_HXX

#include <cassert>

/**
 * Command line option definition.
 */
class OptionDef
{
	const char *long_option;
	char short_option;
	bool has_value = false;
	const char *value_name = nullptr;
	const char *desc;

public:
	constexpr OptionDef(const char *_long_option,
			    char _short_option, const char *_desc) noexcept
		:long_option(_long_option),
		 short_option(_short_option),
		 desc(_desc) {}

	/**
	 * An option which expects a value (e.g. "--port 6600").
	 */
	constexpr OptionDef(const char *_long_option,
			    char _short_option, const char *_value_name,
			    const char *_desc) noexcept
		:long_option(_long_option),
		 short_option(_short_option),
		 has_value(true),
		 value_name(_value_name),
		 desc(_desc) {}

	constexpr bool HasLongOption() const noexcept {
		return long_option != nullptr;
	}

	constexpr bool HasShortOption() const noexcept {
		return short_option != 0;
	}

	constexpr bool HasValue() const noexcept {
		return has_value;
	}

	constexpr bool HasDescription() const noexcept {
		return desc != nullptr;
	}

	const char *GetLongOption() const noexcept {
		assert(HasLongOption());
		return long_option;
	}

	char GetShortOption() const noexcept {
		assert(HasShortOption());
		return short_option;
	}

	const char *GetValueName() const noexcept {
		assert(HasValue());
		return value_name;
	}

	const char *GetDescription() const noexcept {
		assert(HasDescription());
		return desc;
	}
};

#endif
