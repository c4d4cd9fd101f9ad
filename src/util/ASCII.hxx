// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "CharUtil.hxx"

#include <algorithm>
#include <string>
#include <string_view>

/**
 * Compare two ASCII strings, ignoring case.  Non-ASCII bytes are
 * compared verbatim.
 */
[[gnu::pure]]
inline bool
StringEqualsCaseASCII(std::string_view a, std::string_view b) noexcept
{
	return a.size() == b.size() &&
		std::equal(a.begin(), a.end(), b.begin(), [](char x, char y){
			return ToLowerASCII(x) == ToLowerASCII(y);
		});
}

[[gnu::pure]]
inline bool
StringStartsWithCaseASCII(std::string_view haystack,
			  std::string_view needle) noexcept
{
	return haystack.size() >= needle.size() &&
		StringEqualsCaseASCII(haystack.substr(0, needle.size()),
				      needle);
}

/**
 * Return a copy of the given string with all ASCII letters converted
 * to lower case.
 */
inline std::string
ToLowerASCII(std::string_view src) noexcept
{
	std::string dest;
	dest.reserve(src.size());
	for (char ch : src)
		dest.push_back(ToLowerASCII(ch));
	return dest;
}
