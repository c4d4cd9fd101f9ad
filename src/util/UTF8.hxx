// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <string_view>

/**
 * Is this a valid UTF-8 byte sequence?  Overlong and truncated
 * sequences are rejected; null bytes are allowed.
 */
[[gnu::pure]]
bool
ValidateUTF8(std::string_view s) noexcept;
