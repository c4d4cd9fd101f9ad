// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

/**
 * Splits a line into words and quoted strings, in place.  This
 * understands the quoting rules of both the MPD protocol and the
 * configuration file.
 */
class Tokenizer {
	char *input;

public:
	/**
	 * @param _input the input string; the contents will be
	 * modified by this class
	 */
	constexpr explicit Tokenizer(char *_input) noexcept
		:input(_input) {}

	Tokenizer(const Tokenizer &) = delete;
	Tokenizer &operator=(const Tokenizer &) = delete;

	char CurrentChar() const noexcept {
		return *input;
	}

	bool IsEnd() const noexcept {
		return CurrentChar() == 0;
	}

	/**
	 * Reads the next word (a letter followed by letters, digits
	 * and underscores).  Throws std::runtime_error on error.
	 *
	 * @return a pointer to the null-terminated word, or nullptr
	 * on end of line
	 */
	char *NextWord();

	/**
	 * Reads the next unquoted word from the input string.  Throws
	 * std::runtime_error on error.
	 *
	 * @return a pointer to the null-terminated word, or nullptr
	 * on end of line
	 */
	char *NextUnquoted();

	/**
	 * Reads the next quoted string from the input string.  A
	 * backslash escapes the following character.  Throws
	 * std::runtime_error on error.
	 *
	 * @return a pointer to the null-terminated string, or nullptr
	 * on end of line
	 */
	char *NextString();

	/**
	 * Reads the next unquoted word or quoted string from the
	 * input.  This is a wrapper for NextUnquoted() and
	 * NextString().
	 */
	char *NextParam();
};
