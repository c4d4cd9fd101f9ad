// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "util/Tokenizer.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(Tokenizer, WordAndString)
{
	char input[] = "host  \"my \\\"server\\\"\"  # comment";
	Tokenizer t(input);

	EXPECT_STREQ(t.NextWord(), "host");
	EXPECT_STREQ(t.NextString(), "my \"server\"");
	EXPECT_FALSE(t.IsEnd());
	EXPECT_EQ(t.CurrentChar(), '#');
}

TEST(Tokenizer, Params)
{
	char input[] = "albumart \"a b.flac\" 4096";
	Tokenizer t(input);

	EXPECT_STREQ(t.NextParam(), "albumart");
	EXPECT_STREQ(t.NextParam(), "a b.flac");
	EXPECT_STREQ(t.NextParam(), "4096");
	EXPECT_TRUE(t.IsEnd());
	EXPECT_EQ(t.NextParam(), nullptr);
}

TEST(Tokenizer, Errors)
{
	char bad_word[] = "1port";
	EXPECT_THROW(Tokenizer(bad_word).NextWord(), std::runtime_error);

	char unterminated[] = "\"foo";
	EXPECT_THROW(Tokenizer(unterminated).NextString(), std::runtime_error);

	char unquoted[] = "foo";
	EXPECT_THROW(Tokenizer(unquoted).NextString(), std::runtime_error);

	char no_space[] = "\"foo\"bar";
	EXPECT_THROW(Tokenizer(no_space).NextString(), std::runtime_error);
}
