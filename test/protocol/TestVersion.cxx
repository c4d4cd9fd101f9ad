// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "protocol/Version.hxx"

#include <gtest/gtest.h>

TEST(Version, ParseGreeting)
{
	auto v = ParseGreeting("OK MPD 0.23.5");
	ASSERT_TRUE(v);
	EXPECT_EQ(v->major, 0U);
	EXPECT_EQ(v->minor, 23U);
	EXPECT_EQ(v->patch, 5U);

	v = ParseGreeting("OK MPD 0.24");
	ASSERT_TRUE(v);
	EXPECT_EQ(*v, (ProtocolVersion{0, 24, 0}));

	EXPECT_FALSE(ParseGreeting("OK"));
	EXPECT_FALSE(ParseGreeting("OK MPD"));
	EXPECT_FALSE(ParseGreeting("OK MPD x.y.z"));
	EXPECT_FALSE(ParseGreeting("OK MPD 0."));
	EXPECT_FALSE(ParseGreeting("OK MPD 0.23.5 extra"));
	EXPECT_FALSE(ParseGreeting("ACK [4@0] {} you don't have permission"));
}

TEST(Version, Compare)
{
	EXPECT_LT((ProtocolVersion{0, 21, 25}), MIN_PROTOCOL_VERSION);
	EXPECT_GE((ProtocolVersion{0, 22, 0}), MIN_PROTOCOL_VERSION);
	EXPECT_GT((ProtocolVersion{1, 0, 0}), (ProtocolVersion{0, 99, 99}));
	EXPECT_GT((ProtocolVersion{0, 23, 1}), (ProtocolVersion{0, 23, 0}));
}

TEST(Version, ToString)
{
	EXPECT_EQ((ProtocolVersion{0, 23, 5}).ToString(), "0.23.5");
	EXPECT_EQ(MIN_PROTOCOL_VERSION.ToString(), "0.22.0");
}
