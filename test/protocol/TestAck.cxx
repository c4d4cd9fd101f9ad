// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "protocol/Ack.hxx"

#include <gtest/gtest.h>

TEST(Ack, TerminalLines)
{
	EXPECT_TRUE(IsTerminalLine("OK"));
	EXPECT_TRUE(IsTerminalLine("OK MPD 0.23.5"));
	EXPECT_TRUE(IsTerminalLine("ACK [5@0] {foo} unknown command \"foo\""));
	EXPECT_FALSE(IsTerminalLine("file: OK Computer/01.flac"));
	EXPECT_FALSE(IsTerminalLine(""));

	EXPECT_TRUE(IsAckLine("ACK [2@0] {seek} Bad song index"));
	EXPECT_FALSE(IsAckLine("OK"));
	EXPECT_FALSE(IsAckLine("Title: ACK"));
}

TEST(Ack, Parse)
{
	const char *line = "ACK [50@3] {listplaylistinfo} No such playlist";
	const auto e = ParseAck(line);
	EXPECT_STREQ(e.what(), line);
	EXPECT_EQ(e.GetCode(), ACK_ERROR_NO_EXIST);
	EXPECT_EQ(e.GetListIndex(), 3U);
	EXPECT_EQ(e.GetCommand(), "listplaylistinfo");
}

TEST(Ack, ParseMalformed)
{
	/* unparsable parts are left empty, the raw line survives */
	const auto e = ParseAck("ACK something went wrong");
	EXPECT_STREQ(e.what(), "ACK something went wrong");
	EXPECT_EQ(e.GetCode(), 0);
	EXPECT_EQ(e.GetListIndex(), 0U);
	EXPECT_TRUE(e.GetCommand().empty());

	const auto e2 = ParseAck("ACK [3@0] {password");
	EXPECT_EQ(e2.GetCode(), ACK_ERROR_PASSWORD);
	EXPECT_TRUE(e2.GetCommand().empty());
}

TEST(Ack, UnknownCode)
{
	/* codes from newer servers are preserved */
	const auto e = ParseAck("ACK [4242@1] {newcommand} Something new");
	EXPECT_EQ(static_cast<unsigned>(e.GetCode()), 4242U);
	EXPECT_EQ(e.GetListIndex(), 1U);
	EXPECT_EQ(e.GetCommand(), "newcommand");
}
