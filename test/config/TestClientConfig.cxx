// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "config/ClientConfig.hxx"
#include "config/Block.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace std::chrono;

TEST(ClientConfig, Defaults)
{
	const ClientConfig config;
	EXPECT_EQ(config.host, "localhost");
	EXPECT_EQ(config.port, 6600U);
	EXPECT_TRUE(config.password.empty());
	EXPECT_EQ(config.artwork_commands,
		  (std::vector<std::string>{"albumart", "readpicture"}));
	EXPECT_EQ(config.timeout, seconds(3));
	EXPECT_EQ(config.reconnect_interval, seconds(5));

	const ClientConfig from_empty{ConfigBlock{}};
	EXPECT_EQ(from_empty.host, "localhost");
	EXPECT_EQ(from_empty.port, 6600U);
}

TEST(ClientConfig, Block)
{
	ConfigBlock block;
	block.AddBlockParam("host", "music.local", 1);
	block.AddBlockParam("port", "6601", 2);
	block.AddBlockParam("password", "secret", 3);
	block.AddBlockParam("artwork_commands", " readpicture  albumart ", 4);
	block.AddBlockParam("timeout", "500ms", 5);
	block.AddBlockParam("reconnect_interval", "10", 6);
	block.AddBlockParam("colour", "blue", 7);

	const ClientConfig config{block};
	EXPECT_EQ(config.host, "music.local");
	EXPECT_EQ(config.port, 6601U);
	EXPECT_EQ(config.password, "secret");
	EXPECT_EQ(config.artwork_commands,
		  (std::vector<std::string>{"readpicture", "albumart"}));
	EXPECT_EQ(config.timeout, milliseconds(500));
	EXPECT_EQ(config.reconnect_interval, seconds(10));

	EXPECT_TRUE(block.GetBlockParam("host")->used);
	EXPECT_FALSE(block.block_params.back().used);
}

static ClientConfig
MakeConfig(const char *name, const char *value)
{
	ConfigBlock block;
	block.AddBlockParam(name, value, 42);
	return ClientConfig{block};
}

TEST(ClientConfig, BadValues)
{
	EXPECT_THROW(MakeConfig("host", ""), std::runtime_error);
	EXPECT_THROW(MakeConfig("port", "0"), std::runtime_error);
	EXPECT_THROW(MakeConfig("port", "65536"), std::runtime_error);
	EXPECT_THROW(MakeConfig("port", "http"), std::runtime_error);
	EXPECT_THROW(MakeConfig("artwork_commands", "albumart coverart"),
		     std::runtime_error);
	EXPECT_THROW(MakeConfig("artwork_commands", "  "), std::runtime_error);
	EXPECT_THROW(MakeConfig("timeout", "0"), std::runtime_error);

	try {
		MakeConfig("port", "http");
		FAIL() << "malformed port not detected";
	} catch (...) {
		const auto msg = GetFullMessage(std::current_exception());
		EXPECT_NE(msg.find("\"port\" on line 42"), std::string::npos);
	}
}

TEST(ClientConfig, Environment)
{
	ClientConfig config;
	config.ApplyEnvironment(nullptr, nullptr);
	EXPECT_EQ(config.host, "localhost");
	EXPECT_EQ(config.port, 6600U);

	config.ApplyEnvironment("", "");
	EXPECT_EQ(config.host, "localhost");

	config.ApplyEnvironment("music.local", "6601");
	EXPECT_EQ(config.host, "music.local");
	EXPECT_EQ(config.port, 6601U);
	EXPECT_TRUE(config.password.empty());

	config.ApplyEnvironment("pass@word@music.local", nullptr);
	EXPECT_EQ(config.password, "pass");
	EXPECT_EQ(config.host, "word@music.local");
	EXPECT_EQ(config.port, 6601U);
}

TEST(ClientConfig, EnvironmentAbstractSocket)
{
	ClientConfig config;
	config.ApplyEnvironment("@mpd", nullptr);
	EXPECT_TRUE(config.password.empty());
	EXPECT_EQ(config.host, "@mpd");

	config.ApplyEnvironment("secret@", nullptr);
	EXPECT_TRUE(config.password.empty());
	EXPECT_EQ(config.host, "secret@");
}

TEST(ClientConfig, EnvironmentBadPort)
{
	ClientConfig config;
	try {
		config.ApplyEnvironment(nullptr, "66000");
		FAIL() << "malformed MPD_PORT not detected";
	} catch (const std::runtime_error &e) {
		EXPECT_STREQ(e.what(), "Malformed MPD_PORT");
	}

	EXPECT_EQ(config.port, 6600U);
}
