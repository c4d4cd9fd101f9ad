// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "MockServer.hxx"
#include "client/ArtworkConnection.hxx"
#include "client/Error.hxx"
#include "protocol/Ack.hxx"

#include <fmt/format.h>

#include <gtest/gtest.h>

#include <algorithm>

static std::vector<std::byte>
MakeImage(std::size_t size)
{
	std::vector<std::byte> image(size);
	for (std::size_t i = 0; i < size; ++i)
		image[i] = static_cast<std::byte>(i % 251);
	return image;
}

/**
 * Send one chunk of a "binary" response.
 */
static void
SendChunk(MockSession &s, std::span<const std::byte> image,
	  std::size_t offset, std::size_t chunk_size, bool with_size=true)
{
	const auto chunk = image.subspan(offset, chunk_size);

	if (with_size)
		s.Send(fmt::format("size: {}\n", image.size()));
	s.Send(fmt::format("type: image/png\nbinary: {}\n", chunk.size()));
	s.Send(chunk);
	s.Send("\nOK\n");
}

TEST(Artwork, Chunked)
{
	const auto image = MakeImage(9000);

	MockServer server{[&image](MockSession &s, unsigned){
		s.SendGreeting();

		for (std::size_t offset = 0; offset < image.size(); offset += 4096) {
			EXPECT_EQ(s.ReceiveLine(),
				  fmt::format("albumart \"Artist/Album/01.flac\" {}", offset));
			SendChunk(s, image, offset,
				  std::min<std::size_t>(4096, image.size() - offset));
		}

		EXPECT_FALSE(s.ReceiveLine());
	}};

	ArtworkConnection c{server.MakeConfig()};
	c.Connect();
	EXPECT_EQ(c.GetArtworkData("Artist/Album/01.flac"), image);
	EXPECT_TRUE(c.IsConnected());
}

TEST(Artwork, Fallback)
{
	const auto image = MakeImage(3);

	MockServer server{[&image](MockSession &s, unsigned){
		s.SendGreeting();
		EXPECT_EQ(s.ReceiveLine(), "albumart \"it's \\\"quoted\\\".mp3\" 0");
		s.Send("ACK [50@0] {albumart} No file exists\n");
		EXPECT_EQ(s.ReceiveLine(), "readpicture \"it's \\\"quoted\\\".mp3\" 0");
		SendChunk(s, image, 0, image.size());
		EXPECT_FALSE(s.ReceiveLine());
	}};

	ArtworkConnection c{server.MakeConfig()};
	c.Connect();
	EXPECT_EQ(c.GetArtworkData("it's \"quoted\".mp3"), image);
	EXPECT_TRUE(c.IsConnected());
}

TEST(Artwork, CommandOrder)
{
	const auto image = MakeImage(10);

	MockServer server{[&image](MockSession &s, unsigned){
		s.SendGreeting();
		EXPECT_EQ(s.ReceiveLine(), "readpicture \"a.flac\" 0");
		SendChunk(s, image, 0, image.size());
		EXPECT_FALSE(s.ReceiveLine());
	}};

	auto config = server.MakeConfig();
	config.artwork_commands = {"readpicture", "albumart"};

	ArtworkConnection c{config};
	c.Connect();
	EXPECT_EQ(c.GetArtworkData("a.flac"), image);
}

TEST(Artwork, AllCommandsFail)
{
	MockServer server{[](MockSession &s, unsigned){
		s.SendGreeting();
		EXPECT_EQ(s.ReceiveLine(), "albumart \"a.flac\" 0");
		s.Send("ACK [50@0] {albumart} No file exists\n");
		EXPECT_EQ(s.ReceiveLine(), "readpicture \"a.flac\" 0");
		s.Send("ACK [5@0] {readpicture} unknown command \"readpicture\"\n");
		EXPECT_FALSE(s.ReceiveLine());
	}};

	ArtworkConnection c{server.MakeConfig()};
	c.Connect();

	/* the last error wins */
	try {
		c.GetArtworkData("a.flac");
		FAIL() << "no error";
	} catch (const ProtocolError &e) {
		EXPECT_EQ(e.GetCode(), ACK_ERROR_UNKNOWN);
		EXPECT_EQ(e.GetCommand(), "readpicture");
	}

	EXPECT_TRUE(c.IsConnected());
}

TEST(Artwork, NoCommands)
{
	auto config = ClientConfig{};
	config.artwork_commands.clear();

	ArtworkConnection c{config};
	try {
		c.GetArtworkData("a.flac");
		FAIL() << "no error";
	} catch (const ClientError &e) {
		EXPECT_EQ(e.GetCode(), ClientErrorCode::MALFORMED);
		EXPECT_STREQ(e.what(), "No artwork found");
	}
}

TEST(Artwork, UnknownSize)
{
	const auto image = MakeImage(100);

	MockServer server{[&image](MockSession &s, unsigned){
		s.SendGreeting();
		EXPECT_EQ(s.ReceiveLine(), "albumart \"a.flac\" 0");

		/* without "size", the first chunk is the last one */
		SendChunk(s, image, 0, 40, false);
		EXPECT_FALSE(s.ReceiveLine());
	}};

	ArtworkConnection c{server.MakeConfig()};
	c.Connect();

	const auto data = c.GetArtworkData("a.flac");
	ASSERT_EQ(data.size(), 40U);
	EXPECT_TRUE(std::equal(data.begin(), data.end(), image.begin()));
}

TEST(Artwork, EmptyImage)
{
	MockServer server{[](MockSession &s, unsigned){
		s.SendGreeting();
		EXPECT_EQ(s.ReceiveLine(), "albumart \"a.flac\" 0");
		s.Send("size: 0\nbinary: 0\n\nOK\n");
		EXPECT_FALSE(s.ReceiveLine());
	}};

	ArtworkConnection c{server.MakeConfig()};
	c.Connect();
	EXPECT_TRUE(c.GetArtworkData("a.flac").empty());
	EXPECT_TRUE(c.IsConnected());
}

TEST(Artwork, EmptyChunk)
{
	const auto image = MakeImage(9000);

	MockServer server{[&image](MockSession &s, unsigned){
		s.SendGreeting();
		EXPECT_EQ(s.ReceiveLine(), "albumart \"a.flac\" 0");
		SendChunk(s, image, 0, 4096);

		/* the server stops delivering before the announced
		   size was reached */
		EXPECT_EQ(s.ReceiveLine(), "albumart \"a.flac\" 4096");
		s.Send("size: 9000\nbinary: 0\n\nOK\n");
		EXPECT_FALSE(s.ReceiveLine());
	}};

	ArtworkConnection c{server.MakeConfig()};
	c.Connect();

	try {
		c.GetArtworkData("a.flac");
		FAIL() << "no error";
	} catch (const ClientError &e) {
		EXPECT_EQ(e.GetCode(), ClientErrorCode::MALFORMED);
	}

	EXPECT_FALSE(c.IsConnected());
}

TEST(Artwork, ChunkTooLarge)
{
	MockServer server{[](MockSession &s, unsigned){
		s.SendGreeting();
		EXPECT_EQ(s.ReceiveLine(), "albumart \"a.flac\" 0");
		s.Send("size: 100\nbinary: 1000000000\n");
		EXPECT_FALSE(s.ReceiveLine());
	}};

	ArtworkConnection c{server.MakeConfig()};
	c.Connect();

	try {
		c.GetArtworkData("a.flac");
		FAIL() << "no error";
	} catch (const ClientError &e) {
		EXPECT_EQ(e.GetCode(), ClientErrorCode::MALFORMED);
	}

	EXPECT_FALSE(c.IsConnected());
}

TEST(Artwork, MissingBinary)
{
	MockServer server{[](MockSession &s, unsigned){
		s.SendGreeting();
		EXPECT_EQ(s.ReceiveLine(), "albumart \"a.flac\" 0");
		s.Send("size: 100\nOK\n");

		/* a malformed response is not a reason to try
		   "readpicture" */
		EXPECT_FALSE(s.ReceiveLine());
	}};

	ArtworkConnection c{server.MakeConfig()};
	c.Connect();

	try {
		c.GetArtworkData("a.flac");
		FAIL() << "no error";
	} catch (const ClientError &e) {
		EXPECT_EQ(e.GetCode(), ClientErrorCode::MALFORMED);
	}

	EXPECT_FALSE(c.IsConnected());
}

TEST(Artwork, WrongMode)
{
	ArtworkConnection c{ClientConfig{}};
	try {
		c.Run({"idle"});
		FAIL() << "no error";
	} catch (const ClientError &e) {
		EXPECT_EQ(e.GetCode(), ClientErrorCode::WRONG_MODE);
	}
}
