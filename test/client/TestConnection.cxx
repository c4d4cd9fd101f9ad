// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "MockServer.hxx"
#include "client/Connection.hxx"
#include "client/Error.hxx"
#include "protocol/Ack.hxx"

#include <gtest/gtest.h>

#include <exception>

using Lines = std::vector<std::string>;

static ClientErrorCode
GetErrorCode(auto &&f)
{
	try {
		f();
	} catch (const ClientError &e) {
		return e.GetCode();
	}

	ADD_FAILURE() << "no ClientError thrown";
	return ClientErrorCode::CONNECTION;
}

TEST(Connection, Greeting)
{
	MockServer server{[](MockSession &s, unsigned){
		s.SendGreeting("0.23.5");
		EXPECT_FALSE(s.ReceiveLine());
	}};

	Connection c{server.MakeConfig(), ConnectionMode::COMMAND};
	EXPECT_FALSE(c.IsConnected());
	EXPECT_FALSE(c.GetVersion());

	c.Connect();
	EXPECT_TRUE(c.IsConnected());
	EXPECT_EQ(c.GetVersion(), (ProtocolVersion{0, 23, 5}));

	/* connecting twice is a no-op */
	c.Connect();
	EXPECT_TRUE(c.IsConnected());

	c.Disconnect();
	EXPECT_FALSE(c.IsConnected());
	EXPECT_FALSE(c.GetVersion());

	c.Disconnect();
	EXPECT_FALSE(c.IsConnected());
	EXPECT_FALSE(c.HasBufferedData());
}

TEST(Connection, DisconnectUnconnected)
{
	Connection c{ClientConfig{}, ConnectionMode::COMMAND};

	c.Disconnect();
	EXPECT_FALSE(c.IsConnected());
	EXPECT_FALSE(c.HasBufferedData());
	EXPECT_FALSE(c.GetVersion());

	c.Disconnect();
	EXPECT_FALSE(c.IsConnected());
	EXPECT_FALSE(c.HasBufferedData());
}

TEST(Connection, Run)
{
	MockServer server{[](MockSession &s, unsigned){
		s.SendGreeting();
		EXPECT_EQ(s.ReceiveLine(), "status");
		s.Send("volume: 50\nstate: play\nOK\n");
		EXPECT_EQ(s.ReceiveLine(), "ping");
		s.Send("OK\n");
		EXPECT_FALSE(s.ReceiveLine());
	}};

	Connection c{server.MakeConfig(), ConnectionMode::COMMAND};
	c.Connect();
	EXPECT_EQ(c.Run({"status"}), (Lines{"volume: 50", "state: play", "OK"}));
	EXPECT_EQ(c.Run({"ping"}), Lines{"OK"});
	EXPECT_TRUE(c.Run(std::span<const std::string>{}).empty());
}

TEST(Connection, CommandList)
{
	MockServer server{[](MockSession &s, unsigned){
		s.SendGreeting();
		EXPECT_EQ(s.ReceiveLine(), "command_list_begin");
		EXPECT_EQ(s.ReceiveLine(), "clear");
		EXPECT_EQ(s.ReceiveLine(), "load \"Road Trip\"");
		EXPECT_EQ(s.ReceiveLine(), "command_list_end");
		s.Send("OK\n");
		EXPECT_FALSE(s.ReceiveLine());
	}};

	Connection c{server.MakeConfig(), ConnectionMode::COMMAND};
	c.Connect();

	/* only one terminal line is consumed for the whole batch */
	EXPECT_EQ(c.Run({"clear", "load \"Road Trip\""}), Lines{"OK"});
}

TEST(Connection, Ack)
{
	MockServer server{[](MockSession &s, unsigned){
		s.SendGreeting();
		EXPECT_EQ(s.ReceiveLine(), "foo");
		s.Send("ACK [5@0] {foo} unknown command \"foo\"\n");
		EXPECT_EQ(s.ReceiveCommand(), "status\ncurrentsong");
		s.Send("state: stop\nACK [50@1] {currentsong} No such song\n");
		EXPECT_EQ(s.ReceiveLine(), "ping");
		s.Send("OK\n");
		EXPECT_FALSE(s.ReceiveLine());
	}};

	Connection c{server.MakeConfig(), ConnectionMode::COMMAND};
	c.Connect();

	try {
		c.Run({"foo"});
		FAIL() << "ACK not detected";
	} catch (const ProtocolError &e) {
		EXPECT_STREQ(e.what(), "ACK [5@0] {foo} unknown command \"foo\"");
		EXPECT_EQ(e.GetCode(), ACK_ERROR_UNKNOWN);
		EXPECT_EQ(e.GetCommand(), "foo");
	}

	/* an ACK after data lines fails as well */
	try {
		c.Run({"status", "currentsong"});
		FAIL() << "ACK not detected";
	} catch (const ProtocolError &e) {
		EXPECT_STREQ(e.what(), "ACK [50@1] {currentsong} No such song");
		EXPECT_EQ(e.GetListIndex(), 1U);
	}

	/* the connection survives */
	EXPECT_TRUE(c.IsConnected());
	EXPECT_EQ(c.Run({"ping"}), Lines{"OK"});
}

TEST(Connection, ServerClose)
{
	MockServer server{[](MockSession &s, unsigned){
		s.SendGreeting();
		EXPECT_EQ(s.ReceiveLine(), "status");
		s.Send("volume: 50\n");
	}};

	Connection c{server.MakeConfig(), ConnectionMode::COMMAND};
	c.Connect();

	EXPECT_EQ(GetErrorCode([&]{ c.Run({"status"}); }),
		  ClientErrorCode::CLOSED);
	EXPECT_FALSE(c.IsConnected());

	EXPECT_EQ(GetErrorCode([&]{ c.Run({"status"}); }),
		  ClientErrorCode::CONNECTION);
}

TEST(Connection, NotConnected)
{
	Connection c{ClientConfig{}, ConnectionMode::COMMAND};
	EXPECT_EQ(GetErrorCode([&]{ c.Run({"ping"}); }),
		  ClientErrorCode::CONNECTION);
}

TEST(Connection, WrongMode)
{
	Connection command{ClientConfig{}, ConnectionMode::COMMAND};
	EXPECT_EQ(GetErrorCode([&]{ command.Run({"idle"}); }),
		  ClientErrorCode::WRONG_MODE);
	EXPECT_EQ(GetErrorCode([&]{ command.Run({"noidle"}); }),
		  ClientErrorCode::WRONG_MODE);
	EXPECT_EQ(GetErrorCode([&]{ command.Run({"albumart \"a.flac\" 0"}); }),
		  ClientErrorCode::WRONG_MODE);

	/* the whole batch is rejected */
	EXPECT_EQ(GetErrorCode([&]{ command.Run({"status", "idle player"}); }),
		  ClientErrorCode::WRONG_MODE);

	Connection idle{ClientConfig{}, ConnectionMode::IDLE};
	EXPECT_EQ(GetErrorCode([&]{ idle.Run({"readpicture \"a.flac\" 0"}); }),
		  ClientErrorCode::WRONG_MODE);

	Connection artwork{ClientConfig{}, ConnectionMode::ARTWORK};
	EXPECT_EQ(GetErrorCode([&]{ artwork.Run({"idle"}); }),
		  ClientErrorCode::WRONG_MODE);

	try {
		command.Run({"idle database"});
		FAIL() << "wrong mode not detected";
	} catch (const ClientError &e) {
		EXPECT_STREQ(e.what(),
			     "Command \"idle\" is not allowed on a command connection");
	}
}

TEST(Connection, UnsupportedVersion)
{
	MockServer server{[](MockSession &s, unsigned){
		s.SendGreeting("0.21.25");
		EXPECT_FALSE(s.ReceiveLine());
	}};

	Connection c{server.MakeConfig(), ConnectionMode::COMMAND};
	EXPECT_EQ(GetErrorCode([&]{ c.Connect(); }),
		  ClientErrorCode::UNSUPPORTED_VERSION);
	EXPECT_FALSE(c.IsConnected());
}

TEST(Connection, BadGreeting)
{
	MockServer server{[](MockSession &s, unsigned){
		s.Send("HELLO\n");
		EXPECT_FALSE(s.ReceiveLine());
	}};

	Connection c{server.MakeConfig(), ConnectionMode::COMMAND};

	try {
		c.Connect();
		FAIL() << "bad greeting not detected";
	} catch (const ClientError &e) {
		EXPECT_EQ(e.GetCode(), ClientErrorCode::CONNECTION);

		try {
			std::rethrow_if_nested(e);
			FAIL() << "no nested exception";
		} catch (const ClientError &nested) {
			EXPECT_EQ(nested.GetCode(), ClientErrorCode::MALFORMED);
		}
	}

	EXPECT_FALSE(c.IsConnected());
}

TEST(Connection, Password)
{
	MockServer server{[](MockSession &s, unsigned n){
		s.SendGreeting();
		EXPECT_EQ(s.ReceiveLine(), R"(password "se\"cret")");

		if (n == 0) {
			s.Send("OK\n");
			EXPECT_EQ(s.ReceiveLine(), "ping");
			s.Send("OK\n");
		} else
			s.Send("ACK [3@0] {password} incorrect password\n");

		EXPECT_FALSE(s.ReceiveLine());
	}};

	auto config = server.MakeConfig();
	config.password = "se\"cret";

	{
		Connection c{config, ConnectionMode::COMMAND};
		c.Connect();
		EXPECT_EQ(c.Run({"ping"}), Lines{"OK"});
	}

	Connection c{config, ConnectionMode::COMMAND};
	try {
		c.Connect();
		FAIL() << "wrong password not detected";
	} catch (const ProtocolError &e) {
		EXPECT_EQ(e.GetCode(), ACK_ERROR_PASSWORD);
	}

	EXPECT_FALSE(c.IsConnected());
}

TEST(Connection, WithConnection)
{
	MockServer server{[](MockSession &s, unsigned){
		s.SendGreeting();
		EXPECT_EQ(s.ReceiveLine(), "listplaylists");
		s.Send("playlist: Favorites\nOK\n");
		EXPECT_FALSE(s.ReceiveLine());
	}};

	Connection c{server.MakeConfig(), ConnectionMode::COMMAND};
	const auto lines = c.WithConnection([&]{
		EXPECT_TRUE(c.IsConnected());
		return c.Run({"listplaylists"});
	});

	EXPECT_EQ(lines, (Lines{"playlist: Favorites", "OK"}));
	EXPECT_FALSE(c.IsConnected());
}
