// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "MockServer.hxx"
#include "client/IdleConnection.hxx"
#include "client/IdleLoop.hxx"
#include "client/Error.hxx"
#include "thread/Mutex.hxx"
#include "thread/Cond.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;

using Lines = std::vector<std::string>;

TEST(Idle, MakeCommand)
{
	EXPECT_EQ(MakeIdleCommand(0), "idle");
	EXPECT_EQ(MakeIdleCommand(IDLE_ALL), "idle");
	EXPECT_EQ(MakeIdleCommand(IDLE_PLAYER), "idle player");
	EXPECT_EQ(MakeIdleCommand(IDLE_MIXER|IDLE_PLAYER|IDLE_DATABASE),
		  "idle database player mixer");
}

TEST(Idle, ParseResponse)
{
	EXPECT_EQ(ParseIdleResponse(Lines{"changed: player", "OK"}),
		  IDLE_PLAYER);
	EXPECT_EQ(ParseIdleResponse(Lines{
				"changed: mixer",
				"changed: options",
				"OK",
			}),
		  IDLE_MIXER|IDLE_OPTIONS);

	EXPECT_THROW(ParseIdleResponse(Lines{"OK"}), ClientError);
	EXPECT_THROW(ParseIdleResponse(Lines{"changed: weather", "OK"}),
		     ClientError);
}

TEST(Idle, Connection)
{
	MockServer server{[](MockSession &s, unsigned){
		s.SendGreeting();
		EXPECT_EQ(s.ReceiveLine(), "idle player mixer");
		s.Send("changed: mixer\nchanged: player\nOK\n");
		EXPECT_EQ(s.ReceiveLine(), "idle");
		s.Send("changed: update\nchanged: database\nOK\n");
		EXPECT_FALSE(s.ReceiveLine());
	}};

	IdleConnection c{server.MakeConfig()};
	c.Connect();

	/* the first "changed" line wins */
	EXPECT_EQ(c.IdleForEvents(IDLE_PLAYER|IDLE_MIXER), IdleEvent::MIXER);
	EXPECT_EQ(c.IdleForEventMask(0), IDLE_UPDATE|IDLE_DATABASE);
}

namespace {

/**
 * Records events and errors and allows waiting for them.
 */
class RecordingListener final : public IdleListener {
	Mutex mutex;
	Cond cond;

	std::vector<IdleEvent> events;
	std::vector<std::string> errors;

public:
	bool WaitEvents(std::size_t n) {
		std::unique_lock lock{mutex};
		return cond.wait_for(lock, 5s, [this, n]{
			return events.size() >= n;
		});
	}

	std::vector<IdleEvent> GetEvents() {
		const std::lock_guard lock{mutex};
		return events;
	}

	std::vector<std::string> GetErrors() {
		const std::lock_guard lock{mutex};
		return errors;
	}

	/* virtual methods from IdleListener */
	void OnIdleEvent(IdleEvent event) noexcept override {
		const std::lock_guard lock{mutex};
		events.push_back(event);
		cond.notify_all();
	}

	void OnIdleError(std::exception_ptr error) noexcept override {
		const std::lock_guard lock{mutex};
		errors.push_back(GetFullMessage(error));
		cond.notify_all();
	}
};

} // anonymous namespace

TEST(IdleLoop, Events)
{
	MockServer server{[](MockSession &s, unsigned n){
		s.SendGreeting();
		EXPECT_EQ(s.ReceiveLine(), "idle player options");

		if (n == 0) {
			s.Send("changed: player\nchanged: options\nOK\n");
			EXPECT_EQ(s.ReceiveLine(), "idle player options");

			/* drop the connection; the loop reconnects */
			return;
		}

		s.Send("changed: options\nOK\n");

		/* block until the loop is stopped */
		while (s.ReceiveLine()) {}
	}};

	RecordingListener listener;
	IdleLoop loop{server.MakeConfig(), IDLE_PLAYER|IDLE_OPTIONS, listener};
	EXPECT_FALSE(loop.IsRunning());

	loop.Start();
	EXPECT_TRUE(loop.IsRunning());

	ASSERT_TRUE(listener.WaitEvents(3));
	loop.Stop();
	EXPECT_FALSE(loop.IsRunning());

	/* flags are delivered one at a time, in bit order */
	EXPECT_EQ(listener.GetEvents(),
		  (std::vector<IdleEvent>{
			  IdleEvent::PLAYER,
			  IdleEvent::OPTIONS,
			  IdleEvent::OPTIONS,
		  }));

	const auto errors = listener.GetErrors();
	ASSERT_EQ(errors.size(), 1U);
	EXPECT_EQ(errors.front(), "Connection closed by server");
}

TEST(IdleLoop, ConnectFailure)
{
	MockServer server{[](MockSession &s, unsigned n){
		if (n == 0)
			/* close without greeting */
			return;

		s.SendGreeting();
		EXPECT_EQ(s.ReceiveLine(), "idle");
		s.Send("changed: database\nOK\n");
		while (s.ReceiveLine()) {}
	}};

	RecordingListener listener;
	IdleLoop loop{server.MakeConfig(), 0, listener};
	loop.Start();

	/* the loop waits for the reconnect interval and tries
	   again */
	ASSERT_TRUE(listener.WaitEvents(1));
	loop.Stop();

	EXPECT_EQ(listener.GetEvents(),
		  std::vector<IdleEvent>{IdleEvent::DATABASE});

	const auto errors = listener.GetErrors();
	ASSERT_EQ(errors.size(), 1U);
	EXPECT_NE(errors.front().find("Failed to connect to MPD '127.0.0.1'"),
		  std::string::npos);
}

TEST(IdleLoop, StopWhileWaiting)
{
	MockServer server{[](MockSession &, unsigned){
		/* never send a greeting */
	}};

	auto config = server.MakeConfig();
	config.reconnect_interval = 1h;

	RecordingListener listener;
	IdleLoop loop{config, 0, listener};
	loop.Start();

	/* must not wait for the reconnect interval */
	const auto start = std::chrono::steady_clock::now();
	loop.Stop();
	EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
	EXPECT_TRUE(listener.GetEvents().empty());
}
