// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "IdleLoop.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <bit>

static constexpr Domain idle_domain("idle");

IdleLoop::IdleLoop(const ClientConfig &config, unsigned _mask,
		   IdleListener &_listener) noexcept
	:connection(config), listener(_listener), mask(_mask),
	 thread([this]{ Run(); })
{
}

void
IdleLoop::Start()
{
	{
		const std::lock_guard lock{mutex};
		cancel = false;
	}

	thread.Start();
}

void
IdleLoop::Stop() noexcept
{
	if (!thread.IsDefined())
		return;

	{
		const std::lock_guard lock{mutex};
		cancel = true;
		cond.notify_all();
	}

	/* wake up a blocking "idle" */
	connection.Interrupt();

	thread.Join();
}

bool
IdleLoop::WaitReconnect() noexcept
{
	std::unique_lock lock{mutex};
	cond.wait_for(lock, connection.GetConfig().reconnect_interval,
		      [this]{ return cancel; });
	return !cancel;
}

void
IdleLoop::IdleUntilError()
{
	while (!IsCancelled()) {
		unsigned events = connection.IdleForEventMask(mask);

		while (events != 0) {
			const unsigned flag = 1U << std::countr_zero(events);
			events &= ~flag;

			FmtDebug(idle_domain, "changed: {}",
				 idle_event_name(IdleEvent(flag)));
			listener.OnIdleEvent(IdleEvent(flag));
		}
	}
}

void
IdleLoop::Run() noexcept
{
	while (!IsCancelled()) {
		try {
			connection.Connect();
		} catch (...) {
			if (IsCancelled())
				break;

			listener.OnIdleError(std::current_exception());

			if (!WaitReconnect())
				break;

			continue;
		}

		try {
			IdleUntilError();
		} catch (...) {
			connection.Disconnect();

			if (IsCancelled())
				break;

			/* reconnect immediately; the backoff applies
			   only if that fails */
			listener.OnIdleError(std::current_exception());
		}
	}

	connection.Disconnect();
}
