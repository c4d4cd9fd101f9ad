// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "IdleConnection.hxx"
#include "thread/Thread.hxx"
#include "thread/Mutex.hxx"
#include "thread/Cond.hxx"

#include <exception>

/**
 * Receives notifications from #IdleLoop.  All methods are invoked
 * in the loop's thread.
 */
class IdleListener {
public:
	virtual ~IdleListener() noexcept = default;

	/**
	 * The server has reported a change.
	 */
	virtual void OnIdleEvent(IdleEvent event) noexcept = 0;

	/**
	 * Connecting or waiting has failed.  The loop will retry.
	 */
	virtual void OnIdleError(std::exception_ptr error) noexcept = 0;
};

/**
 * Runs an #IdleConnection in a thread of its own, reconnecting
 * whenever the connection fails.  After a failed connect attempt,
 * it waits for ClientConfig::reconnect_interval.
 */
class IdleLoop {
	IdleConnection connection;

	IdleListener &listener;

	const unsigned mask;

	Thread thread;

	Mutex mutex;
	Cond cond;

	/**
	 * Set by Stop().  Protected by #mutex.
	 */
	bool cancel = false;

public:
	/**
	 * @param _mask the IDLE_* flags to wait for; 0 means all
	 */
	IdleLoop(const ClientConfig &config, unsigned _mask,
		 IdleListener &_listener) noexcept;

	~IdleLoop() noexcept {
		Stop();
	}

	IdleLoop(const IdleLoop &) = delete;
	IdleLoop &operator=(const IdleLoop &) = delete;

	bool IsRunning() const noexcept {
		return thread.IsDefined();
	}

	/**
	 * Start the thread.  Throws on error.
	 */
	void Start();

	/**
	 * Cancel the loop and wait for the thread to finish.  The
	 * connection is closed when this method returns.
	 */
	void Stop() noexcept;

private:
	bool IsCancelled() noexcept {
		const std::lock_guard lock{mutex};
		return cancel;
	}

	/**
	 * Wait before reconnecting.
	 *
	 * @return false if the loop was cancelled meanwhile
	 */
	bool WaitReconnect() noexcept;

	/**
	 * Wait for events until the connection fails or the loop is
	 * cancelled.
	 */
	void IdleUntilError();

	void Run() noexcept;
};
