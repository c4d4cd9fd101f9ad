// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MPDLINK_THREAD_HXX
#define MPDLINK_THREAD_HXX

#include <cassert>
#include <functional>
#include <utility>

#include <pthread.h>

/**
 * A thin wrapper for a POSIX thread.  The owner must call Join()
 * before destroying the object.
 */
class Thread {
	using Function = std::function<void()>;
	const Function f;

	pthread_t handle = pthread_t();

public:
	/**
	 * @param _f the thread function; it must not throw
	 */
	explicit Thread(Function _f) noexcept:f(std::move(_f)) {}

	Thread(const Thread &) = delete;
	Thread &operator=(const Thread &) = delete;

#ifndef NDEBUG
	~Thread() noexcept {
		/* all Thread objects must be destructed manually by calling
		   Join(), to clean up */
		assert(!IsDefined());
	}
#endif

	bool IsDefined() const noexcept {
		return handle != pthread_t();
	}

	/**
	 * Check if this thread is the current thread.
	 */
	[[gnu::pure]]
	bool IsInside() const noexcept {
		return IsDefined() && pthread_equal(pthread_self(), handle);
	}

	/**
	 * Start the thread.
	 *
	 * Throws on error.
	 */
	void Start();

	void Join() noexcept;

private:
	static void *ThreadProc(void *ctx) noexcept;
};

#endif
