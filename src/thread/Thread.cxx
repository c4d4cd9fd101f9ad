// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Thread.hxx"
#include "system/Error.hxx"

void
Thread::Start()
{
	assert(!IsDefined());

	int e = pthread_create(&handle, nullptr, ThreadProc, this);
	if (e != 0) {
		handle = pthread_t();
		throw MakeErrno(e, "Failed to create thread");
	}
}

void
Thread::Join() noexcept
{
	assert(IsDefined());
	assert(!IsInside());

	pthread_join(handle, nullptr);
	handle = pthread_t();
}

void *
Thread::ThreadProc(void *ctx) noexcept
{
	Thread &thread = *(Thread *)ctx;

	thread.f();
	return nullptr;
}
