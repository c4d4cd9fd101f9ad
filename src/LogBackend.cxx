// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "LogBackend.hxx"
#include "Log.hxx"
#include "thread/Mutex.hxx"
#include "util/Domain.hxx"
#include "util/Exception.hxx"
#include "util/StringStrip.hxx"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <atomic>
#include <iterator> // for std::back_inserter()

#include <stdio.h>
#include <time.h>

static constexpr Domain exception_domain("exception");

static std::atomic<LogLevel> log_threshold{LogLevel::NOTICE};

static std::atomic_bool enable_timestamp{false};

/**
 * Serializes writes to stderr, because the idle loop logs from its
 * own thread.
 */
static Mutex log_mutex;

void
SetLogThreshold(LogLevel _threshold) noexcept
{
	log_threshold = _threshold;
}

void
EnableLogTimestamp() noexcept
{
	enable_timestamp = true;
}

static void
FileLog(const Domain &domain, std::string_view message) noexcept
{
	const std::scoped_lock lock{log_mutex};

	if (enable_timestamp) {
		const time_t t = time(nullptr);
		struct tm tm;
		if (localtime_r(&t, &tm) != nullptr)
			fmt::print(stderr, "{:%FT%T} ", tm);
	}

	fmt::print(stderr, "{}: {}\n",
		   domain.GetName(), StripRight(message));
}

void
Log(LogLevel level, const Domain &domain, std::string_view msg) noexcept
{
	if (level < log_threshold)
		return;

	FileLog(domain, msg);
}

void
LogVFmt(LogLevel level, const Domain &domain,
	fmt::string_view format_str, fmt::format_args args) noexcept
{
	if (level < log_threshold)
		/* don't bother formatting */
		return;

	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	FileLog(domain, {buffer.data(), buffer.size()});
}

void
LogError(const std::exception_ptr &ep) noexcept
{
	Log(LogLevel::ERROR, exception_domain, GetFullMessage(ep));
}

void
LogError(const std::exception_ptr &ep, const char *msg) noexcept
{
	LogFmt(LogLevel::ERROR, exception_domain, "{}: {}",
	       msg, GetFullMessage(ep));
}
