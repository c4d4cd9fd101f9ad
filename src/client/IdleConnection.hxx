// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "Connection.hxx"
#include "protocol/IdleFlags.hxx"

/**
 * A connection which waits for "idle" events.
 */
class IdleConnection final : public Connection {
public:
	explicit IdleConnection(const ClientConfig &_config) noexcept
		:Connection(_config, ConnectionMode::IDLE) {}

	/**
	 * Send "idle" and block until the server reports a change in
	 * one of the subsystems.  Returns the first event of the
	 * response.
	 *
	 * @param mask a bit mask of IDLE_* flags; 0 means all
	 *
	 * Throws #ClientError with #ClientErrorCode::MALFORMED if the
	 * response contains no (or an unknown) "changed" line.
	 */
	IdleEvent IdleForEvents(unsigned mask);

	/**
	 * Like IdleForEvents(), but return all events of the
	 * response as a bit mask.
	 */
	unsigned IdleForEventMask(unsigned mask);
};

/**
 * Build the "idle" command for the given mask.
 */
[[gnu::pure]]
std::string
MakeIdleCommand(unsigned mask) noexcept;

/**
 * Collect the "changed" lines of an "idle" response.
 *
 * Throws #ClientError with #ClientErrorCode::MALFORMED if there is
 * no "changed" line or if a name is unknown.
 */
unsigned
ParseIdleResponse(std::span<const std::string> lines);
