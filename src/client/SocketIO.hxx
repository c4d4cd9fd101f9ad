// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include "io/Reader.hxx"
#include "net/SocketDescriptor.hxx"

#include <span>

/**
 * A #Reader which receives from a (blocking) socket.
 */
class SocketReader final : public Reader {
	SocketDescriptor s;

public:
	explicit SocketReader(SocketDescriptor _s) noexcept
		:s(_s) {}

	/* virtual methods from class Reader */
	std::size_t Read(std::span<std::byte> dest) override;
};

/**
 * Send the whole buffer to a (blocking) socket, repeating after
 * partial writes.
 *
 * Throws std::system_error on error.
 */
void
SendFull(SocketDescriptor s, std::span<const std::byte> src);
