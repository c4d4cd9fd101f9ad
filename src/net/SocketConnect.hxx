// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <chrono>

class SocketAddress;
class UniqueSocketDescriptor;

/**
 * Create a stream socket and connect it to the given address,
 * waiting at most #timeout.  The returned socket is in blocking
 * mode.
 *
 * Throws std::system_error on error.
 */
UniqueSocketDescriptor
ConnectSocket(SocketAddress address, std::chrono::milliseconds timeout);

/**
 * Connect to a MPD-style host specification: an absolute path or a
 * name beginning with '@' is a local socket (and #port is ignored),
 * everything else is resolved with getaddrinfo() and each address is
 * tried in order until one succeeds.
 *
 * Throws on error; if all addresses fail, the last error is thrown.
 */
UniqueSocketDescriptor
ResolveConnectSocket(const char *host, unsigned port,
		     std::chrono::milliseconds timeout);
