// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "SocketConnect.hxx"
#include "AddressInfo.hxx"
#include "LocalSocketAddress.hxx"
#include "Resolver.hxx"
#include "SocketError.hxx"
#include "UniqueSocketDescriptor.hxx"

#include <exception>
#include <stdexcept>

static bool
IsLocalSocketHost(const char *host) noexcept
{
	return *host == '/' || *host == '@';
}

UniqueSocketDescriptor
ConnectSocket(SocketAddress address, std::chrono::milliseconds timeout)
{
	UniqueSocketDescriptor fd;
	if (!fd.CreateNonBlock(address.GetFamily(), SOCK_STREAM, 0))
		throw MakeSocketError("Failed to create socket");

	if (!fd.Connect(address)) {
		const auto e = GetSocketError();
		if (!IsSocketErrorConnectWouldBlock(e))
			throw MakeSocketError(e, "Failed to connect");

		int ready;
		do {
			ready = fd.WaitWritable(timeout.count());
		} while (ready < 0 && IsSocketErrorInterruped(GetSocketError()));

		if (ready < 0)
			throw MakeSocketError("Failed to wait for connection");

		if (ready == 0)
			throw MakeSocketError(ETIMEDOUT, "Connect timeout");

		const int error = fd.GetError();
		if (error != 0)
			throw MakeSocketError(error, "Failed to connect");
	}

	if (!fd.SetBlocking())
		throw MakeSocketError("Failed to switch socket to blocking mode");

	return fd;
}

UniqueSocketDescriptor
ResolveConnectSocket(const char *host, unsigned port,
		     std::chrono::milliseconds timeout)
{
	if (IsLocalSocketHost(host))
		return ConnectSocket(LocalSocketAddress{host}, timeout);

	const auto list = Resolve(host, port, AI_ADDRCONFIG, SOCK_STREAM);

	std::exception_ptr error;
	for (const auto &i : list) {
		try {
			auto fd = ConnectSocket(i, timeout);
			if (!fd.SetNoDelay())
				throw MakeSocketError("Failed to set TCP_NODELAY");
			return fd;
		} catch (...) {
			error = std::current_exception();
		}
	}

	if (error)
		std::rethrow_exception(error);

	throw std::runtime_error("Host name resolved to no address");
}
