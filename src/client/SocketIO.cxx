// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "SocketIO.hxx"
#include "net/SocketError.hxx"

std::size_t
SocketReader::Read(std::span<std::byte> dest)
{
	while (true) {
		const auto nbytes = s.Receive(dest);
		if (nbytes >= 0)
			return static_cast<std::size_t>(nbytes);

		const auto e = GetSocketError();
		if (IsSocketErrorInterruped(e))
			continue;

		/* the peer has reset the connection */
		if (IsSocketErrorClosed(e))
			return 0;

		throw MakeSocketError(e, "Failed to receive from socket");
	}
}

void
SendFull(SocketDescriptor s, std::span<const std::byte> src)
{
	while (!src.empty()) {
		const auto nbytes = s.Send(src);
		if (nbytes < 0) {
			const auto e = GetSocketError();
			if (IsSocketErrorInterruped(e))
				continue;

			throw MakeSocketError(e, "Failed to send to socket");
		}

		src = src.subspan(static_cast<std::size_t>(nbytes));
	}
}
