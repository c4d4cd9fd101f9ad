// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef MPDLINK_SOCKET_DESCRIPTOR_HXX
#define MPDLINK_SOCKET_DESCRIPTOR_HXX

#include <cstddef>
#include <span>
#include <type_traits>
#include <utility>

#include <sys/types.h> // for ssize_t

class SocketAddress;

/**
 * An OO wrapper for a Berkeley socket descriptor.  This class does
 * not own the descriptor; see #UniqueSocketDescriptor.
 */
class SocketDescriptor {
protected:
	int fd;

public:
	SocketDescriptor() = default;

	explicit constexpr SocketDescriptor(int _fd) noexcept
		:fd(_fd) {}

	constexpr bool operator==(SocketDescriptor other) const noexcept {
		return fd == other.fd;
	}

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	constexpr int Get() const noexcept {
		return fd;
	}

	constexpr int Steal() noexcept {
		return std::exchange(fd, -1);
	}

	static constexpr SocketDescriptor Undefined() noexcept {
		return SocketDescriptor(-1);
	}

	void Close() noexcept;

	/**
	 * Create a socket.
	 *
	 * @param domain is the address domain
	 * @param type is the socket type
	 * @param protocol is the protocol
	 * @return True on success, False on failure
	 * See man 2 socket for detailed information
	 */
	bool Create(int domain, int type, int protocol) noexcept;

	/**
	 * Like Create(), but enable non-blocking mode.
	 */
	bool CreateNonBlock(int domain, int type, int protocol) noexcept;

	bool SetBlocking() const noexcept;

	[[gnu::pure]]
	int GetError() const noexcept;

	bool SetOption(int level, int name,
		       const void *value, std::size_t size) const noexcept;

	bool SetBoolOption(int level, int name, bool value) const noexcept {
		const int i = value;
		return SetOption(level, name, &i, sizeof(i));
	}

	bool SetNoDelay(bool value=true) const noexcept;

	bool Bind(SocketAddress address) const noexcept;

	bool Listen(int backlog) const noexcept;

	SocketDescriptor Accept() const noexcept;

	bool Connect(SocketAddress address) const noexcept;

	/**
	 * Determine the port this (inet) socket is bound to.  Returns
	 * 0 on error.
	 */
	[[gnu::pure]]
	unsigned GetLocalPort() const noexcept;

	/**
	 * Wrapper for recv().
	 */
	ssize_t Receive(std::span<std::byte> dest, int flags=0) const noexcept;

	/**
	 * Wrapper for send().
	 *
	 * MSG_NOSIGNAL is implicitly added.
	 */
	ssize_t Send(std::span<const std::byte> src, int flags=0) const noexcept;

	/**
	 * Wait until the socket becomes writable.
	 *
	 * @param timeout_ms the timeout in milliseconds or -1 to wait
	 * forever
	 * @return a positive value if ready, 0 on timeout, -1 on error
	 */
	int WaitWritable(int timeout_ms) const noexcept;

	/**
	 * Shut down both directions.  A thread blocked in Receive()
	 * on this socket wakes up and sees end-of-stream.
	 */
	void Shutdown() const noexcept;
};

static_assert(std::is_trivial<SocketDescriptor>::value, "type is not trivial");

#endif
