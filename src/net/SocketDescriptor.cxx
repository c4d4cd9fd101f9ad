/*
 * Copyright 2012-2019 Max Kellermann <max.kellermann@gmail.com>
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions
 * are met:
 *
 * - Redistributions of source code must retain the above copyright
 * notice, this list of conditions and the following disclaimer.
 *
 * - Redistributions in binary form must reproduce the above copyright
 * notice, this list of conditions and the following disclaimer in the
 * documentation and/or other materials provided with the
 * distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * ``AS IS'' AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS
 * FOR A PARTICULAR PURPOSE ARE DISCLAIMED.  IN NO EVENT SHALL THE
 * FOUNDATION OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
 * INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
 * SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION)
 * HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT,
 * STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED
 * OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include "SocketDescriptor.hxx"
#include "SocketAddress.hxx"

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cassert>
#include <cerrno>

void
SocketDescriptor::Close() noexcept
{
	if (IsDefined())
		::close(Steal());
}

bool
SocketDescriptor::Create(int domain, int type, int protocol) noexcept
{
	/* implemented since Linux 2.6.27 */
	type |= SOCK_CLOEXEC;

	int new_fd = socket(domain, type, protocol);
	if (new_fd < 0)
		return false;

	fd = new_fd;
	return true;
}

bool
SocketDescriptor::CreateNonBlock(int domain, int type, int protocol) noexcept
{
	return Create(domain, type | SOCK_NONBLOCK, protocol);
}

bool
SocketDescriptor::SetBlocking() const noexcept
{
	assert(IsDefined());

	int flags = fcntl(fd, F_GETFL);
	return flags >= 0 && fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) == 0;
}

int
SocketDescriptor::GetError() const noexcept
{
	assert(IsDefined());

	int s_err = 0;
	socklen_t s_err_size = sizeof(s_err);
	return getsockopt(fd, SOL_SOCKET, SO_ERROR,
			  &s_err, &s_err_size) == 0
		? s_err
		: errno;
}

bool
SocketDescriptor::SetOption(int level, int name,
			    const void *value, std::size_t size) const noexcept
{
	assert(IsDefined());

	return setsockopt(fd, level, name, value, size) == 0;
}


bool
SocketDescriptor::SetNoDelay(bool value) const noexcept
{
	return SetBoolOption(IPPROTO_TCP, TCP_NODELAY, value);
}

bool
SocketDescriptor::Bind(SocketAddress address) const noexcept
{
	return bind(fd, address.GetAddress(), address.GetSize()) == 0;
}

bool
SocketDescriptor::Listen(int backlog) const noexcept
{
	return listen(fd, backlog) == 0;
}

SocketDescriptor
SocketDescriptor::Accept() const noexcept
{
	int connection_fd = ::accept4(fd, nullptr, nullptr, SOCK_CLOEXEC);
	return SocketDescriptor(connection_fd);
}

bool
SocketDescriptor::Connect(SocketAddress address) const noexcept
{
	assert(address.IsDefined());

	return ::connect(fd, address.GetAddress(), address.GetSize()) >= 0;
}

unsigned
SocketDescriptor::GetLocalPort() const noexcept
{
	assert(IsDefined());

	struct sockaddr_storage ss;
	socklen_t size = sizeof(ss);
	if (getsockname(fd, (struct sockaddr *)&ss, &size) < 0)
		return 0;

	switch (ss.ss_family) {
	case AF_INET:
		return ntohs(((const struct sockaddr_in *)&ss)->sin_port);

	case AF_INET6:
		return ntohs(((const struct sockaddr_in6 *)&ss)->sin6_port);

	default:
		return 0;
	}
}

ssize_t
SocketDescriptor::Receive(std::span<std::byte> dest, int flags) const noexcept
{
	return ::recv(fd, dest.data(), dest.size(), flags);
}

ssize_t
SocketDescriptor::Send(std::span<const std::byte> src, int flags) const noexcept
{
	flags |= MSG_NOSIGNAL;

	return ::send(fd, src.data(), src.size(), flags);
}

static int
Poll(int fd, short events, int timeout_ms) noexcept
{
	struct pollfd pfd{fd, events, 0};
	int result = poll(&pfd, 1, timeout_ms);
	return result > 0
		? pfd.revents
		: result;
}

int
SocketDescriptor::WaitWritable(int timeout_ms) const noexcept
{
	assert(IsDefined());

	return Poll(fd, POLLOUT, timeout_ms);
}

void
SocketDescriptor::Shutdown() const noexcept
{
	shutdown(fd, SHUT_RDWR);
}
