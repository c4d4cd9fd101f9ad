// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "SocketAddress.hxx" // IWYU pragma: export

#include <algorithm> // for std::copy()
#include <stdexcept> // for std::length_error
#include <string_view>

#include <sys/un.h>

/**
 * A local (AF_LOCAL) socket address.  A path beginning with '@'
 * denotes a Linux abstract socket.
 */
class LocalSocketAddress {
	SocketAddress::size_type size;
	struct sockaddr_un address;

public:
	/**
	 * Throws std::length_error if the path is too long.
	 */
	explicit LocalSocketAddress(std::string_view path)
		:address{} {
		if (path.size() >= sizeof(address.sun_path))
			throw std::length_error{"Path is too long"};

		address.sun_family = AF_LOCAL;
		auto end = std::copy(path.begin(), path.end(),
				     address.sun_path);

		if (path.starts_with('@')) {
			/* abstract socket: the leading null byte is
			   part of the address, the trailing one is
			   not */
			address.sun_path[0] = 0;
		} else {
			*end++ = 0;
		}

		size = SocketAddress::size_type(end - (const char *)&address);
	}

	operator SocketAddress() const noexcept {
		return {(const struct sockaddr *)(const void *)&address, size};
	}
};
