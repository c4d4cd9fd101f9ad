// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <system_error>

class AddressInfoList;

class ResolverErrorCategory final : public std::error_category {
public:
	const char *name() const noexcept override {
		return "gai";
	}

	std::string message(int condition) const override;
};

extern ResolverErrorCategory resolver_error_category;

/**
 * Thin wrapper for getaddrinfo() which throws on error and returns a
 * RAII object.
 *
 * getaddrinfo() errors are thrown as std::system_error with
 * #resolver_error_category.
 */
AddressInfoList
Resolve(const char *node, const char *service,
	const struct addrinfo *hints);

/**
 * Resolve a host name and a numeric port.
 *
 * Throws on error.
 */
AddressInfoList
Resolve(const char *host, unsigned port, int flags, int socktype);
