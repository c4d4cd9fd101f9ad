// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Resolver.hxx"
#include "AddressInfo.hxx"

#include <fmt/format.h>

#include <sys/socket.h>
#include <netdb.h>

ResolverErrorCategory resolver_error_category;

std::string
ResolverErrorCategory::message(int condition) const
{
	return gai_strerror(condition);
}

AddressInfoList
Resolve(const char *node, const char *service,
	const struct addrinfo *hints)
{
	struct addrinfo *ai;
	int error = getaddrinfo(node, service, hints, &ai);
	if (error != 0)
		throw std::system_error(error, resolver_error_category,
					fmt::format("Failed to resolve '{}':'{}'",
						    node == nullptr ? "" : node,
						    service == nullptr ? "" : service));

	return AddressInfoList(ai);
}

AddressInfoList
Resolve(const char *host, unsigned port, int flags, int socktype)
{
	const struct addrinfo hints{
		.ai_flags = flags,
		.ai_family = AF_UNSPEC,
		.ai_socktype = socktype,
	};

	const auto service = fmt::format_int(port);
	return Resolve(host, service.c_str(), &hints);
}
