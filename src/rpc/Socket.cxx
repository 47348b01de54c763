// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Socket.hxx"
#include "Exception.hxx"

#include <fmt/format.h>

#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <stdexcept>
#include <vector>

#include <errno.h>

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

static uint16_t
ParsePort(const char *s)
{
	char *endptr;
	const unsigned long value = std::strtoul(s, &endptr, 10);
	if (endptr == s || *endptr != 0 || value > 0xffff)
		throw std::invalid_argument(fmt::format("Malformed port number: {:?}", s));

	return static_cast<uint16_t>(value);
}

RpcAddress
ParseRpcAddress(const char *s, uint16_t default_port)
{
	RpcAddress address{{}, default_port};

	if (*s == '[') {
		const char *end = std::strchr(s + 1, ']');
		if (end == nullptr)
			throw std::invalid_argument("Missing ']'");

		address.host.assign(s + 1, end);

		if (end[1] == ':')
			address.port = ParsePort(end + 2);
		else if (end[1] != 0)
			throw std::invalid_argument("Garbage after ']'");

		return address;
	}

	const char *colon = std::strchr(s, ':');
	if (colon != nullptr && std::strchr(colon + 1, ':') != nullptr) {
		/* a bare IPv6 address */
		address.host = s;
		return address;
	}

	if (colon != nullptr) {
		address.host.assign(s, colon);
		address.port = ParsePort(colon + 1);
	} else
		address.host = s;

	if (address.host == "*")
		address.host.clear();

	return address;
}

struct AddrInfoDeleter {
	void operator()(struct addrinfo *ai) const noexcept {
		freeaddrinfo(ai);
	}
};

using AddrInfoPtr = std::unique_ptr<struct addrinfo, AddrInfoDeleter>;

static AddrInfoPtr
Resolve(const RpcAddress &address, bool passive)
{
	struct addrinfo hints{};
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;
	hints.ai_flags = passive ? AI_PASSIVE : 0;

	const auto service = fmt::format("{}", address.port);

	struct addrinfo *ai;
	int result = getaddrinfo(address.host.empty() ? nullptr : address.host.c_str(),
				 service.c_str(), &hints, &ai);
	if (result != 0)
		throw FmtRuntimeError("Failed to resolve {:?}: {}",
				      address.host, gai_strerror(result));

	return AddrInfoPtr{ai};
}

static OwnedFd
TryListen(const struct addrinfo &ai)
{
	OwnedFd fd{socket(ai.ai_family,
			  ai.ai_socktype|SOCK_CLOEXEC|SOCK_NONBLOCK,
			  ai.ai_protocol)};
	if (!fd.IsDefined())
		throw MakeErrno("Failed to create socket");

	const int one = 1;
	setsockopt(fd.Get(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

	if (ai.ai_family == AF_INET6) {
		/* accept IPv4 connections, too */
		const int zero = 0;
		setsockopt(fd.Get(), IPPROTO_IPV6, IPV6_V6ONLY,
			   &zero, sizeof(zero));
	}

	if (bind(fd.Get(), ai.ai_addr, ai.ai_addrlen) < 0)
		throw MakeErrno("Failed to bind");

	if (listen(fd.Get(), 64) < 0)
		throw MakeErrno("Failed to listen");

	return fd;
}

OwnedFd
OpenRpcListener(const RpcAddress &address)
{
	const auto ai = Resolve(address, true);

	/* for the wildcard address, try IPv6 first */
	std::vector<const struct addrinfo *> candidates;
	for (const auto *i = ai.get(); i != nullptr; i = i->ai_next)
		if (i->ai_family == AF_INET6)
			candidates.push_back(i);
	for (const auto *i = ai.get(); i != nullptr; i = i->ai_next)
		if (i->ai_family != AF_INET6)
			candidates.push_back(i);

	std::exception_ptr error;
	for (const auto *i : candidates) {
		try {
			return TryListen(*i);
		} catch (const std::system_error &) {
			error = std::current_exception();
		}
	}

	if (error)
		std::rethrow_exception(error);

	throw FmtRuntimeError("No address for port {}", address.port);
}

OwnedFd
ConnectRpc(const RpcAddress &address)
{
	const auto ai = Resolve(address.host.empty()
				? RpcAddress{"localhost", address.port}
				: address,
				false);

	int last_errno = 0;
	for (const auto *i = ai.get(); i != nullptr; i = i->ai_next) {
		OwnedFd fd{socket(i->ai_family, i->ai_socktype|SOCK_CLOEXEC,
				  i->ai_protocol)};
		if (!fd.IsDefined())
			throw MakeErrno("Failed to create socket");

		if (connect(fd.Get(), i->ai_addr, i->ai_addrlen) == 0)
			return fd;

		last_errno = errno;
	}

	throw FmtErrno(last_errno, "Failed to connect to {:?} port {}",
		       address.host, address.port);
}

uint16_t
GetLocalPort(int fd)
{
	struct sockaddr_storage ss;
	socklen_t size = sizeof(ss);
	if (getsockname(fd, (struct sockaddr *)&ss, &size) < 0)
		throw MakeErrno("getsockname() failed");

	switch (ss.ss_family) {
	case AF_INET:
		return ntohs(((const struct sockaddr_in *)&ss)->sin_port);

	case AF_INET6:
		return ntohs(((const struct sockaddr_in6 *)&ss)->sin6_port);

	default:
		throw std::runtime_error("Unsupported address family");
	}
}
