// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/OwnedFd.hxx"

#include <cstdint>
#include <string>

struct RpcAddress {
	/**
	 * Empty means "any address".
	 */
	std::string host;

	uint16_t port;
};

/**
 * Parse "HOST", "HOST:PORT", "[IPV6]:PORT", "*:PORT" or ":PORT".
 *
 * Throws std::invalid_argument on error.
 */
RpcAddress
ParseRpcAddress(const char *s, uint16_t default_port);

/**
 * Create a non-blocking listener socket.
 *
 * Throws on error.
 */
OwnedFd
OpenRpcListener(const RpcAddress &address);

/**
 * Connect to a server (blocking).
 *
 * Throws on error.
 */
OwnedFd
ConnectRpc(const RpcAddress &address);

/**
 * Return the local port number of a bound socket.
 *
 * Throws on error.
 */
uint16_t
GetLocalPort(int fd);
