// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Packet.hxx"
#include "Logger.hxx"
#include "event/SocketEvent.hxx"
#include "event/TimerEvent.hxx"
#include "io/OwnedFd.hxx"

#include <cstddef>
#include <cstdint>
#include <list>
#include <vector>

class EventLoop;
class RpcHandler;
class RpcServer;

/**
 * One client connection.
 */
class RpcConnection final {
	RpcServer &server;

	const ChildLogger logger;

	OwnedFd fd;

	SocketEvent event;

	RpcParser parser;

	/**
	 * Response data which has not been sent yet.
	 */
	std::vector<std::byte> output;

public:
	RpcConnection(RpcServer &_server, const Logger &parent_logger,
		      OwnedFd &&_fd);
	~RpcConnection() noexcept;

	RpcConnection(const RpcConnection &) = delete;
	RpcConnection &operator=(const RpcConnection &) = delete;

private:
	void OnSocketReady(unsigned events) noexcept;

	/**
	 * @return false if the connection has been closed
	 */
	bool OnReadable() noexcept;
	bool OnWritable() noexcept;

	/**
	 * Handle all complete requests in the input buffer.
	 */
	void HandleRequests();

	/**
	 * Close the socket and schedule destruction of this object.
	 */
	void Close() noexcept;
};

/**
 * Accepts TCP connections and serves RPC requests on them.
 */
class RpcServer final {
	friend class RpcConnection;

	EventLoop &event_loop;

	const ChildLogger logger;

	RpcHandler &handler;

	OwnedFd listener;

	SocketEvent listener_event;

	std::list<RpcConnection> connections;

	/**
	 * Connections which have been closed and will be destroyed by
	 * #cleanup_event.
	 */
	std::list<RpcConnection> closed;

	DeferEvent cleanup_event;

public:
	/**
	 * @param _listener a listening non-blocking socket
	 */
	RpcServer(EventLoop &_event_loop, const Logger &parent_logger,
		  OwnedFd &&_listener, RpcHandler &_handler);
	~RpcServer() noexcept;

	RpcServer(const RpcServer &) = delete;
	RpcServer &operator=(const RpcServer &) = delete;

	EventLoop &GetEventLoop() const noexcept {
		return event_loop;
	}

	std::size_t GetConnectionCount() const noexcept {
		return connections.size();
	}

	/**
	 * Throws on error.
	 */
	uint16_t GetPort() const;

private:
	void OnAccept(unsigned events) noexcept;

	void RemoveConnection(RpcConnection &c) noexcept;

	void OnCleanup() noexcept {
		closed.clear();
	}
};
