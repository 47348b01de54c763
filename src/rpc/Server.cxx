// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Server.hxx"
#include "Handler.hxx"
#include "Builder.hxx"
#include "Socket.hxx"
#include "Exception.hxx"

#include <array>

#include <errno.h>
#include <string.h>
#include <sys/socket.h>

RpcConnection::RpcConnection(RpcServer &_server, const Logger &parent_logger,
			     OwnedFd &&_fd)
	:server(_server),
	 logger(parent_logger, "connection"),
	 fd(std::move(_fd)),
	 event(server.GetEventLoop(),
	       [this](unsigned events){ OnSocketReady(events); })
{
	event.Open(fd.Get());
	event.ScheduleRead();
}

RpcConnection::~RpcConnection() noexcept
{
	event.Release();
}

void
RpcConnection::Close() noexcept
{
	event.Release();
	fd.Close();
	server.RemoveConnection(*this);
}

void
RpcConnection::HandleRequests()
{
	RpcMessage request;
	while (parser.Next(request)) {
		RpcBuilder response;
		DispatchRpcRequest(server.handler, request, response);

		const auto data = response.GetData();
		output.insert(output.end(), data.begin(), data.end());
	}
}

bool
RpcConnection::OnReadable() noexcept
{
	std::array<std::byte, 8192> buffer;

	const ssize_t nbytes = recv(fd.Get(), buffer.data(), buffer.size(),
				    MSG_DONTWAIT);
	if (nbytes < 0) {
		if (errno == EAGAIN || errno == EINTR)
			return true;

		logger(2, "receive failed: ", strerror(errno));
		Close();
		return false;
	}

	if (nbytes == 0) {
		if (parser.HasPartial())
			logger(2, "client disconnected in the middle of a request");

		Close();
		return false;
	}

	try {
		parser.Feed(std::span{buffer}.first(nbytes));
		HandleRequests();
	} catch (...) {
		logger(2, "closing connection: ", std::current_exception());
		Close();
		return false;
	}

	return true;
}

bool
RpcConnection::OnWritable() noexcept
{
	if (output.empty())
		return true;

	const ssize_t nbytes = send(fd.Get(), output.data(), output.size(),
				    MSG_DONTWAIT|MSG_NOSIGNAL);
	if (nbytes < 0) {
		if (errno == EAGAIN || errno == EINTR)
			return true;

		logger(2, "send failed: ", strerror(errno));
		Close();
		return false;
	}

	output.erase(output.begin(), output.begin() + nbytes);
	return true;
}

void
RpcConnection::OnSocketReady(unsigned events) noexcept
{
	if ((events & SocketEvent::READ) && !OnReadable())
		return;

	if (!OnWritable())
		return;

	try {
		if (output.empty())
			event.Schedule(SocketEvent::READ);
		else
			/* stop reading until the response has been
			   sent */
			event.Schedule(SocketEvent::WRITE);
	} catch (...) {
		logger(1, std::current_exception());
		Close();
	}
}

RpcServer::RpcServer(EventLoop &_event_loop, const Logger &parent_logger,
		     OwnedFd &&_listener, RpcHandler &_handler)
	:event_loop(_event_loop),
	 logger(parent_logger, "rpc"),
	 handler(_handler),
	 listener(std::move(_listener)),
	 listener_event(event_loop,
			[this](unsigned events){ OnAccept(events); }),
	 cleanup_event(event_loop, [this]{ OnCleanup(); })
{
	listener_event.Open(listener.Get());
	listener_event.ScheduleRead();
}

RpcServer::~RpcServer() noexcept
{
	listener_event.Release();
}

uint16_t
RpcServer::GetPort() const
{
	return GetLocalPort(listener.Get());
}

void
RpcServer::OnAccept(unsigned) noexcept
{
	OwnedFd fd{accept4(listener.Get(), nullptr, nullptr,
			   SOCK_CLOEXEC|SOCK_NONBLOCK)};
	if (!fd.IsDefined()) {
		if (errno != EAGAIN && errno != EINTR)
			logger(1, "accept() failed: ", strerror(errno));
		return;
	}

	try {
		connections.emplace_back(*this, logger, std::move(fd));
	} catch (...) {
		logger(1, "failed to set up connection: ",
		       std::current_exception());
		return;
	}

	logger(4, "new connection");
}

void
RpcServer::RemoveConnection(RpcConnection &c) noexcept
{
	for (auto i = connections.begin(); i != connections.end(); ++i) {
		if (&*i == &c) {
			closed.splice(closed.end(), connections, i);
			cleanup_event.Schedule();
			break;
		}
	}
}
