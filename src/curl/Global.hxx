// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "event/TimerEvent.hxx"
#include "Logger.hxx"

#include <curl/curl.h>

#include <map>
#include <memory>

class EventLoop;
class SocketEvent;
class CurlRequest;

/**
 * Manages the CURL multi handle and integrates it with the libevent
 * loop.
 */
class CurlGlobal final {
	const ChildLogger logger;

	EventLoop &event_loop;

	CURLM *const multi;

	/**
	 * The socket events registered by libcurl.  They are never
	 * freed before this object is destroyed because libcurl may
	 * unregister a socket from inside its callback.
	 */
	std::map<curl_socket_t, std::unique_ptr<SocketEvent>> sockets;

	TimerEvent timeout_event;

	/**
	 * Moves curl_multi_info_read() out of the current stack
	 * frame.
	 */
	DeferEvent read_info_event;

public:
	/**
	 * Throws std::runtime_error on error.
	 */
	CurlGlobal(EventLoop &_event_loop, const Logger &parent_logger);
	~CurlGlobal() noexcept;

	CurlGlobal(const CurlGlobal &) = delete;
	CurlGlobal &operator=(const CurlGlobal &) = delete;

	EventLoop &GetEventLoop() const noexcept {
		return event_loop;
	}

	/**
	 * Throws std::runtime_error on error.
	 */
	void Add(CurlRequest &r);

	void Remove(CurlRequest &r) noexcept;

private:
	void Assign(curl_socket_t fd, int action) noexcept;

	void SocketAction(curl_socket_t fd, int ev_bitmask) noexcept;

	/**
	 * Check for finished transfers.
	 */
	void ReadInfo() noexcept;

	void OnTimeout() noexcept;

	static int SocketFunction(CURL *easy, curl_socket_t s, int action,
				  void *userp, void *socketp) noexcept;
	static int TimerFunction(CURLM *multi, long timeout_ms,
				 void *userp) noexcept;
};
