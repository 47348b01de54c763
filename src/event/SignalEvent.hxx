// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <functional>

struct event;
class EventLoop;

/**
 * Catch a signal inside the event loop.
 */
class SignalEvent {
	struct event *const event;

public:
	using Callback = std::function<void(int signo)>;

private:
	const Callback callback;

public:
	/**
	 * Throws std::runtime_error on error.
	 */
	SignalEvent(EventLoop &event_loop, int signo, Callback _callback);
	~SignalEvent() noexcept;

	SignalEvent(const SignalEvent &) = delete;
	SignalEvent &operator=(const SignalEvent &) = delete;

	void Enable() noexcept;
	void Disable() noexcept;

private:
	static void EventCallback(int signo, short events, void *ctx) noexcept;
};
