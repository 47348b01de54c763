// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <functional>

struct event;
class EventLoop;

/**
 * Invoke a callback after a certain amount of time.
 */
class TimerEvent {
	EventLoop &event_loop;

	struct event *const event;

public:
	using Duration = std::chrono::steady_clock::duration;
	using Callback = std::function<void()>;

private:
	const Callback callback;

public:
	/**
	 * Throws std::runtime_error on error.
	 */
	TimerEvent(EventLoop &_event_loop, Callback _callback);
	~TimerEvent() noexcept;

	TimerEvent(const TimerEvent &) = delete;
	TimerEvent &operator=(const TimerEvent &) = delete;

	EventLoop &GetEventLoop() const noexcept {
		return event_loop;
	}

	[[gnu::pure]]
	bool IsPending() const noexcept;

	void Schedule(Duration d) noexcept;

	/**
	 * Like Schedule(), but do nothing if the timer is already
	 * pending.
	 */
	void ScheduleEarlier(Duration d) noexcept {
		if (!IsPending())
			Schedule(d);
	}

	void Cancel() noexcept;

private:
	static void EventCallback(int fd, short events, void *ctx) noexcept;
};

/**
 * Invoke a callback from the event loop as soon as possible, outside
 * of the current stack frame.
 */
class DeferEvent {
	TimerEvent timer;

public:
	DeferEvent(EventLoop &event_loop, TimerEvent::Callback callback)
		:timer(event_loop, std::move(callback)) {}

	bool IsPending() const noexcept {
		return timer.IsPending();
	}

	void Schedule() noexcept {
		timer.ScheduleEarlier(TimerEvent::Duration::zero());
	}

	void Cancel() noexcept {
		timer.Cancel();
	}
};
