// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <functional>
#include <utility>

struct event;
class EventLoop;

/**
 * Monitor a file descriptor for readiness.  The descriptor is not
 * owned by this class.
 */
class SocketEvent {
	EventLoop &event_loop;

	struct event *event = nullptr;

	int fd = -1;

	unsigned scheduled_flags = 0;

public:
	static constexpr unsigned READ = 0x02;
	static constexpr unsigned WRITE = 0x04;

	using Callback = std::function<void(unsigned events)>;

private:
	const Callback callback;

public:
	SocketEvent(EventLoop &_event_loop, Callback _callback) noexcept
		:event_loop(_event_loop), callback(std::move(_callback)) {}

	~SocketEvent() noexcept {
		Cancel();
	}

	SocketEvent(const SocketEvent &) = delete;
	SocketEvent &operator=(const SocketEvent &) = delete;

	EventLoop &GetEventLoop() const noexcept {
		return event_loop;
	}

	bool IsDefined() const noexcept {
		return fd >= 0;
	}

	int GetFileDescriptor() const noexcept {
		return fd;
	}

	void Open(int _fd) noexcept {
		Cancel();
		fd = _fd;
	}

	/**
	 * Stop monitoring and forget the file descriptor (without
	 * closing it).
	 */
	int Release() noexcept {
		Cancel();
		return std::exchange(fd, -1);
	}

	unsigned GetScheduledFlags() const noexcept {
		return scheduled_flags;
	}

	/**
	 * Throws std::runtime_error on error.
	 */
	void Schedule(unsigned flags);

	void ScheduleRead() {
		Schedule(scheduled_flags | READ);
	}

	void ScheduleWrite() {
		Schedule(scheduled_flags | WRITE);
	}

	void CancelWrite() {
		Schedule(scheduled_flags & ~WRITE);
	}

	void Cancel() noexcept;

private:
	static void EventCallback(int fd, short events, void *ctx) noexcept;
};
