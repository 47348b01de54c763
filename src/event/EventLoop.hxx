// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>

struct event_base;

/**
 * A thin C++ wrapper for a libevent #event_base.
 */
class EventLoop {
	struct event_base *const base;

public:
	/**
	 * Throws std::runtime_error on error.
	 */
	EventLoop();
	~EventLoop() noexcept;

	EventLoop(const EventLoop &) = delete;
	EventLoop &operator=(const EventLoop &) = delete;

	struct event_base *Get() const noexcept {
		return base;
	}

	/**
	 * Run the loop until Break() gets called or no more events
	 * are registered.
	 */
	void Run() noexcept;

	/**
	 * Run one iteration; wait for events only if #block is true.
	 */
	void RunOnce(bool block) noexcept;

	/**
	 * Stop the loop after the current callback returns.
	 */
	void Break() noexcept;

	static std::chrono::system_clock::time_point SystemNow() noexcept {
		return std::chrono::system_clock::now();
	}
};
