// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SocketEvent.hxx"
#include "EventLoop.hxx"

#include <event2/event.h>

#include <cassert>
#include <stdexcept>

static_assert(SocketEvent::READ == EV_READ);
static_assert(SocketEvent::WRITE == EV_WRITE);

void
SocketEvent::Schedule(unsigned flags)
{
	assert(IsDefined());

	flags &= READ|WRITE;
	if (flags == scheduled_flags)
		return;

	Cancel();

	if (flags == 0)
		return;

	event = event_new(event_loop.Get(), fd, short(flags|EV_PERSIST),
			  EventCallback, this);
	if (event == nullptr)
		throw std::runtime_error("event_new() failed");

	if (event_add(event, nullptr) < 0) {
		event_free(event);
		event = nullptr;
		throw std::runtime_error("event_add() failed");
	}

	scheduled_flags = flags;
}

void
SocketEvent::Cancel() noexcept
{
	if (event != nullptr) {
		event_free(event);
		event = nullptr;
	}

	scheduled_flags = 0;
}

void
SocketEvent::EventCallback(int, short events, void *ctx) noexcept
{
	auto &e = *(SocketEvent *)ctx;
	e.callback(unsigned(events) & (READ|WRITE));
}
