// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TimerEvent.hxx"
#include "EventLoop.hxx"

#include <event2/event.h>

#include <stdexcept>

TimerEvent::TimerEvent(EventLoop &_event_loop, Callback _callback)
	:event_loop(_event_loop),
	 event(evtimer_new(event_loop.Get(), EventCallback, this)),
	 callback(std::move(_callback))
{
	if (event == nullptr)
		throw std::runtime_error("evtimer_new() failed");
}

TimerEvent::~TimerEvent() noexcept
{
	event_free(event);
}

bool
TimerEvent::IsPending() const noexcept
{
	return evtimer_pending(event, nullptr);
}

void
TimerEvent::Schedule(Duration d) noexcept
{
	const auto us =
		std::chrono::duration_cast<std::chrono::microseconds>(d).count();

	struct timeval tv;
	tv.tv_sec = us / 1000000;
	tv.tv_usec = us % 1000000;

	evtimer_add(event, &tv);
}

void
TimerEvent::Cancel() noexcept
{
	evtimer_del(event);
}

void
TimerEvent::EventCallback(int, short, void *ctx) noexcept
{
	auto &t = *(TimerEvent *)ctx;
	t.callback();
}
