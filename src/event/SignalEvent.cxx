// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SignalEvent.hxx"
#include "EventLoop.hxx"

#include <event2/event.h>

#include <stdexcept>

SignalEvent::SignalEvent(EventLoop &event_loop, int signo, Callback _callback)
	:event(evsignal_new(event_loop.Get(), signo, EventCallback, this)),
	 callback(std::move(_callback))
{
	if (event == nullptr)
		throw std::runtime_error("evsignal_new() failed");
}

SignalEvent::~SignalEvent() noexcept
{
	event_free(event);
}

void
SignalEvent::Enable() noexcept
{
	evsignal_add(event, nullptr);
}

void
SignalEvent::Disable() noexcept
{
	evsignal_del(event);
}

void
SignalEvent::EventCallback(int signo, short, void *ctx) noexcept
{
	auto &e = *(SignalEvent *)ctx;
	e.callback(signo);
}
