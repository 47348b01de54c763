#pragma once

#include "event/EventLoop.hxx"
#include "event/TimerEvent.hxx"

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <stdexcept>
#include <thread>

/**
 * Run blocking client code in a second thread while the server runs
 * in this thread's event loop.  Exceptions thrown by the client code
 * are rethrown here.
 */
inline void
RunClientThread(EventLoop &event_loop, std::function<void()> f)
{
	using namespace std::chrono_literals;

	std::atomic_bool done{false};
	const auto deadline = std::chrono::steady_clock::now() + 10s;

	TimerEvent timer{event_loop, [&]{
		if (done || std::chrono::steady_clock::now() >= deadline)
			event_loop.Break();
		else
			timer.Schedule(10ms);
	}};

	std::exception_ptr error;
	std::thread thread([&]{
		try {
			f();
		} catch (...) {
			error = std::current_exception();
		}

		done = true;
	});

	timer.Schedule(10ms);
	event_loop.Run();
	thread.join();

	if (!done)
		throw std::runtime_error("Client thread has not finished");

	if (error)
		std::rethrow_exception(error);
}
