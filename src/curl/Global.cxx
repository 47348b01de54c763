// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Global.hxx"
#include "Request.hxx"
#include "event/SocketEvent.hxx"
#include "Exception.hxx"

#include <cassert>

CurlGlobal::CurlGlobal(EventLoop &_event_loop, const Logger &parent_logger)
	:logger(parent_logger, "curl"),
	 event_loop(_event_loop),
	 multi(curl_multi_init()),
	 timeout_event(event_loop, [this]{ OnTimeout(); }),
	 read_info_event(event_loop, [this]{ ReadInfo(); })
{
	if (multi == nullptr)
		throw std::runtime_error("curl_multi_init() failed");

	curl_multi_setopt(multi, CURLMOPT_SOCKETFUNCTION, SocketFunction);
	curl_multi_setopt(multi, CURLMOPT_SOCKETDATA, this);
	curl_multi_setopt(multi, CURLMOPT_TIMERFUNCTION, TimerFunction);
	curl_multi_setopt(multi, CURLMOPT_TIMERDATA, this);
}

CurlGlobal::~CurlGlobal() noexcept
{
	curl_multi_cleanup(multi);
}

void
CurlGlobal::Add(CurlRequest &r)
{
	CURLMcode mcode = curl_multi_add_handle(multi, r.Get());
	if (mcode != CURLM_OK)
		throw FmtRuntimeError("curl_multi_add_handle() failed: {}",
				      curl_multi_strerror(mcode));
}

void
CurlGlobal::Remove(CurlRequest &r) noexcept
{
	curl_multi_remove_handle(multi, r.Get());
}

void
CurlGlobal::Assign(curl_socket_t fd, int action) noexcept
{
	auto i = sockets.find(fd);

	if (action == CURL_POLL_REMOVE) {
		if (i != sockets.end())
			i->second->Release();
		return;
	}

	if (i == sockets.end())
		i = sockets.emplace(fd, std::make_unique<SocketEvent>(event_loop,
								      [this, fd](unsigned events){
									      int bitmask = 0;
									      if (events & SocketEvent::READ)
										      bitmask |= CURL_CSELECT_IN;
									      if (events & SocketEvent::WRITE)
										      bitmask |= CURL_CSELECT_OUT;
									      SocketAction(fd, bitmask);
								      })).first;

	auto &event = *i->second;
	if (event.GetFileDescriptor() != fd)
		event.Open(fd);

	unsigned flags = 0;
	if (action & CURL_POLL_IN)
		flags |= SocketEvent::READ;
	if (action & CURL_POLL_OUT)
		flags |= SocketEvent::WRITE;

	try {
		event.Schedule(flags);
	} catch (...) {
		logger(1, "failed to watch socket: ", std::current_exception());
	}
}

int
CurlGlobal::SocketFunction([[maybe_unused]] CURL *easy,
			   curl_socket_t s, int action,
			   void *userp, [[maybe_unused]] void *socketp) noexcept
{
	auto &global = *(CurlGlobal *)userp;
	global.Assign(s, action);
	return 0;
}

void
CurlGlobal::SocketAction(curl_socket_t fd, int ev_bitmask) noexcept
{
	int running_handles;
	CURLMcode mcode = curl_multi_socket_action(multi, fd, ev_bitmask,
						   &running_handles);
	if (mcode != CURLM_OK)
		logger(1, "curl_multi_socket_action() failed: ",
		       curl_multi_strerror(mcode));

	read_info_event.Schedule();
}

inline void
CurlGlobal::ReadInfo() noexcept
{
	CURLMsg *msg;
	int msgs_in_queue;

	while ((msg = curl_multi_info_read(multi,
					   &msgs_in_queue)) != nullptr) {
		if (msg->msg == CURLMSG_DONE) {
			auto *request = CurlRequest::Get(msg->easy_handle);
			assert(request != nullptr);

			/* this may destroy the request */
			request->Done(msg->data.result);
		}
	}
}

int
CurlGlobal::TimerFunction([[maybe_unused]] CURLM *_multi,
			  long timeout_ms, void *userp) noexcept
{
	auto &global = *(CurlGlobal *)userp;
	assert(_multi == global.multi);

	if (timeout_ms < 0) {
		global.timeout_event.Cancel();
		return 0;
	}

	global.timeout_event.Schedule(std::chrono::milliseconds(timeout_ms));
	return 0;
}

void
CurlGlobal::OnTimeout() noexcept
{
	SocketAction(CURL_SOCKET_TIMEOUT, 0);
}
