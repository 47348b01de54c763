// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Request.hxx"
#include "Global.hxx"
#include "Exception.hxx"
#include "version.h"

#include <algorithm>
#include <cstring>
#include <new>

CurlRequest::CurlRequest(CurlGlobal &_global, const char *url,
			 Callback _callback)
	:global(_global), easy(curl_easy_init()),
	 callback(std::move(_callback))
{
	if (easy == nullptr)
		throw std::runtime_error("curl_easy_init() failed");

	error_buffer[0] = 0;

	curl_easy_setopt(easy, CURLOPT_PRIVATE, (void *)this);
	curl_easy_setopt(easy, CURLOPT_USERAGENT, "CM4all Batch " VERSION);
	curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, WriteFunction);
	curl_easy_setopt(easy, CURLOPT_WRITEDATA, this);
	curl_easy_setopt(easy, CURLOPT_FAILONERROR, 1L);
	curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, error_buffer);
	curl_easy_setopt(easy, CURLOPT_NOPROGRESS, 1L);
	curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT, 10L);
	curl_easy_setopt(easy, CURLOPT_TIMEOUT, 60L);
	curl_easy_setopt(easy, CURLOPT_URL, url);
}

CurlRequest::~CurlRequest() noexcept
{
	Unregister();
	curl_easy_cleanup(easy);
	curl_slist_free_all(headers);
	curl_slist_free_all(recipients);
}

CurlRequest *
CurlRequest::Get(CURL *easy) noexcept
{
	void *p = nullptr;
	curl_easy_getinfo(easy, CURLINFO_PRIVATE, &p);
	return (CurlRequest *)p;
}

void
CurlRequest::AddHeader(const char *header)
{
	auto *h = curl_slist_append(headers, header);
	if (h == nullptr)
		throw std::bad_alloc();

	headers = h;
	curl_easy_setopt(easy, CURLOPT_HTTPHEADER, headers);
}

void
CurlRequest::SetPostFields(std::string &&body) noexcept
{
	post_fields = std::move(body);
	curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE, (long)post_fields.size());
	curl_easy_setopt(easy, CURLOPT_POSTFIELDS, post_fields.c_str());
}

void
CurlRequest::SetMail(const char *from, const char *to, std::string &&message)
{
	auto *r = curl_slist_append(recipients, to);
	if (r == nullptr)
		throw std::bad_alloc();

	recipients = r;

	upload = std::move(message);
	upload_position = 0;

	curl_easy_setopt(easy, CURLOPT_MAIL_FROM, from);
	curl_easy_setopt(easy, CURLOPT_MAIL_RCPT, recipients);
	curl_easy_setopt(easy, CURLOPT_READFUNCTION, ReadFunction);
	curl_easy_setopt(easy, CURLOPT_READDATA, this);
	curl_easy_setopt(easy, CURLOPT_UPLOAD, 1L);
	curl_easy_setopt(easy, CURLOPT_INFILESIZE, (long)upload.size());
}

std::string
CurlRequest::Escape(const std::string &s) const
{
	char *p = curl_easy_escape(easy, s.data(), (int)s.size());
	if (p == nullptr)
		throw std::bad_alloc();

	std::string result{p};
	curl_free(p);
	return result;
}

void
CurlRequest::Start()
{
	global.Add(*this);
	registered = true;
}

void
CurlRequest::Unregister() noexcept
{
	if (registered) {
		registered = false;
		global.Remove(*this);
	}
}

long
CurlRequest::GetStatus() const noexcept
{
	long status = 0;
	curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &status);
	return status;
}

void
CurlRequest::Done(CURLcode result) noexcept
{
	Unregister();

	std::exception_ptr error;
	if (result != CURLE_OK) {
		const char *msg = error_buffer;
		if (*msg == 0)
			msg = curl_easy_strerror(result);

		error = std::make_exception_ptr(FmtRuntimeError("CURL failed: {}",
								msg));
	}

	/* this may destroy the object */
	callback(*this, std::move(error));
}

std::size_t
CurlRequest::WriteFunction(char *ptr, std::size_t size, std::size_t nmemb,
			   void *stream) noexcept
{
	auto &r = *(CurlRequest *)stream;

	size *= nmemb;

	/* keep only the beginning of the response */
	const std::size_t max = 16384;
	if (r.response.size() < max)
		r.response.append(ptr, std::min(size, max - r.response.size()));

	return size;
}

std::size_t
CurlRequest::ReadFunction(char *buffer, std::size_t size, std::size_t nitems,
			  void *stream) noexcept
{
	auto &r = *(CurlRequest *)stream;

	const std::size_t n = std::min(size * nitems,
				       r.upload.size() - r.upload_position);
	std::memcpy(buffer, r.upload.data() + r.upload_position, n);
	r.upload_position += n;
	return n;
}
