// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <curl/curl.h>

#include <exception>
#include <functional>
#include <string>

class CurlGlobal;

/**
 * One asynchronous transfer on the #CurlGlobal multi handle.  The
 * response body is collected in memory.
 */
class CurlRequest {
	CurlGlobal &global;

	CURL *const easy;

	struct curl_slist *headers = nullptr;
	struct curl_slist *recipients = nullptr;

	/**
	 * The data to be uploaded (mail message).
	 */
	std::string upload;
	std::size_t upload_position = 0;

	std::string post_fields;

	std::string response;

	bool registered = false;

	char error_buffer[CURL_ERROR_SIZE];

public:
	/**
	 * Invoked when the transfer has finished; the #CurlRequest
	 * may be destroyed inside the callback.
	 */
	using Callback = std::function<void(CurlRequest &request,
					    std::exception_ptr error)>;

private:
	const Callback callback;

public:
	/**
	 * Throws std::runtime_error on error.
	 */
	CurlRequest(CurlGlobal &_global, const char *url, Callback _callback);
	~CurlRequest() noexcept;

	CurlRequest(const CurlRequest &) = delete;
	CurlRequest &operator=(const CurlRequest &) = delete;

	CURL *Get() const noexcept {
		return easy;
	}

	/**
	 * Look up the #CurlRequest of an easy handle.
	 */
	static CurlRequest *Get(CURL *easy) noexcept;

	void AddHeader(const char *header);

	/**
	 * Send a POST request with a form-encoded body.
	 */
	void SetPostFields(std::string &&body) noexcept;

	/**
	 * Configure an SMTP transfer.
	 */
	void SetMail(const char *from, const char *to, std::string &&message);

	/**
	 * Escape a string for application/x-www-form-urlencoded.
	 */
	std::string Escape(const std::string &s) const;

	/**
	 * Throws std::runtime_error on error.
	 */
	void Start();

	[[gnu::pure]]
	long GetStatus() const noexcept;

	const std::string &GetResponse() const noexcept {
		return response;
	}

	/**
	 * Called by #CurlGlobal when the transfer has finished.
	 */
	void Done(CURLcode result) noexcept;

private:
	void Unregister() noexcept;

	static std::size_t WriteFunction(char *ptr, std::size_t size,
					 std::size_t nmemb,
					 void *stream) noexcept;
	static std::size_t ReadFunction(char *buffer, std::size_t size,
					std::size_t nitems,
					void *stream) noexcept;
};
