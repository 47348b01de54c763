// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Notification.hxx"
#include "Logger.hxx"
#include "curl/Global.hxx"

#include <list>
#include <memory>
#include <string>
#include <string_view>

class EventLoop;
class CurlRequest;

struct NotifierConfig {
	/**
	 * The envelope sender of notification mails.
	 */
	std::string mail_sender;

	/**
	 * The SMTP server ("host[:port]" or an "smtp://" URL); empty
	 * disables mail.
	 */
	std::string smtp_server;

	/**
	 * The Slack API token; empty disables Slack messages.
	 */
	std::string slack_token;

	std::string slack_channel;
};

/**
 * Sends notification mails via SMTP and Slack messages via the Slack
 * web API, both with libcurl.  Transfers run in the background;
 * errors are only logged.
 */
class CurlNotifier final : public NotificationHook {
	const ChildLogger logger;

	CurlGlobal curl;

	NotifierConfig config;

	std::string slack_url = "https://slack.com/api/chat.postMessage";

	std::list<std::unique_ptr<CurlRequest>> requests;

	/**
	 * Requests which are done and will be destroyed by
	 * #cleanup_event.
	 */
	std::list<std::unique_ptr<CurlRequest>> finished;

	DeferEvent cleanup_event;

public:
	/**
	 * Throws on error.
	 */
	CurlNotifier(EventLoop &event_loop, const Logger &parent_logger);
	~CurlNotifier() noexcept override;

	void SetConfig(NotifierConfig &&_config) noexcept {
		config = std::move(_config);
	}

	const NotifierConfig &GetConfig() const noexcept {
		return config;
	}

	/**
	 * Override the Slack API URL.
	 */
	void SetSlackUrl(std::string &&url) noexcept {
		slack_url = std::move(url);
	}

	std::size_t GetPendingCount() const noexcept {
		return requests.size();
	}

	/* virtual methods from class NotificationHook */
	void Notify(const BatchJob &job, JobEvent event) noexcept override;

private:
	void SendMail(const BatchJob &job, JobEvent event);
	void PostSlack(const BatchJob &job, JobEvent event);

	/**
	 * Start the request and keep it until it is done.
	 */
	void Start(std::unique_ptr<CurlRequest> request, const char *what);

	void OnDone(CurlRequest &r) noexcept;
};

/**
 * Format a complete RFC 5322 message.
 */
std::string
MakeNotificationMail(const NotifierConfig &config,
		     const BatchJob &job, JobEvent event);

/**
 * Convert "host[:port]" to an "smtp://" URL; URLs are returned as-is.
 */
std::string
MakeSmtpUrl(std::string_view server);
