// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CurlNotifier.hxx"
#include "Job.hxx"
#include "curl/Request.hxx"
#include "version.h"

#include <fmt/format.h>

CurlNotifier::CurlNotifier(EventLoop &event_loop, const Logger &parent_logger)
	:logger(parent_logger, "notify"),
	 curl(event_loop, logger),
	 cleanup_event(event_loop, [this]{ finished.clear(); })
{
}

CurlNotifier::~CurlNotifier() noexcept
{
	if (!requests.empty())
		logger(2, "cancelling ", requests.size(), " notifications");
}

std::string
MakeSmtpUrl(std::string_view server)
{
	if (server.find("://") != server.npos)
		return std::string{server};

	return fmt::format("smtp://{}", server);
}

/**
 * Convert line endings to CRLF.
 */
static std::string
ToCrlf(std::string_view src)
{
	std::string dest;
	dest.reserve(src.size() + 16);

	for (const char ch : src) {
		if (ch == '\n')
			dest.push_back('\r');
		dest.push_back(ch);
	}

	return dest;
}

std::string
MakeNotificationMail(const NotifierConfig &config,
		     const BatchJob &job, JobEvent event)
{
	return fmt::format("From: {}\r\n"
			   "To: {}\r\n"
			   "Subject: {}\r\n"
			   "X-CM4all-Batch: " VERSION "\r\n"
			   "X-CM4all-Batch-Job: {}\r\n"
			   "Content-Type: text/plain; charset=utf-8\r\n"
			   "\r\n"
			   "{}",
			   config.mail_sender, job.mail_to,
			   FormatNotificationSubject(job, event),
			   job.id,
			   ToCrlf(FormatNotificationBody(job, event)));
}

void
CurlNotifier::Start(std::unique_ptr<CurlRequest> request, const char *what)
{
	logger(4, "sending ", what);

	request->Start();
	requests.emplace_front(std::move(request));
}

void
CurlNotifier::OnDone(CurlRequest &r) noexcept
{
	/* the request cannot be destroyed from inside its own
	   callback; move it to the "finished" list */
	for (auto i = requests.begin(); i != requests.end(); ++i) {
		if (i->get() == &r) {
			finished.splice(finished.end(), requests, i);
			cleanup_event.Schedule();
			break;
		}
	}
}

void
CurlNotifier::SendMail(const BatchJob &job, JobEvent event)
{
	const auto url = MakeSmtpUrl(config.smtp_server);

	auto request = std::make_unique<CurlRequest>(curl, url.c_str(),
						     [this, id=job.id](CurlRequest &r, std::exception_ptr error){
							     if (error)
								     logger(1, "failed to send mail for job ", id, ": ", error);
							     else
								     logger(3, "sent mail for job ", id);
							     OnDone(r);
						     });

	request->SetMail(config.mail_sender.c_str(), job.mail_to.c_str(),
			 MakeNotificationMail(config, job, event));
	Start(std::move(request), "mail");
}

void
CurlNotifier::PostSlack(const BatchJob &job, JobEvent event)
{
	auto request = std::make_unique<CurlRequest>(curl, slack_url.c_str(),
						     [this, id=job.id](CurlRequest &r, std::exception_ptr error){
							     if (error)
								     logger(1, "failed to post Slack message for job ", id, ": ", error);
							     else if (r.GetResponse().find("\"ok\":true") == std::string::npos)
								     logger(1, "Slack rejected message for job ", id, ": ", r.GetResponse());
							     else
								     logger(3, "posted Slack message for job ", id);
							     OnDone(r);
						     });

	const std::string text = fmt::format("{}\n{}",
					     FormatNotificationSubject(job, event),
					     FormatNotificationBody(job, event));

	request->AddHeader(fmt::format("Authorization: Bearer {}",
				       config.slack_token).c_str());
	request->SetPostFields(fmt::format("channel={}&text={}",
					   request->Escape(config.slack_channel),
					   request->Escape(text)));
	Start(std::move(request), "Slack message");
}

void
CurlNotifier::Notify(const BatchJob &job, JobEvent event) noexcept
{
	if (!config.smtp_server.empty() &&
	    job.WantsMail(GetMailEventLetter(event))) {
		try {
			SendMail(job, event);
		} catch (...) {
			logger(1, "failed to send mail for job ", job.id, ": ",
			       std::current_exception());
		}
	}

	if (!config.slack_token.empty() && event != JobEvent::STARTED) {
		try {
			PostSlack(job, event);
		} catch (...) {
			logger(1, "failed to post Slack message for job ",
			       job.id, ": ", std::current_exception());
		}
	}
}
