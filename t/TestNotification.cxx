#include "batch/Notification.hxx"
#include "batch/CurlNotifier.hxx"
#include "batch/Job.hxx"
#include "event/EventLoop.hxx"
#include "event/TimerEvent.hxx"

#include <gtest/gtest.h>

using std::chrono::seconds;

static BatchJob
MakeFinishedJob()
{
	BatchJob job;
	job.id = 17;
	job.name = "simulation";
	job.filename = "/home/user/run.sh";
	job.requested_cpus = 8;
	job.node = "node1";
	job.mail_to = "user@example.com";
	job.mail_events = "ea";
	job.submitted_at = BatchTime{seconds{1'600'000'000}};
	job.started_at = BatchTime{seconds{1'600'000'060}};
	job.finished_at = BatchTime{seconds{1'600'003'600}};
	job.exit_code = 2;
	return job;
}

TEST(Notification, MailEventLetter)
{
	EXPECT_EQ(GetMailEventLetter(JobEvent::STARTED), 'b');
	EXPECT_EQ(GetMailEventLetter(JobEvent::FINISHED), 'e');
	EXPECT_EQ(GetMailEventLetter(JobEvent::FAILED), 'a');
}

TEST(Notification, Format)
{
	const auto job = MakeFinishedJob();

	EXPECT_EQ(FormatNotificationSubject(job, JobEvent::FAILED),
		  "Job 17 (simulation) failed");

	const auto body = FormatNotificationBody(job, JobEvent::FAILED);
	EXPECT_NE(body.find("Job: 17\n"), body.npos);
	EXPECT_NE(body.find("Script: /home/user/run.sh\n"), body.npos);
	EXPECT_NE(body.find("CPUs: 8\n"), body.npos);
	EXPECT_NE(body.find("Submitted: 2020-09-13 12:26:40 UTC\n"), body.npos);
	EXPECT_NE(body.find("Finished: 2020-09-13 13:26:40 UTC\n"), body.npos);
	EXPECT_NE(body.find("Exit code: 2\n"), body.npos);

	const auto started = FormatNotificationBody(job, JobEvent::STARTED);
	EXPECT_EQ(started.find("Exit code"), started.npos);
}

TEST(Notification, Mail)
{
	const NotifierConfig config{
		.mail_sender = "batch@example.com",
		.smtp_server = "localhost",
	};

	const auto mail = MakeNotificationMail(config, MakeFinishedJob(),
					       JobEvent::FAILED);
	EXPECT_EQ(mail.find("From: batch@example.com\r\n"), 0u);
	EXPECT_NE(mail.find("To: user@example.com\r\n"), mail.npos);
	EXPECT_NE(mail.find("Subject: Job 17 (simulation) failed\r\n"), mail.npos);
	EXPECT_NE(mail.find("X-CM4all-Batch-Job: 17\r\n"), mail.npos);
	EXPECT_NE(mail.find("\r\n\r\nJob: 17\r\n"), mail.npos);

	/* no bare LF */
	for (std::size_t i = mail.find('\n'); i != mail.npos;
	     i = mail.find('\n', i + 1))
		EXPECT_EQ(mail[i - 1], '\r');
}

TEST(Notification, SmtpUrl)
{
	EXPECT_EQ(MakeSmtpUrl("mail.example.com"), "smtp://mail.example.com");
	EXPECT_EQ(MakeSmtpUrl("mail.example.com:587"),
		  "smtp://mail.example.com:587");
	EXPECT_EQ(MakeSmtpUrl("smtps://mail.example.com"),
		  "smtps://mail.example.com");
}

struct CurlNotifierTest : ::testing::Test {
	EventLoop event_loop;
	const RootLogger logger;
	CurlNotifier notifier{event_loop, logger};
};

TEST_F(CurlNotifierTest, NothingConfigured)
{
	notifier.Notify(MakeFinishedJob(), JobEvent::FAILED);
	EXPECT_EQ(notifier.GetPendingCount(), 0u);
}

TEST_F(CurlNotifierTest, MailEventFilter)
{
	notifier.SetConfig({
		.mail_sender = "batch@example.com",
		.smtp_server = "127.0.0.1:1",
	});

	auto job = MakeFinishedJob();

	/* 'b' is not in mail_events */
	notifier.Notify(job, JobEvent::STARTED);
	EXPECT_EQ(notifier.GetPendingCount(), 0u);

	/* no recipient */
	job.mail_to.clear();
	notifier.Notify(job, JobEvent::FAILED);
	EXPECT_EQ(notifier.GetPendingCount(), 0u);
}

TEST_F(CurlNotifierTest, SlackNotOnStart)
{
	notifier.SetConfig({
		.slack_token = "xoxb-secret",
		.slack_channel = "#batch",
	});
	notifier.SetSlackUrl("http://127.0.0.1:1/api/chat.postMessage");

	notifier.Notify(MakeFinishedJob(), JobEvent::STARTED);
	EXPECT_EQ(notifier.GetPendingCount(), 0u);
}

TEST_F(CurlNotifierTest, DeliveryErrorIsLogged)
{
	notifier.SetConfig({
		.slack_token = "xoxb-secret",
		.slack_channel = "#batch",
	});

	/* nobody listens on port 1 */
	notifier.SetSlackUrl("http://127.0.0.1:1/api/chat.postMessage");

	notifier.Notify(MakeFinishedJob(), JobEvent::FINISHED);
	EXPECT_EQ(notifier.GetPendingCount(), 1u);

	bool timed_out = false;
	TimerEvent timeout{event_loop, [&]{ timed_out = true; }};
	timeout.Schedule(seconds{10});

	while (notifier.GetPendingCount() > 0 && !timed_out)
		event_loop.RunOnce(true);

	EXPECT_FALSE(timed_out);
	EXPECT_EQ(notifier.GetPendingCount(), 0u);
}
