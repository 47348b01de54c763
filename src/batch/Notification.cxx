// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Notification.hxx"
#include "Job.hxx"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <iterator>

const char *
ToString(JobEvent event) noexcept
{
	switch (event) {
	case JobEvent::STARTED:
		return "started";

	case JobEvent::FINISHED:
		return "finished";

	case JobEvent::FAILED:
		return "failed";
	}

	return "unknown";
}

char
GetMailEventLetter(JobEvent event) noexcept
{
	switch (event) {
	case JobEvent::STARTED:
		return 'b';

	case JobEvent::FINISHED:
		return 'e';

	case JobEvent::FAILED:
		return 'a';
	}

	return 0;
}

std::string
FormatNotificationSubject(const BatchJob &job, JobEvent event)
{
	return fmt::format("Job {} ({}) {}", job.id, job.GetDisplayName(),
			   ToString(event));
}

static void
AppendTime(fmt::memory_buffer &buffer, const char *label, BatchTime t)
{
	if (IsSet(t))
		fmt::format_to(std::back_inserter(buffer), "{}: {:%Y-%m-%d %H:%M:%S} UTC\n",
			       label,
			       fmt::gmtime(std::chrono::system_clock::to_time_t(t)));
}

std::string
FormatNotificationBody(const BatchJob &job, JobEvent event)
{
	fmt::memory_buffer buffer;
	auto out = std::back_inserter(buffer);

	fmt::format_to(out, "Job: {}\n"
		       "Name: {}\n"
		       "Script: {}\n"
		       "Node: {}\n"
		       "CPUs: {}\n",
		       job.id, job.GetDisplayName(), job.filename,
		       job.node, job.requested_cpus);

	AppendTime(buffer, "Submitted", job.submitted_at);
	AppendTime(buffer, "Started", job.started_at);
	AppendTime(buffer, "Finished", job.finished_at);

	if (event != JobEvent::STARTED)
		fmt::format_to(out, "Exit code: {}\n", job.exit_code);

	return fmt::to_string(buffer);
}
