// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>

struct BatchJob;

enum class JobEvent {
	STARTED,
	FINISHED,

	/**
	 * The job exited with a non-zero status, was killed or its
	 * process was lost.
	 */
	FAILED,
};

[[gnu::const]]
const char *
ToString(JobEvent event) noexcept;

/**
 * The letter in #BatchJob::mail_events which enables mail for this
 * event.
 */
[[gnu::const]]
char
GetMailEventLetter(JobEvent event) noexcept;

/**
 * Receives job life cycle events.  Delivery is best effort.
 */
class NotificationHook {
public:
	virtual ~NotificationHook() noexcept = default;

	virtual void Notify(const BatchJob &job, JobEvent event) noexcept = 0;
};

/**
 * A #NotificationHook which discards everything.
 */
class NullNotificationHook final : public NotificationHook {
public:
	void Notify(const BatchJob &, JobEvent) noexcept override {}
};

/**
 * Format the subject line of a notification.
 */
std::string
FormatNotificationSubject(const BatchJob &job, JobEvent event);

/**
 * Format the plain text body of a notification.
 */
std::string
FormatNotificationBody(const BatchJob &job, JobEvent event);
