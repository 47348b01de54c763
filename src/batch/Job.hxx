// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using JobId = uint64_t;

/**
 * Job timestamps have microsecond resolution.  The epoch value means
 * "not set".
 */
using BatchTime = std::chrono::time_point<std::chrono::system_clock,
					  std::chrono::microseconds>;

inline BatchTime
BatchNow() noexcept
{
	return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
}

constexpr bool
IsSet(BatchTime t) noexcept
{
	return t.time_since_epoch().count() != 0;
}

enum class JobState : uint8_t {
	WAITING,
	RUNNING,
	DONE,
};

[[gnu::const]]
const char *
ToString(JobState state) noexcept;

/**
 * A record as sent by a client.  Parsing the "#PBS" header of the
 * script is the client's job.
 */
struct JobSubmission {
	std::string name;

	/**
	 * Absolute path of the script, or a path relative to the
	 * configured "root" directory.
	 */
	std::string script;

	unsigned requested_cpus = 0;

	std::optional<int> priority;

	std::string stdout_path, stderr_path;

	std::vector<std::string> nodes;

	std::string username;
	uint32_t uid = 0;

	std::string mail_to, mail_events;
};

/**
 * Settings which are applied to new submissions.
 */
struct SubmissionDefaults {
	/**
	 * Relative script paths are resolved against this directory.
	 */
	std::string root = "/";

	int priority = 0;
};

struct BatchJob {
	JobId id = 0;

	std::string name;

	/**
	 * The absolute path of the script.
	 */
	std::string filename;

	std::string username;
	uint32_t owner_uid = 0;

	unsigned requested_cpus = 1;

	int priority = 0;

	/**
	 * The nodes this job may run on; empty means any node.
	 */
	std::vector<std::string> allowed_nodes;

	/**
	 * Absolute paths; empty means /dev/null.
	 */
	std::string stdout_path, stderr_path;

	std::string mail_to;

	/**
	 * A subset of "bea": mail on begin, end, abort.
	 */
	std::string mail_events;

	BatchTime submitted_at{}, started_at{}, finished_at{};

	/**
	 * Only valid if finished_at is set.  Negative values are
	 * signal numbers, and -1 means the process was lost.
	 */
	int exit_code = 0;

	std::string node;

	int pid = 0;

	[[gnu::pure]]
	JobState GetState() const noexcept {
		if (IsSet(finished_at))
			return JobState::DONE;
		else if (IsSet(started_at))
			return JobState::RUNNING;
		else
			return JobState::WAITING;
	}

	[[gnu::pure]]
	const std::string &GetDisplayName() const noexcept {
		return name.empty() ? filename : name;
	}

	/**
	 * The directory containing the script; this is the working
	 * directory of the process.
	 */
	[[gnu::pure]]
	std::string_view GetDirectory() const noexcept;

	[[gnu::pure]]
	bool IsAllowedOn(std::string_view node_name) const noexcept;

	[[gnu::pure]]
	bool WantsMail(char event) const noexcept {
		return !mail_to.empty() &&
			mail_events.find(event) != mail_events.npos;
	}
};

/**
 * Validate a submission and convert it to a (not yet registered)
 * job: resolve the script path against the root directory and the
 * output paths against the script's directory, and apply defaults.
 *
 * Throws #BatchError (VALIDATION) on error.
 */
BatchJob
MakeJob(const JobSubmission &submission, const SubmissionDefaults &defaults);

/**
 * Sort jobs the way they are listed: Waiting and Running by
 * submission time, Done by finish time (newest first).
 */
void
SortForListing(std::vector<BatchJob> &jobs, JobState state) noexcept;

/**
 * Scheduling order: priority descending, submission time
 * ascending, id ascending.
 */
[[gnu::pure]]
bool
CompareSchedulingOrder(const BatchJob &a, const BatchJob &b) noexcept;
