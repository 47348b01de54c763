// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Job.hxx"
#include "Error.hxx"

#include <algorithm>
#include <tuple>

#include <sys/stat.h>
#include <unistd.h>

const char *
ToString(JobState state) noexcept
{
	switch (state) {
	case JobState::WAITING:
		return "waiting";

	case JobState::RUNNING:
		return "running";

	case JobState::DONE:
		return "done";
	}

	return "unknown";
}

bool
BatchJob::IsAllowedOn(std::string_view node_name) const noexcept
{
	return allowed_nodes.empty() ||
		std::find(allowed_nodes.begin(), allowed_nodes.end(),
			  node_name) != allowed_nodes.end();
}

static std::string
JoinPath(std::string_view base, std::string_view path) noexcept
{
	if (path.empty() || path.front() == '/')
		return std::string{path};

	std::string result{base};
	if (result.empty() || result.back() != '/')
		result.push_back('/');
	result.append(path);
	return result;
}

static std::string_view
DirectoryOf(std::string_view path) noexcept
{
	const auto slash = path.rfind('/');
	if (slash == path.npos)
		return ".";

	if (slash == 0)
		return "/";

	return path.substr(0, slash);
}

std::string_view
BatchJob::GetDirectory() const noexcept
{
	return DirectoryOf(filename);
}

/**
 * Does the string contain ASCII control characters?  These are not
 * allowed in values which end up in mail headers.
 */
[[gnu::pure]]
static bool
HasControlCharacter(std::string_view s) noexcept
{
	return std::any_of(s.begin(), s.end(), [](char ch){
		return (unsigned char)ch < 0x20 || ch == 0x7f;
	});
}

BatchJob
MakeJob(const JobSubmission &submission, const SubmissionDefaults &defaults)
{
	if (submission.requested_cpus == 0)
		throw BatchError(BatchErrorCode::VALIDATION,
				 "Number of CPUs must be at least 1");

	if (submission.script.empty())
		throw BatchError(BatchErrorCode::VALIDATION,
				 "No script specified");

	if (submission.script.front() != '/' &&
	    (defaults.root.empty() || defaults.root.front() != '/'))
		throw FmtBatchError(BatchErrorCode::VALIDATION,
				    "Relative script path {:?} without root directory",
				    submission.script);

	for (const char ch : submission.mail_events)
		if (ch != 'b' && ch != 'e' && ch != 'a')
			throw FmtBatchError(BatchErrorCode::VALIDATION,
					    "Invalid mail event {:?}", ch);

	if (HasControlCharacter(submission.name))
		throw BatchError(BatchErrorCode::VALIDATION,
				 "Control character in job name");

	if (HasControlCharacter(submission.mail_to))
		throw BatchError(BatchErrorCode::VALIDATION,
				 "Control character in mail address");

	for (const auto &i : submission.nodes)
		if (i.empty())
			throw BatchError(BatchErrorCode::VALIDATION,
					 "Empty node name");

	BatchJob job;
	job.name = submission.name;
	job.filename = JoinPath(defaults.root, submission.script);

	struct stat st;
	if (stat(job.filename.c_str(), &st) < 0)
		throw FmtBatchError(BatchErrorCode::VALIDATION,
				    "Script {:?} does not exist", job.filename);

	if (!S_ISREG(st.st_mode))
		throw FmtBatchError(BatchErrorCode::VALIDATION,
				    "Script {:?} is not a regular file",
				    job.filename);

	if (access(job.filename.c_str(), X_OK) < 0)
		throw FmtBatchError(BatchErrorCode::VALIDATION,
				    "Script {:?} is not executable",
				    job.filename);

	const auto directory = job.GetDirectory();
	job.stdout_path = JoinPath(directory, submission.stdout_path);
	job.stderr_path = JoinPath(directory, submission.stderr_path);

	job.username = submission.username;
	job.owner_uid = submission.uid;
	job.requested_cpus = submission.requested_cpus;
	job.priority = submission.priority.value_or(defaults.priority);
	job.allowed_nodes = submission.nodes;
	job.mail_to = submission.mail_to;
	job.mail_events = submission.mail_events;
	return job;
}

void
SortForListing(std::vector<BatchJob> &jobs, JobState state) noexcept
{
	if (state == JobState::DONE)
		std::sort(jobs.begin(), jobs.end(),
			  [](const BatchJob &a, const BatchJob &b){
				  return std::tie(b.finished_at, b.id) <
					  std::tie(a.finished_at, a.id);
			  });
	else
		std::sort(jobs.begin(), jobs.end(),
			  [](const BatchJob &a, const BatchJob &b){
				  return std::tie(a.submitted_at, a.id) <
					  std::tie(b.submitted_at, b.id);
			  });
}

bool
CompareSchedulingOrder(const BatchJob &a, const BatchJob &b) noexcept
{
	return std::tie(b.priority, a.submitted_at, a.id) <
		std::tie(a.priority, b.submitted_at, b.id);
}
