// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Registry.hxx"
#include "JobStore.hxx"
#include "Error.hxx"

#include <exception>

/**
 * Rethrow the current store exception as a nested #BatchError.
 */
[[noreturn]]
static void
ThrowStorageError(const char *operation, JobId id)
{
	std::throw_with_nested(FmtBatchError(BatchErrorCode::STORAGE,
					     "Failed to {} job {}",
					     operation, id));
}

/**
 * Make sure the second timestamp is strictly after the first one.
 */
static constexpr BatchTime
After(BatchTime previous, BatchTime t) noexcept
{
	return t > previous
		? t
		: previous + std::chrono::microseconds{1};
}

void
JobRegistry::Load()
{
	std::vector<BatchJob> all;

	try {
		all = store.LoadAll();
	} catch (...) {
		std::throw_with_nested(BatchError(BatchErrorCode::STORAGE,
						  "Failed to load jobs"));
	}

	jobs.clear();
	for (auto &job : all) {
		const JobId id = job.id;
		jobs.insert_or_assign(id, std::move(job));
	}
}

const BatchJob &
JobRegistry::Create(const JobSubmission &submission,
		    const SubmissionDefaults &defaults,
		    BatchTime now)
{
	auto job = MakeJob(submission, defaults);
	job.submitted_at = now;

	try {
		job.id = store.Insert(job);
	} catch (...) {
		std::throw_with_nested(BatchError(BatchErrorCode::STORAGE,
						  "Failed to insert job"));
	}

	const JobId id = job.id;
	return jobs.insert_or_assign(id, std::move(job)).first->second;
}

const BatchJob *
JobRegistry::Find(JobId id) const noexcept
{
	auto i = jobs.find(id);
	return i != jobs.end()
		? &i->second
		: nullptr;
}

const BatchJob &
JobRegistry::Get(JobId id) const
{
	const auto *job = Find(id);
	if (job == nullptr)
		throw FmtBatchError(BatchErrorCode::NOT_FOUND,
				    "No such job: {}", id);

	return *job;
}

inline BatchJob &
JobRegistry::GetMutable(JobId id)
{
	auto i = jobs.find(id);
	if (i == jobs.end())
		throw FmtBatchError(BatchErrorCode::NOT_FOUND,
				    "No such job: {}", id);

	return i->second;
}

std::vector<BatchJob>
JobRegistry::List(JobState state, std::size_t limit) const
{
	std::vector<BatchJob> result;
	for (const auto &[id, job] : jobs)
		if (job.GetState() == state)
			result.push_back(job);

	SortForListing(result, state);

	if (limit > 0 && result.size() > limit)
		result.resize(limit);

	return result;
}

void
JobRegistry::Delete(JobId id)
{
	auto i = jobs.find(id);
	if (i == jobs.end())
		throw FmtBatchError(BatchErrorCode::NOT_FOUND,
				    "No such job: {}", id);

	if (i->second.GetState() == JobState::RUNNING)
		throw FmtBatchError(BatchErrorCode::CONFLICT,
				    "Job {} is running", id);

	try {
		store.Delete(id);
	} catch (...) {
		ThrowStorageError("delete", id);
	}

	jobs.erase(i);
}

void
JobRegistry::Commit(BatchJob &dest, BatchJob &&src)
{
	try {
		store.Update(src);
	} catch (...) {
		ThrowStorageError("update", src.id);
	}

	dest = std::move(src);
}

void
JobRegistry::MarkStarted(JobId id, std::string_view node, int pid,
			 BatchTime started_at)
{
	auto &job = GetMutable(id);
	if (job.GetState() != JobState::WAITING)
		throw FmtBatchError(BatchErrorCode::CONFLICT,
				    "Job {} is not waiting", id);

	BatchJob copy = job;
	copy.started_at = After(job.submitted_at, started_at);
	copy.node = node;
	copy.pid = pid;

	Commit(job, std::move(copy));
}

bool
JobRegistry::MarkFinished(JobId id, int exit_code, BatchTime finished_at)
{
	auto &job = GetMutable(id);
	if (job.GetState() != JobState::RUNNING)
		return false;

	BatchJob copy = job;
	copy.finished_at = After(job.started_at, finished_at);
	copy.exit_code = exit_code;
	copy.pid = 0;

	Commit(job, std::move(copy));
	return true;
}
