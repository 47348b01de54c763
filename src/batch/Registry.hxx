// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Job.hxx"

#include <cstddef>
#include <map>
#include <string_view>
#include <vector>

class JobStore;

/**
 * The authoritative in-memory view of all jobs.  Each mutation is
 * written to the #JobStore first; if that fails, #BatchError
 * (STORAGE) is thrown and the in-memory copy is left unchanged.
 */
class JobRegistry {
	JobStore &store;

	std::map<JobId, BatchJob> jobs;

public:
	explicit JobRegistry(JobStore &_store) noexcept
		:store(_store) {}

	JobRegistry(const JobRegistry &) = delete;
	JobRegistry &operator=(const JobRegistry &) = delete;

	std::size_t size() const noexcept {
		return jobs.size();
	}

	/**
	 * Fill the registry from the store.
	 *
	 * Throws #BatchError on error.
	 */
	void Load();

	/**
	 * Validate the submission and create a new Waiting job.
	 *
	 * Throws #BatchError on error.
	 */
	const BatchJob &Create(const JobSubmission &submission,
			       const SubmissionDefaults &defaults,
			       BatchTime now);

	[[gnu::pure]]
	const BatchJob *Find(JobId id) const noexcept;

	/**
	 * Throws #BatchError (NOT_FOUND) if there is no such job.
	 */
	const BatchJob &Get(JobId id) const;

	/**
	 * Return a snapshot of all jobs in the given state in listing
	 * order.
	 *
	 * @param limit the maximum number of jobs; 0 means no limit
	 */
	std::vector<BatchJob> List(JobState state,
				   std::size_t limit=0) const;

	/**
	 * Throws #BatchError (NOT_FOUND, CONFLICT or STORAGE).
	 */
	void Delete(JobId id);

	/**
	 * Move a Waiting job to Running.
	 *
	 * Throws #BatchError (NOT_FOUND, CONFLICT or STORAGE).
	 */
	void MarkStarted(JobId id, std::string_view node, int pid,
			 BatchTime started_at);

	/**
	 * Move a Running job to Done.
	 *
	 * Throws #BatchError (NOT_FOUND or STORAGE).
	 *
	 * @return false if the job is not Running (nothing was
	 * changed)
	 */
	bool MarkFinished(JobId id, int exit_code, BatchTime finished_at);

private:
	BatchJob &GetMutable(JobId id);

	/**
	 * Write a modified copy to the store and then replace the
	 * in-memory record.
	 */
	void Commit(BatchJob &dest, BatchJob &&src);
};
