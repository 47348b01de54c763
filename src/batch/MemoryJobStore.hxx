// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "JobStore.hxx"

#include <map>

/**
 * A #JobStore which keeps everything in memory; all records are
 * lost when the process exits.
 */
class MemoryJobStore : public JobStore {
	std::map<JobId, BatchJob> jobs;

	JobId next_id = 1;

public:
	std::size_t size() const noexcept {
		return jobs.size();
	}

	/* virtual methods from class JobStore */
	JobId Insert(const BatchJob &job) override;
	void Update(const BatchJob &job) override;
	void Delete(JobId id) override;
	std::vector<BatchJob> Query(JobState state, std::size_t limit) override;
	std::vector<BatchJob> LoadAll() override;
};
