// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Job.hxx"

#include <cstddef>
#include <vector>

/**
 * Persistent storage for job records.  All methods throw on error.
 */
class JobStore {
public:
	virtual ~JobStore() noexcept = default;

	/**
	 * Store a new job and return its newly assigned id.  The "id"
	 * attribute of the parameter is ignored.
	 */
	virtual JobId Insert(const BatchJob &job) = 0;

	virtual void Update(const BatchJob &job) = 0;

	virtual void Delete(JobId id) = 0;

	/**
	 * Return the jobs in the given state, in listing order (see
	 * SortForListing()).
	 *
	 * The daemon answers listing requests from its #JobRegistry,
	 * which holds every job in memory; this method is only part
	 * of the store contract and is used to inspect a store's
	 * contents.
	 *
	 * @param limit the maximum number of jobs; 0 means no limit
	 */
	virtual std::vector<BatchJob> Query(JobState state,
					    std::size_t limit) = 0;

	virtual std::vector<BatchJob> LoadAll() = 0;
};
