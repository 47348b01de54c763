// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "JobStore.hxx"
#include "pg/Connection.hxx"

/**
 * A #JobStore implementation which stores jobs in the PostgreSQL
 * table "batch_jobs".  The connection is blocking.
 */
class PgJobStore final : public JobStore {
	Pg::Connection connection;

public:
	/**
	 * Connect to the database and create the table if it does not
	 * exist yet.
	 *
	 * Throws on error.
	 */
	PgJobStore(const char *conninfo, const char *schema);

	/* virtual methods from class JobStore */
	JobId Insert(const BatchJob &job) override;
	void Update(const BatchJob &job) override;
	void Delete(JobId id) override;
	std::vector<BatchJob> Query(JobState state, std::size_t limit) override;
	std::vector<BatchJob> LoadAll() override;

private:
	void CreateTable();
};
