// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "PgJobStore.hxx"
#include "pg/Array.hxx"
#include "pg/Error.hxx"
#include "Exception.hxx"

#include <fmt/format.h>

#include <cstdlib>

/**
 * The column list of all SELECT queries, in the order expected by
 * RowToJob().
 */
#define JOB_COLUMNS "id,name,filename,username,owner_uid,ncpus,priority,nodes," \
	"stdout_path,stderr_path,mail_to,mail_events," \
	"round(EXTRACT(EPOCH FROM submitted)*1000000)::bigint," \
	"round(EXTRACT(EPOCH FROM started)*1000000)::bigint," \
	"round(EXTRACT(EPOCH FROM finished)*1000000)::bigint," \
	"exit_code,node,pid"

#define MICROSECONDS(n) "('epoch'::timestamptz + $" #n "::bigint * interval '1 microsecond')"

namespace {

/**
 * An integer query parameter which may be NULL.
 */
class NullableParam {
	char buffer[24];

	bool defined;

public:
	template<typename T>
	NullableParam(bool _defined, T value) noexcept
		:defined(_defined) {
		if (defined)
			*fmt::format_to_n(buffer, sizeof(buffer) - 1, "{}",
					  value).out = 0;
	}

	/**
	 * Unset timestamps become NULL.
	 */
	explicit NullableParam(BatchTime t) noexcept
		:NullableParam(IsSet(t), t.time_since_epoch().count()) {}

	const char *c_str() const noexcept {
		return defined ? buffer : nullptr;
	}
};

}

static BatchTime
ParseTime(const char *s) noexcept
{
	if (s == nullptr || *s == 0)
		return {};

	return BatchTime{std::chrono::microseconds{std::strtoll(s, nullptr, 10)}};
}

static BatchJob
RowToJob(const Pg::Result::RowIterator &row)
{
	BatchJob job;
	job.id = std::strtoull(row.GetValue(0), nullptr, 10);
	job.name = row.GetValue(1);
	job.filename = row.GetValue(2);
	job.username = row.GetValue(3);
	job.owner_uid = std::strtoul(row.GetValue(4), nullptr, 10);
	job.requested_cpus = std::strtoul(row.GetValue(5), nullptr, 10);
	job.priority = std::atoi(row.GetValue(6));
	job.allowed_nodes = Pg::DecodeArray(row.GetValue(7));
	job.stdout_path = row.GetValue(8);
	job.stderr_path = row.GetValue(9);
	job.mail_to = row.GetValue(10);
	job.mail_events = row.GetValue(11);
	job.submitted_at = ParseTime(row.GetValue(12));
	job.started_at = ParseTime(row.GetValue(13));
	job.finished_at = ParseTime(row.GetValue(14));

	if (!row.IsValueNull(15))
		job.exit_code = std::atoi(row.GetValue(15));

	job.node = row.GetValue(16);

	if (!row.IsValueNull(17))
		job.pid = std::atoi(row.GetValue(17));

	return job;
}

static std::vector<BatchJob>
ResultToJobs(const Pg::Result &result)
{
	std::vector<BatchJob> jobs;
	jobs.reserve(result.GetRowCount());

	for (const auto &row : result)
		jobs.emplace_back(RowToJob(row));

	return jobs;
}

PgJobStore::PgJobStore(const char *conninfo, const char *schema)
{
	connection.Connect(conninfo);

	if (connection.GetServerVersion() < 90600)
		throw std::runtime_error("PostgreSQL 9.6 or newer is required");

	if (schema != nullptr && *schema != 0)
		connection.SetSchema(schema);

	CreateTable();
}

void
PgJobStore::CreateTable()
{
	connection.Execute("CREATE TABLE IF NOT EXISTS batch_jobs ("
			   " id bigserial PRIMARY KEY,"
			   " name text NOT NULL DEFAULT '',"
			   " filename text NOT NULL,"
			   " username text NOT NULL DEFAULT '',"
			   " owner_uid bigint NOT NULL DEFAULT 0,"
			   " ncpus integer NOT NULL CHECK (ncpus >= 1),"
			   " priority integer NOT NULL DEFAULT 0,"
			   " nodes text[] NOT NULL DEFAULT '{}',"
			   " stdout_path text NOT NULL DEFAULT '',"
			   " stderr_path text NOT NULL DEFAULT '',"
			   " mail_to text NOT NULL DEFAULT '',"
			   " mail_events text NOT NULL DEFAULT '',"
			   " submitted timestamptz NOT NULL,"
			   " started timestamptz NULL,"
			   " finished timestamptz NULL,"
			   " exit_code integer NULL,"
			   " node text NOT NULL DEFAULT '',"
			   " pid integer NULL"
			   ")");

	connection.Execute("CREATE INDEX IF NOT EXISTS batch_jobs_waiting"
			   " ON batch_jobs(submitted)"
			   " WHERE started IS NULL");

	connection.Execute("CREATE INDEX IF NOT EXISTS batch_jobs_finished"
			   " ON batch_jobs(finished)"
			   " WHERE finished IS NOT NULL");
}

JobId
PgJobStore::Insert(const BatchJob &job)
{
	const auto result =
		connection.ExecuteParams("INSERT INTO batch_jobs"
					 "(name,filename,username,owner_uid,ncpus,priority,nodes,"
					 "stdout_path,stderr_path,mail_to,mail_events,"
					 "submitted,started,finished,exit_code,node,pid)"
					 " VALUES($1,$2,$3,$4,$5,$6,$7::text[],$8,$9,$10,$11,"
					 MICROSECONDS(12) ","
					 MICROSECONDS(13) ","
					 MICROSECONDS(14) ","
					 "$15,$16,$17)"
					 " RETURNING id",
					 job.name, job.filename, job.username,
					 job.owner_uid, job.requested_cpus,
					 job.priority,
					 Pg::EncodeArray(job.allowed_nodes),
					 job.stdout_path, job.stderr_path,
					 job.mail_to, job.mail_events,
					 NullableParam{job.submitted_at}.c_str(),
					 NullableParam{job.started_at}.c_str(),
					 NullableParam{job.finished_at}.c_str(),
					 NullableParam{IsSet(job.finished_at), job.exit_code}.c_str(),
					 job.node,
					 NullableParam{job.pid > 0, job.pid}.c_str());

	if (result.IsEmpty())
		throw std::runtime_error("INSERT did not return an id");

	return std::strtoull(result.GetValue(0, 0), nullptr, 10);
}

void
PgJobStore::Update(const BatchJob &job)
{
	const auto result =
		connection.ExecuteParams("UPDATE batch_jobs SET"
					 " priority=$2,"
					 " started=" MICROSECONDS(3) ","
					 " finished=" MICROSECONDS(4) ","
					 " exit_code=$5,"
					 " node=$6,"
					 " pid=$7"
					 " WHERE id=$1",
					 job.id, job.priority,
					 NullableParam{job.started_at}.c_str(),
					 NullableParam{job.finished_at}.c_str(),
					 NullableParam{IsSet(job.finished_at), job.exit_code}.c_str(),
					 job.node,
					 NullableParam{job.pid > 0, job.pid}.c_str());

	if (result.GetAffectedRows() == 0)
		throw FmtRuntimeError("No such job: {}", job.id);
}

void
PgJobStore::Delete(JobId id)
{
	const auto result =
		connection.ExecuteParams("DELETE FROM batch_jobs WHERE id=$1",
					 id);

	if (result.GetAffectedRows() == 0)
		throw FmtRuntimeError("No such job: {}", id);
}

std::vector<BatchJob>
PgJobStore::Query(JobState state, std::size_t limit)
{
	const char *sql = nullptr;
	switch (state) {
	case JobState::WAITING:
		sql = "SELECT " JOB_COLUMNS " FROM batch_jobs"
			" WHERE started IS NULL"
			" ORDER BY submitted, id"
			" LIMIT $1";
		break;

	case JobState::RUNNING:
		sql = "SELECT " JOB_COLUMNS " FROM batch_jobs"
			" WHERE started IS NOT NULL AND finished IS NULL"
			" ORDER BY submitted, id"
			" LIMIT $1";
		break;

	case JobState::DONE:
		sql = "SELECT " JOB_COLUMNS " FROM batch_jobs"
			" WHERE finished IS NOT NULL"
			" ORDER BY finished DESC, id DESC"
			" LIMIT $1";
		break;
	}

	/* "LIMIT NULL" means no limit */
	return ResultToJobs(limit > 0
			    ? connection.ExecuteParams(sql, limit)
			    : connection.ExecuteParams(sql, (const char *)nullptr));
}

std::vector<BatchJob>
PgJobStore::LoadAll()
{
	return ResultToJobs(connection.Execute("SELECT " JOB_COLUMNS
					       " FROM batch_jobs ORDER BY id"));
}
