// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "MemoryJobStore.hxx"
#include "Exception.hxx"

JobId
MemoryJobStore::Insert(const BatchJob &job)
{
	const JobId id = next_id++;

	auto &j = jobs.emplace(id, job).first->second;
	j.id = id;
	return id;
}

void
MemoryJobStore::Update(const BatchJob &job)
{
	auto i = jobs.find(job.id);
	if (i == jobs.end())
		throw FmtRuntimeError("No such job: {}", job.id);

	i->second = job;
}

void
MemoryJobStore::Delete(JobId id)
{
	if (jobs.erase(id) == 0)
		throw FmtRuntimeError("No such job: {}", id);
}

std::vector<BatchJob>
MemoryJobStore::Query(JobState state, std::size_t limit)
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

std::vector<BatchJob>
MemoryJobStore::LoadAll()
{
	std::vector<BatchJob> result;
	result.reserve(jobs.size());

	for (const auto &[id, job] : jobs)
		result.push_back(job);

	return result;
}
