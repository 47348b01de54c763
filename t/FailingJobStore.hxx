#pragma once

#include "batch/MemoryJobStore.hxx"

#include <stdexcept>

/**
 * A #MemoryJobStore which can be told to fail all write operations.
 */
class FailingJobStore final : public MemoryJobStore {
public:
	bool fail = false;

	JobId Insert(const BatchJob &job) override {
		Check();
		return MemoryJobStore::Insert(job);
	}

	void Update(const BatchJob &job) override {
		Check();
		MemoryJobStore::Update(job);
	}

	void Delete(JobId id) override {
		Check();
		MemoryJobStore::Delete(id);
	}

private:
	void Check() const {
		if (fail)
			throw std::runtime_error("Database is down");
	}
};
