#include "TempDirectory.hxx"
#include "FailingJobStore.hxx"
#include "batch/Registry.hxx"
#include "batch/Error.hxx"

#include <gtest/gtest.h>

using std::chrono::microseconds;

static BatchErrorCode
GetErrorCode(auto &&f)
{
	try {
		f();
	} catch (const BatchError &e) {
		return e.GetCode();
	}

	ADD_FAILURE() << "no BatchError";
	return BatchErrorCode{};
}

struct RegistryTest : ::testing::Test {
	const TempDirectory dir;
	FailingJobStore store;
	JobRegistry registry{store};

	JobSubmission submission;

	const BatchTime t0{microseconds{1'000'000}};

	RegistryTest() {
		submission.script = dir.WriteScript("job.sh", "true\n");
		submission.requested_cpus = 1;
	}
};

TEST_F(RegistryTest, Create)
{
	const auto &job = registry.Create(submission, {}, t0);
	EXPECT_EQ(job.id, 1u);
	EXPECT_EQ(job.submitted_at, t0);
	EXPECT_EQ(job.GetState(), JobState::WAITING);

	const auto &job2 = registry.Create(submission, {}, t0);
	EXPECT_EQ(job2.id, 2u);

	EXPECT_EQ(registry.size(), 2u);
	EXPECT_EQ(store.size(), 2u);
	EXPECT_EQ(registry.List(JobState::WAITING).size(), 2u);
	EXPECT_TRUE(registry.List(JobState::RUNNING).empty());
	EXPECT_TRUE(registry.List(JobState::DONE).empty());

	EXPECT_EQ(registry.Get(1).id, 1u);
	EXPECT_EQ(registry.Find(3), nullptr);
	EXPECT_EQ(GetErrorCode([&]{ registry.Get(3); }),
		  BatchErrorCode::NOT_FOUND);
}

TEST_F(RegistryTest, ZeroCpusRejected)
{
	submission.requested_cpus = 0;
	EXPECT_EQ(GetErrorCode([&]{ registry.Create(submission, {}, t0); }),
		  BatchErrorCode::VALIDATION);
	EXPECT_EQ(registry.size(), 0u);
	EXPECT_EQ(store.size(), 0u);
}

TEST_F(RegistryTest, Progression)
{
	const JobId id = registry.Create(submission, {}, t0).id;

	/* a start timestamp in the same microsecond gets bumped */
	registry.MarkStarted(id, "node1", 42, t0);

	const auto &job = registry.Get(id);
	EXPECT_EQ(job.GetState(), JobState::RUNNING);
	EXPECT_GT(job.started_at, job.submitted_at);
	EXPECT_EQ(job.node, "node1");
	EXPECT_EQ(job.pid, 42);

	/* can't start twice */
	EXPECT_EQ(GetErrorCode([&]{ registry.MarkStarted(id, "node1", 43, t0); }),
		  BatchErrorCode::CONFLICT);

	EXPECT_TRUE(registry.MarkFinished(id, 3, t0));
	EXPECT_EQ(job.GetState(), JobState::DONE);
	EXPECT_GT(job.finished_at, job.started_at);
	EXPECT_EQ(job.exit_code, 3);
	EXPECT_EQ(job.pid, 0);

	/* duplicate exit is ignored */
	const auto finished_at = job.finished_at;
	EXPECT_FALSE(registry.MarkFinished(id, 0, t0 + microseconds{500}));
	EXPECT_EQ(job.exit_code, 3);
	EXPECT_EQ(job.finished_at, finished_at);

	/* Done is final */
	EXPECT_EQ(GetErrorCode([&]{ registry.MarkStarted(id, "node1", 44, t0); }),
		  BatchErrorCode::CONFLICT);

	/* the store has the same record */
	const auto stored = store.Query(JobState::DONE, 0);
	ASSERT_EQ(stored.size(), 1u);
	EXPECT_EQ(stored.front().exit_code, 3);
	EXPECT_EQ(stored.front().finished_at, finished_at);
}

TEST_F(RegistryTest, StoreMatchesListing)
{
	JobId ids[3];
	for (unsigned i = 0; i < 3; ++i) {
		ids[i] = registry.Create(submission, {}, t0).id;
		registry.MarkStarted(ids[i], "node1", 42 + i, t0);
	}

	/* finish in reverse order */
	registry.MarkFinished(ids[2], 0, t0 + microseconds{1});
	registry.MarkFinished(ids[0], 0, t0 + microseconds{2});
	registry.MarkFinished(ids[1], 0, t0 + microseconds{3});

	const auto listed = registry.List(JobState::DONE, 2);
	const auto stored = store.Query(JobState::DONE, 2);
	ASSERT_EQ(listed.size(), 2u);
	ASSERT_EQ(stored.size(), 2u);
	EXPECT_EQ(stored[0].id, ids[1]);
	EXPECT_EQ(stored[1].id, ids[0]);
	EXPECT_EQ(listed[0].id, stored[0].id);
	EXPECT_EQ(listed[1].id, stored[1].id);

	EXPECT_EQ(store.Query(JobState::DONE, 0).size(), 3u);
	EXPECT_TRUE(store.Query(JobState::WAITING, 0).empty());
}

TEST_F(RegistryTest, MarkFinishedWaiting)
{
	const JobId id = registry.Create(submission, {}, t0).id;
	EXPECT_FALSE(registry.MarkFinished(id, 0, t0));
	EXPECT_EQ(registry.Get(id).GetState(), JobState::WAITING);
}

TEST_F(RegistryTest, Delete)
{
	const JobId a = registry.Create(submission, {}, t0).id;
	const JobId b = registry.Create(submission, {}, t0).id;

	registry.MarkStarted(b, "node1", 42, t0);

	registry.Delete(a);
	EXPECT_EQ(registry.Find(a), nullptr);
	EXPECT_TRUE(registry.List(JobState::WAITING).empty());
	EXPECT_EQ(store.size(), 1u);

	EXPECT_EQ(GetErrorCode([&]{ registry.Delete(a); }),
		  BatchErrorCode::NOT_FOUND);

	EXPECT_EQ(GetErrorCode([&]{ registry.Delete(b); }),
		  BatchErrorCode::CONFLICT);
	EXPECT_EQ(registry.List(JobState::RUNNING).size(), 1u);

	registry.MarkFinished(b, 0, t0);
	registry.Delete(b);
	EXPECT_EQ(registry.size(), 0u);
	EXPECT_EQ(store.size(), 0u);

	/* ids are never reused */
	EXPECT_EQ(registry.Create(submission, {}, t0).id, 3u);
}

TEST_F(RegistryTest, StorageFailure)
{
	const JobId id = registry.Create(submission, {}, t0).id;

	store.fail = true;

	EXPECT_EQ(GetErrorCode([&]{ registry.Create(submission, {}, t0); }),
		  BatchErrorCode::STORAGE);
	EXPECT_EQ(registry.size(), 1u);

	EXPECT_EQ(GetErrorCode([&]{ registry.MarkStarted(id, "node1", 42, t0); }),
		  BatchErrorCode::STORAGE);
	EXPECT_EQ(registry.Get(id).GetState(), JobState::WAITING);
	EXPECT_EQ(registry.Get(id).pid, 0);

	EXPECT_EQ(GetErrorCode([&]{ registry.Delete(id); }),
		  BatchErrorCode::STORAGE);
	EXPECT_NE(registry.Find(id), nullptr);

	store.fail = false;

	registry.MarkStarted(id, "node1", 42, t0);
	store.fail = true;

	EXPECT_EQ(GetErrorCode([&]{ registry.MarkFinished(id, 0, t0); }),
		  BatchErrorCode::STORAGE);
	EXPECT_EQ(registry.Get(id).GetState(), JobState::RUNNING);
}

TEST_F(RegistryTest, ListOrderAndLimit)
{
	for (int i = 0; i < 4; ++i)
		registry.Create(submission, {}, t0 + microseconds{10 - i});

	const auto waiting = registry.List(JobState::WAITING);
	ASSERT_EQ(waiting.size(), 4u);
	EXPECT_EQ(waiting[0].id, 4u);
	EXPECT_EQ(waiting[3].id, 1u);

	for (JobId id = 1; id <= 4; ++id) {
		registry.MarkStarted(id, "node1", 100 + id, t0 + microseconds{100});
		registry.MarkFinished(id, 0, t0 + microseconds{200 + id});
	}

	const auto done = registry.List(JobState::DONE, 2);
	ASSERT_EQ(done.size(), 2u);
	EXPECT_EQ(done[0].id, 4u);
	EXPECT_EQ(done[1].id, 3u);

	EXPECT_EQ(registry.List(JobState::DONE).size(), 4u);
}

TEST_F(RegistryTest, Load)
{
	registry.Create(submission, {}, t0);
	registry.Create(submission, {}, t0);

	JobRegistry other{store};
	other.Load();
	EXPECT_EQ(other.size(), 2u);
	EXPECT_NE(other.Find(2), nullptr);
}
