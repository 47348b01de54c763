#include "TempDirectory.hxx"
#include "FailingJobStore.hxx"
#include "batch/Scheduler.hxx"
#include "batch/Notification.hxx"
#include "batch/Error.hxx"
#include "event/EventLoop.hxx"

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <set>
#include <vector>

/**
 * Pretends to launch processes; the test decides when they exit.
 */
class FakeLauncher final : public ProcessLauncher {
	int next_pid = 1000;

public:
	std::map<int, ProcessExitListener *> processes;
	std::map<int, JobId> jobs;
	std::vector<JobId> launched;
	std::set<int> terminated;

	bool fail = false;

	int Launch(const BatchJob &job, ProcessExitListener &listener) override {
		if (fail)
			throw BatchError(BatchErrorCode::LAUNCH, "Launch failed");

		const int pid = next_pid++;
		processes.emplace(pid, &listener);
		jobs.emplace(pid, job.id);
		launched.push_back(job.id);
		return pid;
	}

	bool Terminate(int pid) noexcept override {
		if (!processes.contains(pid))
			return false;

		terminated.insert(pid);
		return true;
	}

	void Exit(int pid, int exit_code) {
		auto i = processes.find(pid);
		ASSERT_NE(i, processes.end());
		auto &listener = *i->second;
		processes.erase(i);
		listener.OnProcessExit(pid, exit_code);
	}

	int GetPid(JobId id) const {
		for (const auto &[pid, job_id] : jobs)
			if (job_id == id)
				return pid;

		return -1;
	}
};

class RecordingHook final : public NotificationHook {
public:
	std::vector<std::pair<JobId, JobEvent>> events;

	void Notify(const BatchJob &job, JobEvent event) noexcept override {
		events.emplace_back(job.id, event);
	}

	std::size_t Count(JobId id, JobEvent event) const noexcept {
		return std::count(events.begin(), events.end(),
				  std::make_pair(id, event));
	}
};

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

struct SchedulerTest : ::testing::Test {
	const TempDirectory dir;
	const std::string script = dir.WriteScript("job.sh", "true\n");

	EventLoop event_loop;
	const RootLogger logger;

	FailingJobStore store;
	FakeLauncher launcher;
	RecordingHook hook;

	BatchScheduler scheduler{
		event_loop, logger, store, launcher, hook,
		"node1", 4, std::chrono::seconds{10},
	};

	JobId Submit(unsigned cpus, std::optional<int> priority={}) {
		JobSubmission s;
		s.script = script;
		s.requested_cpus = cpus;
		s.priority = priority;
		return scheduler.Submit(s);
	}

	JobState GetState(JobId id) const {
		return scheduler.GetRegistry().Get(id).GetState();
	}

	unsigned GetCommitted() const noexcept {
		return scheduler.GetCpus().first;
	}

	/**
	 * Verify that the committed CPUs match the Running jobs and
	 * do not exceed the capacity.
	 */
	void CheckLedger() const {
		unsigned sum = 0;
		for (const auto &job : scheduler.ListRunning())
			sum += job.requested_cpus;

		const auto [committed, capacity] = scheduler.GetCpus();
		EXPECT_LE(sum, capacity);
		EXPECT_EQ(sum, committed);
	}

	void Exit(JobId id, int exit_code) {
		launcher.Exit(launcher.GetPid(id), exit_code);
	}
};

TEST_F(SchedulerTest, Progression)
{
	const JobId id = Submit(1);
	EXPECT_EQ(GetState(id), JobState::RUNNING);
	EXPECT_EQ(GetCommitted(), 1u);
	EXPECT_EQ(hook.Count(id, JobEvent::STARTED), 1u);
	CheckLedger();

	const auto &job = scheduler.GetRegistry().Get(id);
	EXPECT_EQ(job.node, "node1");
	EXPECT_EQ(job.pid, launcher.GetPid(id));
	EXPECT_GT(job.started_at, job.submitted_at);

	Exit(id, 0);
	EXPECT_EQ(GetState(id), JobState::DONE);
	EXPECT_EQ(job.exit_code, 0);
	EXPECT_EQ(job.pid, 0);
	EXPECT_GT(job.finished_at, job.started_at);
	EXPECT_EQ(GetCommitted(), 0u);
	EXPECT_EQ(hook.Count(id, JobEvent::FINISHED), 1u);
	CheckLedger();

	const auto finished = scheduler.ListFinished(5);
	ASSERT_EQ(finished.size(), 1u);
	EXPECT_EQ(finished.front().id, id);
}

TEST_F(SchedulerTest, FailedExit)
{
	const JobId a = Submit(1);
	const JobId b = Submit(1);

	Exit(a, 3);
	Exit(b, -9);

	EXPECT_EQ(scheduler.GetRegistry().Get(a).exit_code, 3);
	EXPECT_EQ(scheduler.GetRegistry().Get(b).exit_code, -9);
	EXPECT_EQ(hook.Count(a, JobEvent::FAILED), 1u);
	EXPECT_EQ(hook.Count(b, JobEvent::FAILED), 1u);
	EXPECT_EQ(hook.Count(a, JobEvent::FINISHED), 0u);
}

TEST_F(SchedulerTest, Capacity)
{
	const JobId x = Submit(4);
	const JobId y = Submit(2);

	EXPECT_EQ(GetState(x), JobState::RUNNING);
	EXPECT_EQ(GetState(y), JobState::WAITING);
	EXPECT_EQ(scheduler.GetCpus(), std::make_pair(4u, 4u));
	CheckLedger();

	Exit(x, 0);
	scheduler.RunPass();

	EXPECT_EQ(GetState(x), JobState::DONE);
	EXPECT_EQ(GetState(y), JobState::RUNNING);
	EXPECT_EQ(scheduler.GetCpus(), std::make_pair(2u, 4u));
	CheckLedger();
}

TEST_F(SchedulerTest, Backfill)
{
	const JobId a = Submit(3);
	const JobId big = Submit(2, 10);
	const JobId small = Submit(1);

	/* the big job does not fit, but the small one does */
	EXPECT_EQ(GetState(a), JobState::RUNNING);
	EXPECT_EQ(GetState(big), JobState::WAITING);
	EXPECT_EQ(GetState(small), JobState::RUNNING);
	CheckLedger();
}

TEST_F(SchedulerTest, ZeroCpusRejected)
{
	Submit(1);
	EXPECT_EQ(GetErrorCode([&]{ Submit(0); }),
		  BatchErrorCode::VALIDATION);
	EXPECT_EQ(scheduler.GetRegistry().size(), 1u);
	EXPECT_EQ(store.size(), 1u);
}

TEST_F(SchedulerTest, RemoveWaiting)
{
	const JobId x = Submit(4);
	const JobId y = Submit(1);
	ASSERT_EQ(GetState(y), JobState::WAITING);

	scheduler.Remove(y);

	for (const auto &job : scheduler.ListWaiting())
		EXPECT_NE(job.id, y);
	for (const auto &job : scheduler.ListRunning())
		EXPECT_NE(job.id, y);
	for (const auto &job : scheduler.ListFinished(0))
		EXPECT_NE(job.id, y);

	EXPECT_EQ(scheduler.GetRegistry().Find(y), nullptr);
	EXPECT_EQ(GetErrorCode([&]{ scheduler.Remove(y); }),
		  BatchErrorCode::NOT_FOUND);

	/* a removed job never starts */
	Exit(x, 0);
	scheduler.RunPass();
	EXPECT_EQ(launcher.launched, std::vector<JobId>{x});
}

TEST_F(SchedulerTest, RemoveRunning)
{
	const JobId x = Submit(3);
	const int pid = launcher.GetPid(x);

	scheduler.Remove(x);
	EXPECT_TRUE(launcher.terminated.contains(pid));

	/* still listed and still committed until the exit arrives */
	EXPECT_EQ(GetState(x), JobState::RUNNING);
	EXPECT_EQ(GetCommitted(), 3u);
	CheckLedger();

	/* repeated remove is a no-op */
	launcher.terminated.clear();
	scheduler.Remove(x);
	EXPECT_TRUE(launcher.terminated.empty());

	launcher.Exit(pid, -9);
	EXPECT_EQ(scheduler.GetRegistry().Find(x), nullptr);
	EXPECT_EQ(GetCommitted(), 0u);
	EXPECT_EQ(store.size(), 0u);
	EXPECT_EQ(hook.Count(x, JobEvent::FAILED), 1u);
}

TEST_F(SchedulerTest, PriorityAndFifo)
{
	scheduler.SetCapacity(1);

	const JobId blocker = Submit(1);
	const JobId a = Submit(1);
	const JobId b = Submit(1);
	const JobId c = Submit(1, 5);
	const JobId d = Submit(1);

	ASSERT_EQ(GetState(blocker), JobState::RUNNING);

	std::vector<JobId> order;
	JobId current = blocker;
	for (unsigned i = 0; i < 4; ++i) {
		Exit(current, 0);
		scheduler.RunPass();

		const auto running = scheduler.ListRunning();
		ASSERT_EQ(running.size(), 1u);
		current = running.front().id;
		order.push_back(current);
		CheckLedger();
	}

	EXPECT_EQ(order, (std::vector<JobId>{c, a, b, d}));
}

TEST_F(SchedulerTest, RunDoesNotExceedCapacity)
{
	const JobId x = Submit(3);
	const JobId y = Submit(2);
	ASSERT_EQ(GetState(y), JobState::WAITING);

	scheduler.Run(y);
	EXPECT_EQ(GetState(y), JobState::WAITING);
	CheckLedger();

	/* no-op for jobs which are not waiting */
	scheduler.Run(x);
	EXPECT_EQ(GetState(x), JobState::RUNNING);

	EXPECT_EQ(GetErrorCode([&]{ scheduler.Run(12345); }),
		  BatchErrorCode::NOT_FOUND);
}

TEST_F(SchedulerTest, RunFirst)
{
	Submit(3);

	/* all launches fail, so everything stays waiting */
	launcher.fail = true;
	const JobId a = Submit(1, 10);
	const JobId b = Submit(1);
	EXPECT_EQ(GetState(a), JobState::WAITING);
	EXPECT_EQ(GetState(b), JobState::WAITING);
	EXPECT_EQ(GetCommitted(), 3u);
	CheckLedger();

	/* the forced job takes the last free CPU despite its lower
	   priority */
	launcher.fail = false;
	scheduler.Run(b);
	EXPECT_EQ(GetState(b), JobState::RUNNING);
	EXPECT_EQ(GetState(a), JobState::WAITING);
	CheckLedger();
}

TEST_F(SchedulerTest, LaunchFailureRetried)
{
	launcher.fail = true;
	const JobId id = Submit(2);
	EXPECT_EQ(GetState(id), JobState::WAITING);
	EXPECT_EQ(GetCommitted(), 0u);

	launcher.fail = false;
	scheduler.RunPass();
	EXPECT_EQ(GetState(id), JobState::RUNNING);
	EXPECT_EQ(GetCommitted(), 2u);
}

TEST_F(SchedulerTest, SetCapacity)
{
	const JobId x = Submit(4);
	const JobId y = Submit(4);
	ASSERT_EQ(GetState(y), JobState::WAITING);

	scheduler.SetCapacity(8);
	EXPECT_EQ(scheduler.GetCpus(), std::make_pair(8u, 8u));
	EXPECT_EQ(GetState(x), JobState::RUNNING);
	EXPECT_EQ(GetState(y), JobState::RUNNING);
	CheckLedger();
}

TEST_F(SchedulerTest, ShrinkBelowCommitted)
{
	const JobId x = Submit(4);
	ASSERT_EQ(GetState(x), JobState::RUNNING);

	EXPECT_EQ(GetErrorCode([&]{ scheduler.SetCapacity(2); }),
		  BatchErrorCode::CONFIG);
	EXPECT_EQ(scheduler.GetCpus(), std::make_pair(4u, 4u));
	CheckLedger();

	Exit(x, 0);
	scheduler.SetCapacity(2);
	EXPECT_EQ(scheduler.GetCpus(), std::make_pair(0u, 2u));
	CheckLedger();
}

TEST_F(SchedulerTest, DuplicateExit)
{
	const JobId id = Submit(2);
	const int pid = launcher.GetPid(id);

	launcher.Exit(pid, 0);
	/* the same notification again, bypassing the fake */
	scheduler.OnProcessExit(pid, 1);

	EXPECT_EQ(GetState(id), JobState::DONE);
	EXPECT_EQ(scheduler.GetRegistry().Get(id).exit_code, 0);
	EXPECT_EQ(GetCommitted(), 0u);
	EXPECT_EQ(hook.Count(id, JobEvent::FINISHED), 1u);
	EXPECT_EQ(hook.Count(id, JobEvent::FAILED), 0u);
}

TEST_F(SchedulerTest, NotAllowedHere)
{
	JobSubmission s;
	s.script = script;
	s.requested_cpus = 1;
	s.nodes = {"node2"};
	const JobId other = scheduler.Submit(s);

	s.nodes = {"node2", "node1"};
	const JobId here = scheduler.Submit(s);

	EXPECT_EQ(GetState(other), JobState::WAITING);
	EXPECT_EQ(GetState(here), JobState::RUNNING);

	scheduler.RunPass();
	EXPECT_EQ(GetState(other), JobState::WAITING);
}

TEST_F(SchedulerTest, StorageFailureOnSubmit)
{
	store.fail = true;
	EXPECT_EQ(GetErrorCode([&]{ Submit(1); }), BatchErrorCode::STORAGE);
	EXPECT_EQ(scheduler.GetRegistry().size(), 0u);
	EXPECT_TRUE(launcher.launched.empty());
	EXPECT_EQ(GetCommitted(), 0u);
}

TEST_F(SchedulerTest, StorageFailureOnStart)
{
	const JobId x = Submit(3);

	launcher.fail = true;
	const JobId y = Submit(1);
	ASSERT_EQ(GetState(y), JobState::WAITING);
	launcher.fail = false;

	/* the start of y cannot be recorded: the process is killed
	   and the CPU released */
	store.fail = true;
	scheduler.RunPass();
	EXPECT_EQ(GetState(y), JobState::WAITING);
	EXPECT_EQ(launcher.launched, (std::vector<JobId>{x, y}));
	EXPECT_TRUE(launcher.terminated.contains(launcher.GetPid(y)));
	EXPECT_EQ(GetCommitted(), 3u);
	CheckLedger();

	store.fail = false;
	scheduler.RunPass();
	EXPECT_EQ(GetState(y), JobState::RUNNING);
	CheckLedger();
}

TEST_F(SchedulerTest, StorageFailureOnExit)
{
	const JobId x = Submit(4);
	const JobId y = Submit(1);

	/* the exit cannot be recorded: x stays Running and keeps its
	   CPUs */
	store.fail = true;
	Exit(x, 0);
	EXPECT_EQ(GetState(x), JobState::RUNNING);
	EXPECT_EQ(GetCommitted(), 4u);
	EXPECT_EQ(hook.Count(x, JobEvent::FINISHED), 0u);

	scheduler.RunPass();
	EXPECT_EQ(GetState(x), JobState::RUNNING);

	/* once the store is back, the exit is recorded and y can
	   start */
	store.fail = false;
	scheduler.RunPass();
	EXPECT_EQ(GetState(x), JobState::DONE);
	EXPECT_EQ(scheduler.GetRegistry().Get(x).exit_code, 0);
	EXPECT_EQ(hook.Count(x, JobEvent::FINISHED), 1u);
	EXPECT_EQ(GetState(y), JobState::RUNNING);
	CheckLedger();
}

TEST_F(SchedulerTest, StorageFailureOnRemove)
{
	Submit(4);
	const JobId y = Submit(1);

	store.fail = true;
	EXPECT_EQ(GetErrorCode([&]{ scheduler.Remove(y); }),
		  BatchErrorCode::STORAGE);
	EXPECT_EQ(GetState(y), JobState::WAITING);
}

TEST_F(SchedulerTest, RecoverLostJobs)
{
	BatchJob lost;
	lost.filename = script;
	lost.requested_cpus = 2;
	lost.submitted_at = BatchTime{std::chrono::microseconds{1'000'000}};
	lost.started_at = BatchTime{std::chrono::microseconds{2'000'000}};
	lost.node = "node1";
	lost.pid = 4242;
	const JobId lost_id = store.Insert(lost);

	lost.node = "node2";
	const JobId elsewhere = store.Insert(lost);

	BatchJob waiting;
	waiting.filename = script;
	waiting.requested_cpus = 1;
	waiting.submitted_at = BatchTime{std::chrono::microseconds{3'000'000}};
	const JobId waiting_id = store.Insert(waiting);

	scheduler.Start();

	const auto &job = scheduler.GetRegistry().Get(lost_id);
	EXPECT_EQ(job.GetState(), JobState::DONE);
	EXPECT_EQ(job.exit_code, -1);
	EXPECT_EQ(hook.Count(lost_id, JobEvent::FAILED), 1u);

	/* jobs of other nodes are not touched */
	EXPECT_EQ(GetState(elsewhere), JobState::RUNNING);

	EXPECT_EQ(GetState(waiting_id), JobState::RUNNING);
	EXPECT_EQ(GetCommitted(), 1u);
}

TEST_F(SchedulerTest, DeferredPass)
{
	const JobId x = Submit(4);
	const JobId y = Submit(4);

	Exit(x, 0);
	EXPECT_EQ(GetState(y), JobState::WAITING);

	/* the exit has scheduled a pass inside the event loop */
	event_loop.RunOnce(false);
	EXPECT_EQ(GetState(y), JobState::RUNNING);
}
