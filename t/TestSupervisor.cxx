#include "TempDirectory.hxx"
#include "batch/Supervisor.hxx"
#include "batch/Job.hxx"
#include "batch/Error.hxx"
#include "event/EventLoop.hxx"
#include "event/TimerEvent.hxx"

#include <gtest/gtest.h>

#include <signal.h>
#include <sys/wait.h>

struct SupervisorTest : ::testing::Test, ProcessExitListener {
	const TempDirectory dir;

	EventLoop event_loop;
	const RootLogger logger;

	ProcessSupervisor supervisor{event_loop, logger, "node1"};

	TimerEvent timeout{event_loop, [this]{
		timed_out = true;
		event_loop.Break();
	}};

	int exited_pid = -1, exit_code = 0;
	unsigned n_exits = 0;
	bool timed_out = false;

	BatchJob MakeTestJob(std::string_view body) const {
		BatchJob job;
		job.id = 42;
		job.name = "test";
		job.requested_cpus = 3;
		job.filename = dir.WriteScript("job.sh", body);
		return job;
	}

	/**
	 * Run the event loop until a process has exited.
	 */
	void WaitExit() {
		timeout.Schedule(std::chrono::seconds{10});
		event_loop.Run();
		timeout.Cancel();
		ASSERT_FALSE(timed_out);
	}

	/* virtual methods from class ProcessExitListener */
	void OnProcessExit(int pid, int _exit_code) noexcept override {
		exited_pid = pid;
		exit_code = _exit_code;
		++n_exits;
		event_loop.Break();
	}
};

static BatchErrorCode
GetLaunchError(ProcessSupervisor &supervisor, const BatchJob &job,
	       ProcessExitListener &listener)
{
	try {
		supervisor.Launch(job, listener);
	} catch (const BatchError &e) {
		return e.GetCode();
	}

	ADD_FAILURE() << "Launch() did not fail";
	return BatchErrorCode{};
}

TEST(TranslateWaitStatus, Basic)
{
	EXPECT_EQ(TranslateWaitStatus(0), 0);
	EXPECT_EQ(TranslateWaitStatus(3 << 8), 3);
	EXPECT_EQ(TranslateWaitStatus(SIGKILL), -SIGKILL);
	EXPECT_EQ(TranslateWaitStatus(SIGTERM), -SIGTERM);
}

TEST_F(SupervisorTest, ExitStatus)
{
	const auto job = MakeTestJob("exit 3\n");

	const int pid = supervisor.Launch(job, *this);
	EXPECT_GT(pid, 0);
	EXPECT_EQ(supervisor.GetChildCount(), 1u);

	WaitExit();
	EXPECT_EQ(exited_pid, pid);
	EXPECT_EQ(exit_code, 3);
	EXPECT_EQ(n_exits, 1u);
	EXPECT_EQ(supervisor.GetChildCount(), 0u);

	/* the process is gone */
	EXPECT_FALSE(supervisor.Terminate(pid));
}

TEST_F(SupervisorTest, Environment)
{
	auto job = MakeTestJob("echo $BATCH_JOBID $BATCH_JOBNAME $BATCH_NODE $BATCH_NCPUS\n"
			       "pwd\n"
			       "echo oops >&2\n");
	job.stdout_path = dir.Make("out.log");
	job.stderr_path = dir.Make("err.log");

	supervisor.Launch(job, *this);
	WaitExit();
	EXPECT_EQ(exit_code, 0);

	EXPECT_EQ(dir.ReadFile("out.log"),
		  "42 test node1 3\n" + dir.GetPath() + "\n");
	EXPECT_EQ(dir.ReadFile("err.log"), "oops\n");
}

TEST_F(SupervisorTest, Truncate)
{
	auto job = MakeTestJob("echo new\n");
	job.stdout_path = dir.WriteFile("out.log", "old contents\n");

	supervisor.Launch(job, *this);
	WaitExit();
	EXPECT_EQ(dir.ReadFile("out.log"), "new\n");
}

TEST_F(SupervisorTest, Signal)
{
	const auto job = MakeTestJob("kill -TERM $$\n");

	supervisor.Launch(job, *this);
	WaitExit();
	EXPECT_EQ(exit_code, -SIGTERM);
}

TEST_F(SupervisorTest, Terminate)
{
	const auto job = MakeTestJob("sleep 60\n");

	const int pid = supervisor.Launch(job, *this);
	EXPECT_TRUE(supervisor.Terminate(pid));

	WaitExit();
	EXPECT_EQ(exited_pid, pid);
	EXPECT_EQ(exit_code, -SIGKILL);
	EXPECT_EQ(n_exits, 1u);
}

TEST_F(SupervisorTest, TerminateUnknown)
{
	EXPECT_FALSE(supervisor.Terminate(999999));
}

TEST_F(SupervisorTest, LaunchErrors)
{
	BatchJob job;
	job.id = 1;

	/* missing script */
	job.filename = dir.Make("nope.sh");
	EXPECT_EQ(GetLaunchError(supervisor, job, *this),
		  BatchErrorCode::LAUNCH);

	/* missing working directory */
	job.filename = dir.Make("nope/job.sh");
	EXPECT_EQ(GetLaunchError(supervisor, job, *this),
		  BatchErrorCode::LAUNCH);

	/* not executable */
	job.filename = dir.WriteFile("data.txt", "hello\n");
	EXPECT_EQ(GetLaunchError(supervisor, job, *this),
		  BatchErrorCode::LAUNCH);

	/* execve() fails in the child */
	job.filename = dir.WriteFile("bad.sh", "#!/nonexistent/interpreter\n",
				     0755);
	EXPECT_EQ(GetLaunchError(supervisor, job, *this),
		  BatchErrorCode::LAUNCH);

	/* output file cannot be created */
	job = MakeTestJob("true\n");
	job.stdout_path = dir.Make("nope/out.log");
	EXPECT_EQ(GetLaunchError(supervisor, job, *this),
		  BatchErrorCode::LAUNCH);

	EXPECT_EQ(supervisor.GetChildCount(), 0u);
	EXPECT_EQ(n_exits, 0u);
}
