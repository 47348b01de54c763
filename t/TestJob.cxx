#include "TempDirectory.hxx"
#include "batch/Job.hxx"
#include "batch/Error.hxx"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <thread>

static BatchErrorCode
GetMakeJobError(const JobSubmission &s, const SubmissionDefaults &defaults={})
{
	try {
		MakeJob(s, defaults);
	} catch (const BatchError &e) {
		return e.GetCode();
	}

	ADD_FAILURE() << "MakeJob() did not fail";
	return BatchErrorCode{};
}

TEST(Job, State)
{
	BatchJob job;
	EXPECT_EQ(job.GetState(), JobState::WAITING);

	job.submitted_at = BatchTime{std::chrono::microseconds{100}};
	EXPECT_EQ(job.GetState(), JobState::WAITING);

	job.started_at = BatchTime{std::chrono::microseconds{200}};
	EXPECT_EQ(job.GetState(), JobState::RUNNING);

	job.finished_at = BatchTime{std::chrono::microseconds{300}};
	EXPECT_EQ(job.GetState(), JobState::DONE);

	EXPECT_STREQ(ToString(JobState::WAITING), "waiting");
	EXPECT_STREQ(ToString(JobState::DONE), "done");
}

TEST(Job, MakeJob)
{
	const TempDirectory dir;
	const auto script = dir.WriteScript("job.sh", "true\n");

	JobSubmission s;
	s.name = "test";
	s.script = script;
	s.requested_cpus = 2;
	s.stdout_path = "out.log";
	s.stderr_path = "/var/log/err.log";
	s.nodes = {"a", "b"};
	s.mail_to = "user@example.com";
	s.mail_events = "ea";

	const auto job = MakeJob(s, {"/", 7});
	EXPECT_EQ(job.filename, script);
	EXPECT_EQ(job.GetDirectory(), dir.GetPath());
	EXPECT_EQ(job.stdout_path, dir.Make("out.log"));
	EXPECT_EQ(job.stderr_path, "/var/log/err.log");
	EXPECT_EQ(job.requested_cpus, 2u);
	EXPECT_EQ(job.priority, 7);
	EXPECT_EQ(job.GetState(), JobState::WAITING);
	EXPECT_TRUE(job.IsAllowedOn("a"));
	EXPECT_TRUE(job.IsAllowedOn("b"));
	EXPECT_FALSE(job.IsAllowedOn("c"));
	EXPECT_FALSE(job.WantsMail('b'));
	EXPECT_TRUE(job.WantsMail('e'));
	EXPECT_TRUE(job.WantsMail('a'));

	s.priority = -3;
	s.stdout_path.clear();
	const auto job2 = MakeJob(s, {"/", 7});
	EXPECT_EQ(job2.priority, -3);
	EXPECT_TRUE(job2.stdout_path.empty());
	EXPECT_EQ(job2.GetDisplayName(), "test");
}

TEST(Job, RelativeScript)
{
	const TempDirectory dir;
	dir.WriteScript("job.sh", "true\n");

	JobSubmission s;
	s.script = "job.sh";
	s.requested_cpus = 1;

	const auto job = MakeJob(s, {dir.GetPath(), 0});
	EXPECT_EQ(job.filename, dir.Make("job.sh"));
	EXPECT_EQ(job.GetDisplayName(), job.filename);
	EXPECT_TRUE(job.IsAllowedOn("anything"));

	EXPECT_EQ(GetMakeJobError(s, {"", 0}), BatchErrorCode::VALIDATION);
}

TEST(Job, Validation)
{
	const TempDirectory dir;
	const auto script = dir.WriteScript("job.sh", "true\n");
	const auto data = dir.WriteFile("data.txt", "hello\n");

	JobSubmission s;
	s.script = script;

	/* no CPUs */
	EXPECT_EQ(GetMakeJobError(s), BatchErrorCode::VALIDATION);

	s.requested_cpus = 1;
	EXPECT_NO_THROW(MakeJob(s, {}));

	/* not executable */
	s.script = data;
	EXPECT_EQ(GetMakeJobError(s), BatchErrorCode::VALIDATION);

	/* not a regular file */
	s.script = dir.GetPath();
	EXPECT_EQ(GetMakeJobError(s), BatchErrorCode::VALIDATION);

	/* does not exist */
	s.script = dir.Make("nope.sh");
	EXPECT_EQ(GetMakeJobError(s), BatchErrorCode::VALIDATION);

	s.script.clear();
	EXPECT_EQ(GetMakeJobError(s), BatchErrorCode::VALIDATION);

	s.script = script;
	s.mail_events = "x";
	EXPECT_EQ(GetMakeJobError(s), BatchErrorCode::VALIDATION);

	s.mail_events.clear();
	s.nodes = {""};
	EXPECT_EQ(GetMakeJobError(s), BatchErrorCode::VALIDATION);
}

TEST(Job, HeaderInjection)
{
	const TempDirectory dir;

	JobSubmission s;
	s.script = dir.WriteScript("job.sh", "true\n");
	s.requested_cpus = 1;
	s.name = "report";
	s.mail_to = "user@example.com";
	s.mail_events = "e";
	EXPECT_NO_THROW(MakeJob(s, {}));

	s.name = "report\r\nBcc: victim@example.com";
	EXPECT_EQ(GetMakeJobError(s), BatchErrorCode::VALIDATION);

	s.name = "tab\tname";
	EXPECT_EQ(GetMakeJobError(s), BatchErrorCode::VALIDATION);

	s.name = "del\x7f";
	EXPECT_EQ(GetMakeJobError(s), BatchErrorCode::VALIDATION);

	s.name = "report";
	s.mail_to = "user@example.com\nBcc: victim@example.com";
	EXPECT_EQ(GetMakeJobError(s), BatchErrorCode::VALIDATION);

	/* non-ASCII is allowed */
	s.mail_to = "user@example.com";
	s.name = "Bericht f\xc3\xbcr M\xc3\xa4rz";
	EXPECT_NO_THROW(MakeJob(s, {}));
}

TEST(Job, Now)
{
	using namespace std::chrono_literals;

	const auto a = BatchNow();
	std::this_thread::sleep_for(2ms);
	const auto b = BatchNow();
	EXPECT_LT(a, b);
}

static BatchJob
MakeTestJob(JobId id, int priority, int64_t submitted)
{
	BatchJob job;
	job.id = id;
	job.priority = priority;
	job.submitted_at = BatchTime{std::chrono::microseconds{submitted}};
	return job;
}

TEST(Job, SchedulingOrder)
{
	std::vector<BatchJob> jobs{
		MakeTestJob(1, 0, 100),
		MakeTestJob(2, 5, 200),
		MakeTestJob(3, 0, 50),
		MakeTestJob(4, 0, 100),
		MakeTestJob(5, -1, 10),
	};

	std::sort(jobs.begin(), jobs.end(), CompareSchedulingOrder);

	ASSERT_EQ(jobs.size(), 5u);
	EXPECT_EQ(jobs[0].id, 2u);
	EXPECT_EQ(jobs[1].id, 3u);
	EXPECT_EQ(jobs[2].id, 1u);
	EXPECT_EQ(jobs[3].id, 4u);
	EXPECT_EQ(jobs[4].id, 5u);
}

TEST(Job, ListingOrder)
{
	std::vector<BatchJob> jobs{
		MakeTestJob(1, 0, 300),
		MakeTestJob(2, 9, 100),
		MakeTestJob(3, 0, 200),
	};

	SortForListing(jobs, JobState::WAITING);
	EXPECT_EQ(jobs[0].id, 2u);
	EXPECT_EQ(jobs[1].id, 3u);
	EXPECT_EQ(jobs[2].id, 1u);

	jobs[0].finished_at = BatchTime{std::chrono::microseconds{1000}};
	jobs[1].finished_at = BatchTime{std::chrono::microseconds{3000}};
	jobs[2].finished_at = BatchTime{std::chrono::microseconds{2000}};

	SortForListing(jobs, JobState::DONE);
	EXPECT_EQ(jobs[0].id, 3u);
	EXPECT_EQ(jobs[1].id, 1u);
	EXPECT_EQ(jobs[2].id, 2u);
}
