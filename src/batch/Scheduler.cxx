// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Scheduler.hxx"
#include "Notification.hxx"
#include "Error.hxx"

#include <algorithm>

BatchScheduler::BatchScheduler(EventLoop &event_loop,
			       const Logger &parent_logger,
			       JobStore &store, ProcessLauncher &_launcher,
			       NotificationHook &_hook,
			       std::string_view _node_name, unsigned ncpus,
			       TimerEvent::Duration _tick)
	:logger(parent_logger, "scheduler"),
	 registry(store), launcher(_launcher), hook(_hook),
	 node_name(_node_name),
	 defer_pass(event_loop, [this]{ RunPass(); }),
	 tick_timer(event_loop, [this]{ OnTick(); }),
	 tick(_tick)
{
	/* a new node has nothing committed, this cannot fail */
	ledger.SetCapacity(node_name, ncpus);
}

void
BatchScheduler::Start()
{
	registry.Load();

	logger(2, "loaded ", registry.size(), " jobs");

	RecoverLostJobs();
	RunPass();

	tick_timer.Schedule(tick);
}

void
BatchScheduler::RecoverLostJobs() noexcept
{
	const auto now = BatchNow();

	for (const auto &job : registry.List(JobState::RUNNING)) {
		if (job.node != node_name)
			continue;

		logger(1, "job ", job.id, " (pid ", job.pid,
		       ") was lost by the previous instance");

		if (!FinishJob(job.id, -1, now))
			unrecorded_exits.insert_or_assign(job.id,
							  std::make_pair(-1, now));
	}
}

void
BatchScheduler::SetCapacity(unsigned ncpus)
{
	if (!ledger.SetCapacity(node_name, ncpus))
		throw FmtBatchError(BatchErrorCode::CONFIG,
				    "Cannot reduce to {} CPUs while {} are in use",
				    ncpus, ledger.Committed(node_name));

	logger(2, "capacity of node '", node_name, "' is now ", ncpus);

	RunPass();
}

JobId
BatchScheduler::Submit(const JobSubmission &submission)
{
	const auto &job = registry.Create(submission, defaults, BatchNow());
	const JobId id = job.id;

	logger.Fmt(2, "job {} ({:?}) submitted, {} CPUs, priority {}",
		   id, job.GetDisplayName(), job.requested_cpus, job.priority);

	RunPass();
	return id;
}

void
BatchScheduler::Remove(JobId id)
{
	const auto &job = registry.Get(id);

	if (job.GetState() == JobState::RUNNING) {
		if (remove_on_exit.contains(id))
			/* already being removed */
			return;

		if (!launcher.Terminate(job.pid))
			logger(2, "process ", job.pid, " of job ", id,
			       " is already gone");

		remove_on_exit.insert(id);
		logger(2, "job ", id, " will be removed after its process exits");
		return;
	}

	registry.Delete(id);

	warned_not_here.erase(id);
	std::erase(force_run, id);

	logger(2, "job ", id, " removed");

	defer_pass.Schedule();
}

void
BatchScheduler::Run(JobId id)
{
	const auto &job = registry.Get(id);
	if (job.GetState() != JobState::WAITING)
		return;

	force_run.push_back(id);
	RunPass();
}

bool
BatchScheduler::TryStart(const BatchJob &job) noexcept
{
	if (!ledger.TryReserve(node_name, job.requested_cpus))
		return false;

	int pid;

	try {
		pid = launcher.Launch(job, *this);
	} catch (...) {
		ledger.Release(node_name, job.requested_cpus);
		logger(1, "failed to launch job ", job.id, ": ",
		       std::current_exception());
		return false;
	}

	try {
		registry.MarkStarted(job.id, node_name, pid, BatchNow());
	} catch (...) {
		logger(1, "failed to record start of job ", job.id, ": ",
		       std::current_exception());
		launcher.Terminate(pid);
		ledger.Release(node_name, job.requested_cpus);
		return false;
	}

	processes.emplace(pid, job.id);

	logger.Fmt(2, "job {} ({:?}) started as pid {}",
		   job.id, job.GetDisplayName(), pid);

	if (const auto *started = registry.Find(job.id))
		hook.Notify(*started, JobEvent::STARTED);

	return true;
}

void
BatchScheduler::RunPass() noexcept
{
	defer_pass.Cancel();

	RetryUnrecordedExits();

	if (ledger.Free(node_name) == 0) {
		force_run.clear();
		return;
	}

	std::vector<BatchJob> waiting;

	try {
		waiting = registry.List(JobState::WAITING);
	} catch (...) {
		logger(1, "scheduling pass failed: ", std::current_exception());
		return;
	}

	std::sort(waiting.begin(), waiting.end(), CompareSchedulingOrder);

	/* forced jobs go first, in request order */
	auto position = waiting.begin();
	for (const JobId id : force_run) {
		auto i = std::find_if(position, waiting.end(),
				      [id](const BatchJob &job){
					      return job.id == id;
				      });
		if (i != waiting.end()) {
			std::rotate(position, i, std::next(i));
			++position;
		}
	}

	force_run.clear();

	for (const auto &job : waiting) {
		if (ledger.Free(node_name) == 0)
			/* this node is full */
			break;

		if (!job.IsAllowedOn(node_name)) {
			if (warned_not_here.insert(job.id).second)
				logger.Fmt(1, "job {} cannot run on node {:?}",
					   job.id, node_name);
			continue;
		}

		TryStart(job);
	}
}

bool
BatchScheduler::FinishJob(JobId id, int exit_code,
			  BatchTime finished_at) noexcept
{
	const auto *job = registry.Find(id);
	if (job == nullptr)
		return true;

	const std::string node = job->node;
	const unsigned cpus = job->requested_cpus;

	try {
		if (!registry.MarkFinished(id, exit_code, finished_at))
			/* duplicate */
			return true;
	} catch (...) {
		logger(1, "failed to record exit of job ", id, ": ",
		       std::current_exception());
		return false;
	}

	ledger.Release(node, cpus);

	logger(2, "job ", id, " finished with exit code ", exit_code);

	if (const auto *finished = registry.Find(id))
		hook.Notify(*finished, exit_code == 0
			    ? JobEvent::FINISHED
			    : JobEvent::FAILED);

	if (remove_on_exit.erase(id) > 0) {
		try {
			registry.Delete(id);
			logger(2, "job ", id, " removed");
		} catch (...) {
			logger(1, "failed to remove job ", id, ": ",
			       std::current_exception());
		}
	}

	defer_pass.Schedule();
	return true;
}

void
BatchScheduler::RetryUnrecordedExits() noexcept
{
	for (auto i = unrecorded_exits.begin(); i != unrecorded_exits.end();) {
		const auto [exit_code, finished_at] = i->second;
		if (FinishJob(i->first, exit_code, finished_at))
			i = unrecorded_exits.erase(i);
		else
			++i;
	}
}

void
BatchScheduler::OnProcessExit(int pid, int exit_code) noexcept
{
	auto i = processes.find(pid);
	if (i == processes.end()) {
		logger(3, "ignoring exit of unknown process ", pid);
		return;
	}

	const JobId id = i->second;
	processes.erase(i);

	const auto now = BatchNow();
	if (!FinishJob(id, exit_code, now))
		unrecorded_exits.insert_or_assign(id,
						  std::make_pair(exit_code, now));
}

void
BatchScheduler::OnTick() noexcept
{
	RunPass();
	tick_timer.Schedule(tick);
}
