// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Job.hxx"
#include "Registry.hxx"
#include "Ledger.hxx"
#include "Launcher.hxx"
#include "Logger.hxx"
#include "event/TimerEvent.hxx"

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

class EventLoop;
class JobStore;
class NotificationHook;

/**
 * The single scheduling context: it owns the #JobRegistry and the
 * #ResourceLedger, and it starts Waiting jobs whenever something
 * changes and on a periodic tick.
 */
class BatchScheduler final : ProcessExitListener {
	const ChildLogger logger;

	JobRegistry registry;
	ResourceLedger ledger;

	ProcessLauncher &launcher;
	NotificationHook &hook;

	/**
	 * The name of the local node.
	 */
	const std::string node_name;

	SubmissionDefaults defaults;

	/**
	 * Maps process ids to the jobs they belong to.
	 */
	std::map<int, JobId> processes;

	/**
	 * Running jobs which will be deleted after their process has
	 * exited.
	 */
	std::set<JobId> remove_on_exit;

	/**
	 * Jobs which cannot run on this node; a warning has already
	 * been logged for them.
	 */
	std::set<JobId> warned_not_here;

	/**
	 * Exits which could not be recorded because the store
	 * failed; retried on each pass.
	 */
	std::map<JobId, std::pair<int, BatchTime>> unrecorded_exits;

	/**
	 * Jobs which shall be scheduled first in the next pass, in
	 * request order.
	 */
	std::vector<JobId> force_run;

	DeferEvent defer_pass;

	TimerEvent tick_timer;
	const TimerEvent::Duration tick;

public:
	BatchScheduler(EventLoop &event_loop, const Logger &parent_logger,
		       JobStore &store, ProcessLauncher &_launcher,
		       NotificationHook &_hook,
		       std::string_view _node_name, unsigned ncpus,
		       TimerEvent::Duration _tick);

	BatchScheduler(const BatchScheduler &) = delete;
	BatchScheduler &operator=(const BatchScheduler &) = delete;

	const std::string &GetNodeName() const noexcept {
		return node_name;
	}

	const JobRegistry &GetRegistry() const noexcept {
		return registry;
	}

	const ResourceLedger &GetLedger() const noexcept {
		return ledger;
	}

	/**
	 * Load all jobs from the store, finish jobs which were
	 * running on this node when the previous daemon instance
	 * exited, and run the first pass.
	 *
	 * Throws on error.
	 */
	void Start();

	void SetDefaults(SubmissionDefaults &&_defaults) noexcept {
		defaults = std::move(_defaults);
	}

	const SubmissionDefaults &GetDefaults() const noexcept {
		return defaults;
	}

	/**
	 * Change the number of CPUs of the local node and run a pass.
	 *
	 * Throws #BatchError (CONFIG) if fewer CPUs than currently
	 * committed are requested; nothing is changed then.
	 */
	void SetCapacity(unsigned ncpus);

	/**
	 * @return the number of committed and the total number of
	 * CPUs of the local node
	 */
	[[gnu::pure]]
	std::pair<unsigned, unsigned> GetCpus() const noexcept {
		return {ledger.Committed(node_name), ledger.Capacity(node_name)};
	}

	/**
	 * Create a new job and run a pass.
	 *
	 * Throws #BatchError on error.
	 */
	JobId Submit(const JobSubmission &submission);

	/**
	 * Delete a job.  A Running job is killed first and its record
	 * is deleted after the exit has been processed.
	 *
	 * Throws #BatchError on error.
	 */
	void Remove(JobId id);

	/**
	 * Give a Waiting job the highest precedence and run a pass.
	 * Jobs in other states are ignored.
	 *
	 * Throws #BatchError (NOT_FOUND).
	 */
	void Run(JobId id);

	std::vector<BatchJob> ListWaiting() const {
		return registry.List(JobState::WAITING);
	}

	std::vector<BatchJob> ListRunning() const {
		return registry.List(JobState::RUNNING);
	}

	std::vector<BatchJob> ListFinished(std::size_t limit) const {
		return registry.List(JobState::DONE, limit);
	}

	/**
	 * Schedule a pass from inside the event loop.
	 */
	void SchedulePass() noexcept {
		defer_pass.Schedule();
	}

	/**
	 * Start as many Waiting jobs as possible.
	 */
	void RunPass() noexcept;

	/* virtual methods from class ProcessExitListener */
	void OnProcessExit(int pid, int exit_code) noexcept override;

private:
	/**
	 * @return true if the job was started
	 */
	bool TryStart(const BatchJob &job) noexcept;

	/**
	 * Record the exit of a job, release its CPUs and notify.
	 *
	 * @return false if the store failed
	 */
	bool FinishJob(JobId id, int exit_code, BatchTime finished_at) noexcept;

	void RecoverLostJobs() noexcept;
	void RetryUnrecordedExits() noexcept;

	void OnTick() noexcept;
};
