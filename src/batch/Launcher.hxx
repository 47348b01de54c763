// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

struct BatchJob;

class ProcessExitListener {
public:
	/**
	 * @param exit_code the exit status, or the negated signal
	 * number if the process was killed by a signal
	 */
	virtual void OnProcessExit(int pid, int exit_code) noexcept = 0;
};

/**
 * Launches job processes and watches them.
 */
class ProcessLauncher {
public:
	virtual ~ProcessLauncher() noexcept = default;

	/**
	 * Start the job's script.  The listener will be invoked
	 * exactly once when the process exits.
	 *
	 * Throws #BatchError (LAUNCH) on error.
	 *
	 * @return the process id, which is also the id of its
	 * process group
	 */
	virtual int Launch(const BatchJob &job,
			   ProcessExitListener &listener) = 0;

	/**
	 * Kill the process group with SIGKILL.  The exit will be
	 * reported to the listener as usual.
	 *
	 * @return false if no such process is known
	 */
	virtual bool Terminate(int pid) noexcept = 0;
};
