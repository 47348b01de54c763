// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Launcher.hxx"
#include "Logger.hxx"
#include "event/SignalEvent.hxx"

#include <map>
#include <string>
#include <string_view>

class EventLoop;

/**
 * Forks job processes and reaps them when SIGCHLD arrives.
 */
class ProcessSupervisor final : public ProcessLauncher {
	const ChildLogger logger;

	/**
	 * The value of the BATCH_NODE environment variable.
	 */
	const std::string node_name;

	SignalEvent sigchld_event;

	std::map<int, ProcessExitListener *> children;

public:
	/**
	 * Throws on error.
	 */
	ProcessSupervisor(EventLoop &event_loop, const Logger &parent_logger,
			  std::string_view _node_name);

	/**
	 * Kills all remaining process groups.
	 */
	~ProcessSupervisor() noexcept override;

	std::size_t GetChildCount() const noexcept {
		return children.size();
	}

	/* virtual methods from class ProcessLauncher */
	int Launch(const BatchJob &job,
		   ProcessExitListener &listener) override;
	bool Terminate(int pid) noexcept override;

private:
	void OnSigchld(int signo) noexcept;
};

/**
 * Translate a waitpid() status to an exit code: the exit status, or
 * the negated signal number.
 */
[[gnu::const]]
int
TranslateWaitStatus(int status) noexcept;
