// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Config.hxx"
#include "Logger.hxx"
#include "event/EventLoop.hxx"
#include "event/SignalEvent.hxx"
#include "batch/Supervisor.hxx"
#include "batch/CurlNotifier.hxx"
#include "batch/Scheduler.hxx"
#include "rpc/Handler.hxx"

#include <memory>

#include <stdint.h>

class JobStore;
class RpcServer;

class Instance final : RpcHandler {
	const RootLogger logger;

	EventLoop event_loop;

	SignalEvent sigterm_event, sigint_event, sighup_event;

	/**
	 * The current configuration, including changes made with
	 * "set_config".
	 */
	Config config;

	std::unique_ptr<JobStore> store;

	ProcessSupervisor supervisor;

	CurlNotifier notifier;

	BatchScheduler scheduler;

	std::unique_ptr<RpcServer> rpc_server;

	bool should_exit = false;

public:
	/**
	 * Throws on error.
	 */
	explicit Instance(const Config &config);

	~Instance() noexcept;

	EventLoop &GetEventLoop() noexcept {
		return event_loop;
	}

	/**
	 * @return the port the RPC server is listening on
	 */
	uint16_t GetPort() const;

	void Start();

	void Run() noexcept {
		event_loop.Run();
	}

private:
	/**
	 * Pass runtime settings from #config to the scheduler and
	 * the notifier.
	 */
	void ApplyConfig();

	void OnExit(int) noexcept;
	void OnReload(int) noexcept;

	/* virtual methods from class RpcHandler */
	JobId OnSubmit(const JobSubmission &submission) override;
	void OnRemove(JobId id) override;
	void OnRun(JobId id) override;
	std::vector<BatchJob> OnListRunning() override;
	std::vector<BatchJob> OnListWaiting() override;
	std::vector<BatchJob> OnListFinished(std::size_t limit) override;
	std::pair<unsigned, unsigned> OnGetCpus() override;
	RpcConfigList OnGetConfig() override;
	void OnSetConfig(std::string_view key,
			 std::string_view value) override;
};
