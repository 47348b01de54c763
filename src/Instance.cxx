// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Instance.hxx"
#include "batch/MemoryJobStore.hxx"
#include "batch/PgJobStore.hxx"
#include "rpc/Server.hxx"
#include "rpc/Socket.hxx"
#include "Exception.hxx"

#include <signal.h>

static std::unique_ptr<JobStore>
MakeJobStore(const Config &config, const Logger &logger)
{
	if (config.database.empty()) {
		logger(1, "no database configured, jobs will be lost on exit");
		return std::make_unique<MemoryJobStore>();
	}

	return std::make_unique<PgJobStore>(config.database.c_str(),
					    config.database_schema.c_str());
}

static OwnedFd
OpenListener(const Config &config)
try {
	return OpenRpcListener(ParseRpcAddress(config.listen.c_str(),
					       BATCH_RPC_DEFAULT_PORT));
} catch (...) {
	std::throw_with_nested(FmtRuntimeError("Failed to listen on {:?}",
					       config.listen));
}

Instance::Instance(const Config &_config)
	:sigterm_event(event_loop, SIGTERM,
		       [this](int signo){ OnExit(signo); }),
	 sigint_event(event_loop, SIGINT,
		      [this](int signo){ OnExit(signo); }),
	 sighup_event(event_loop, SIGHUP,
		      [this](int signo){ OnReload(signo); }),
	 config(_config),
	 store(MakeJobStore(config, logger)),
	 supervisor(event_loop, logger, config.node_name),
	 notifier(event_loop, logger),
	 scheduler(event_loop, logger, *store, supervisor, notifier,
		   config.node_name, config.ncpus, config.tick)
{
	sigterm_event.Enable();
	sigint_event.Enable();
	sighup_event.Enable();

	ApplyConfig();

	RpcHandler &handler = *this;
	rpc_server = std::make_unique<RpcServer>(event_loop, logger,
						 OpenListener(config),
						 handler);
}

Instance::~Instance() noexcept = default;

uint16_t
Instance::GetPort() const
{
	return rpc_server->GetPort();
}

void
Instance::Start()
{
	scheduler.Start();

	logger.Fmt(1, "node {:?} with {} CPUs, listening on port {}",
		   config.node_name, config.ncpus, rpc_server->GetPort());
}

void
Instance::ApplyConfig()
{
	scheduler.SetDefaults({
		.root = config.root,
		.priority = config.default_priority,
	});

	notifier.SetConfig({
		.mail_sender = config.mail_sender,
		.smtp_server = config.smtp_server,
		.slack_token = config.slack_token,
		.slack_channel = config.slack_channel,
	});

	if (config.ncpus != scheduler.GetCpus().second)
		scheduler.SetCapacity(config.ncpus);
}

void
Instance::OnExit(int) noexcept
{
	if (should_exit)
		return;

	should_exit = true;

	logger(1, "shutting down");

	sigterm_event.Disable();
	sigint_event.Disable();
	sighup_event.Disable();

	rpc_server.reset();

	event_loop.Break();
}

void
Instance::OnReload(int) noexcept
{
	logger(4, "reloading");

	scheduler.SchedulePass();
}

JobId
Instance::OnSubmit(const JobSubmission &submission)
{
	return scheduler.Submit(submission);
}

void
Instance::OnRemove(JobId id)
{
	scheduler.Remove(id);
}

void
Instance::OnRun(JobId id)
{
	scheduler.Run(id);
}

std::vector<BatchJob>
Instance::OnListRunning()
{
	return scheduler.ListRunning();
}

std::vector<BatchJob>
Instance::OnListWaiting()
{
	return scheduler.ListWaiting();
}

std::vector<BatchJob>
Instance::OnListFinished(std::size_t limit)
{
	if (limit == 0)
		limit = config.finished_limit;

	return scheduler.ListFinished(limit);
}

std::pair<unsigned, unsigned>
Instance::OnGetCpus()
{
	return scheduler.GetCpus();
}

RpcConfigList
Instance::OnGetConfig()
{
	return config.GetRuntimeList();
}

void
Instance::OnSetConfig(std::string_view key, std::string_view value)
{
	Config new_config = config;
	new_config.SetRuntime(key, value);

	if (new_config.ncpus != config.ncpus)
		/* throws if running jobs would not fit anymore */
		scheduler.SetCapacity(new_config.ncpus);

	config = std::move(new_config);

	logger.Fmt(2, "set {:?} = {:?}", key,
		   key == "slack_token" ? std::string_view{"***"} : value);

	ApplyConfig();
}
