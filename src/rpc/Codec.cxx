// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Codec.hxx"
#include "Builder.hxx"
#include "batch/Job.hxx"

static void
AddOptionalString(RpcBuilder &b, BatchRpcCommand command,
		  const std::string &value)
{
	if (!value.empty())
		b.Add(command, value);
}

static void
AddTime(RpcBuilder &b, BatchRpcCommand command, BatchTime t)
{
	if (IsSet(t))
		b.AddI64(command, t.time_since_epoch().count());
}

static BatchTime
GetTime(const RpcPacket &packet)
{
	const int64_t value = packet.GetI64();
	if (value == 0)
		throw RpcProtocolError("Invalid timestamp");

	return BatchTime{std::chrono::microseconds{value}};
}

void
EncodeSubmission(RpcBuilder &b, const JobSubmission &s)
{
	AddOptionalString(b, BatchRpcCommand::NAME, s.name);
	b.Add(BatchRpcCommand::SCRIPT, s.script);
	b.AddU32(BatchRpcCommand::CPUS, s.requested_cpus);

	if (s.priority)
		b.AddI32(BatchRpcCommand::PRIORITY, *s.priority);

	AddOptionalString(b, BatchRpcCommand::STDOUT, s.stdout_path);
	AddOptionalString(b, BatchRpcCommand::STDERR, s.stderr_path);

	for (const auto &node : s.nodes)
		b.Add(BatchRpcCommand::NODE, node);

	AddOptionalString(b, BatchRpcCommand::USERNAME, s.username);
	if (s.uid != 0)
		b.AddU32(BatchRpcCommand::UID, s.uid);

	AddOptionalString(b, BatchRpcCommand::MAIL_TO, s.mail_to);
	AddOptionalString(b, BatchRpcCommand::MAIL_EVENTS, s.mail_events);
}

JobSubmission
DecodeSubmission(std::span<const RpcPacket> packets)
{
	JobSubmission s;

	for (const auto &p : packets) {
		switch (p.command) {
		case BatchRpcCommand::NAME:
			s.name = p.GetString();
			break;

		case BatchRpcCommand::SCRIPT:
			s.script = p.GetString();
			break;

		case BatchRpcCommand::CPUS:
			s.requested_cpus = p.GetU32();
			break;

		case BatchRpcCommand::PRIORITY:
			s.priority = p.GetI32();
			break;

		case BatchRpcCommand::STDOUT:
			s.stdout_path = p.GetString();
			break;

		case BatchRpcCommand::STDERR:
			s.stderr_path = p.GetString();
			break;

		case BatchRpcCommand::NODE:
			s.nodes.emplace_back(p.GetString());
			break;

		case BatchRpcCommand::USERNAME:
			s.username = p.GetString();
			break;

		case BatchRpcCommand::UID:
			s.uid = p.GetU32();
			break;

		case BatchRpcCommand::MAIL_TO:
			s.mail_to = p.GetString();
			break;

		case BatchRpcCommand::MAIL_EVENTS:
			s.mail_events = p.GetString();
			break;

		default:
			throw RpcProtocolError("Unexpected packet in submission");
		}
	}

	return s;
}

void
EncodeJob(RpcBuilder &b, const BatchJob &job)
{
	b.AddU64(BatchRpcCommand::JOB_ID, job.id);
	AddOptionalString(b, BatchRpcCommand::NAME, job.name);
	b.Add(BatchRpcCommand::SCRIPT, job.filename);
	b.AddU32(BatchRpcCommand::CPUS, job.requested_cpus);
	b.AddI32(BatchRpcCommand::PRIORITY, job.priority);
	AddOptionalString(b, BatchRpcCommand::STDOUT, job.stdout_path);
	AddOptionalString(b, BatchRpcCommand::STDERR, job.stderr_path);

	for (const auto &node : job.allowed_nodes)
		b.Add(BatchRpcCommand::NODE, node);

	AddOptionalString(b, BatchRpcCommand::USERNAME, job.username);
	b.AddU32(BatchRpcCommand::UID, job.owner_uid);
	AddOptionalString(b, BatchRpcCommand::MAIL_TO, job.mail_to);
	AddOptionalString(b, BatchRpcCommand::MAIL_EVENTS, job.mail_events);

	AddTime(b, BatchRpcCommand::SUBMITTED, job.submitted_at);
	AddTime(b, BatchRpcCommand::STARTED, job.started_at);
	AddTime(b, BatchRpcCommand::FINISHED, job.finished_at);

	if (IsSet(job.finished_at))
		b.AddI32(BatchRpcCommand::EXIT_CODE, job.exit_code);

	AddOptionalString(b, BatchRpcCommand::RUNNING_NODE, job.node);

	if (job.pid > 0)
		b.AddI32(BatchRpcCommand::PID, job.pid);
}

std::vector<BatchJob>
DecodeJobs(std::span<const RpcPacket> packets)
{
	std::vector<BatchJob> jobs;

	for (const auto &p : packets) {
		if (p.command == BatchRpcCommand::JOB_ID) {
			jobs.emplace_back().id = p.GetU64();
			continue;
		}

		if (jobs.empty())
			throw RpcProtocolError("Job attribute without JOB_ID");

		auto &job = jobs.back();

		switch (p.command) {
		case BatchRpcCommand::NAME:
			job.name = p.GetString();
			break;

		case BatchRpcCommand::SCRIPT:
			job.filename = p.GetString();
			break;

		case BatchRpcCommand::CPUS:
			job.requested_cpus = p.GetU32();
			break;

		case BatchRpcCommand::PRIORITY:
			job.priority = p.GetI32();
			break;

		case BatchRpcCommand::STDOUT:
			job.stdout_path = p.GetString();
			break;

		case BatchRpcCommand::STDERR:
			job.stderr_path = p.GetString();
			break;

		case BatchRpcCommand::NODE:
			job.allowed_nodes.emplace_back(p.GetString());
			break;

		case BatchRpcCommand::USERNAME:
			job.username = p.GetString();
			break;

		case BatchRpcCommand::UID:
			job.owner_uid = p.GetU32();
			break;

		case BatchRpcCommand::MAIL_TO:
			job.mail_to = p.GetString();
			break;

		case BatchRpcCommand::MAIL_EVENTS:
			job.mail_events = p.GetString();
			break;

		case BatchRpcCommand::SUBMITTED:
			job.submitted_at = GetTime(p);
			break;

		case BatchRpcCommand::STARTED:
			job.started_at = GetTime(p);
			break;

		case BatchRpcCommand::FINISHED:
			job.finished_at = GetTime(p);
			break;

		case BatchRpcCommand::EXIT_CODE:
			job.exit_code = p.GetI32();
			break;

		case BatchRpcCommand::RUNNING_NODE:
			job.node = p.GetString();
			break;

		case BatchRpcCommand::PID:
			job.pid = p.GetI32();
			break;

		default:
			throw RpcProtocolError("Unexpected packet in job record");
		}
	}

	return jobs;
}

void
EncodeConfig(RpcBuilder &b, const RpcConfigList &config)
{
	for (const auto &[key, value] : config) {
		b.Add(BatchRpcCommand::KEY, key);
		b.Add(BatchRpcCommand::VALUE, value);
	}
}

RpcConfigList
DecodeConfig(std::span<const RpcPacket> packets)
{
	RpcConfigList config;

	for (auto i = packets.begin(); i != packets.end(); ++i) {
		if (i->command != BatchRpcCommand::KEY)
			throw RpcProtocolError("KEY expected");

		const auto value = std::next(i);
		if (value == packets.end() ||
		    value->command != BatchRpcCommand::VALUE)
			throw RpcProtocolError("VALUE expected");

		config.emplace_back(i->GetString(), value->GetString());
		i = value;
	}

	return config;
}
