// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "rpc/Client.hxx"
#include "rpc/Socket.hxx"
#include "batch/Job.hxx"
#include "Exception.hxx"

#include <fmt/core.h>
#include <fmt/chrono.h>

#include <span>
#include <string_view>

#include <pwd.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

struct Usage {
	const char *msg = nullptr;
};

static unsigned long
ParseNumber(const char *s, const char *what)
{
	char *endptr;
	const unsigned long value = strtoul(s, &endptr, 10);
	if (endptr == s || *endptr != 0 || *s == '-')
		throw Usage{what};

	return value;
}

static JobId
ParseJobId(std::span<const char *const> args)
{
	if (args.empty())
		throw Usage{"Job id missing"};

	if (args.size() > 1)
		throw Usage{"Too many arguments"};

	return ParseNumber(args.front(), "Malformed job id");
}

static std::string
MakeAbsolute(const char *path)
{
	if (*path == '/')
		return path;

	char cwd[4096];
	if (getcwd(cwd, sizeof(cwd)) == nullptr)
		throw MakeErrno("getcwd() failed");

	return fmt::format("{}/{}", cwd, path);
}

static void
Submit(const RpcAddress &server, std::span<const char *const> args)
{
	JobSubmission s;
	s.requested_cpus = 1;

	while (!args.empty() && args.front()[0] == '-') {
		const char *const arg = args.front();
		args = args.subspan(1);

		const char *eq = strchr(arg, '=');
		if (eq == nullptr)
			throw Usage{"Option value missing"};

		const std::string_view name{arg, eq};
		const char *value = eq + 1;

		if (name == "--name")
			s.name = value;
		else if (name == "--cpus")
			s.requested_cpus = ParseNumber(value, "Malformed CPU count");
		else if (name == "--priority")
			s.priority = atoi(value);
		else if (name == "--stdout")
			s.stdout_path = value;
		else if (name == "--stderr")
			s.stderr_path = value;
		else if (name == "--node")
			s.nodes.emplace_back(value);
		else if (name == "--mail-to")
			s.mail_to = value;
		else if (name == "--mail-events")
			s.mail_events = value;
		else
			throw Usage{"Unknown submit option"};
	}

	if (args.empty())
		throw Usage{"Script missing"};

	if (args.size() > 1)
		throw Usage{"Too many arguments"};

	s.script = MakeAbsolute(args.front());

	s.uid = getuid();
	if (const auto *pw = getpwuid(s.uid))
		s.username = pw->pw_name;

	RpcClient client{server};
	const JobId id = client.Submit(s);
	fmt::print("{}\n", id);
}

static void
Remove(const RpcAddress &server, std::span<const char *const> args)
{
	const JobId id = ParseJobId(args);

	RpcClient client{server};
	client.Remove(id);
}

static void
Run(const RpcAddress &server, std::span<const char *const> args)
{
	const JobId id = ParseJobId(args);

	RpcClient client{server};
	client.Run(id);
}

static void
PrintTime(const char *label, BatchTime t)
{
	if (IsSet(t))
		fmt::print(" {}={:%FT%TZ}", label,
			   fmt::gmtime(std::chrono::system_clock::to_time_t(t)));
}

static void
PrintJobs(const std::vector<BatchJob> &jobs)
{
	for (const auto &job : jobs) {
		fmt::print("{}\t{}\t{}\tcpus={} priority={}",
			   job.id, ToString(job.GetState()),
			   job.GetDisplayName(),
			   job.requested_cpus, job.priority);

		if (!job.username.empty())
			fmt::print(" user={}", job.username);

		if (!job.node.empty())
			fmt::print(" node={}", job.node);

		if (job.pid > 0)
			fmt::print(" pid={}", job.pid);

		PrintTime("submitted", job.submitted_at);
		PrintTime("started", job.started_at);
		PrintTime("finished", job.finished_at);

		if (job.GetState() == JobState::DONE)
			fmt::print(" exit={}", job.exit_code);

		fmt::print("\n");
	}
}

static void
List(const RpcAddress &server, std::span<const char *const> args)
{
	std::string_view which = "waiting";
	if (!args.empty()) {
		which = args.front();
		args = args.subspan(1);
	}

	RpcClient client{server};

	if (which == "waiting") {
		if (!args.empty())
			throw Usage{"Too many arguments"};

		PrintJobs(client.ListWaiting());
	} else if (which == "running") {
		if (!args.empty())
			throw Usage{"Too many arguments"};

		PrintJobs(client.ListRunning());
	} else if (which == "finished") {
		std::size_t limit = 0;
		if (!args.empty()) {
			limit = ParseNumber(args.front(), "Malformed limit");
			args = args.subspan(1);
		}

		if (!args.empty())
			throw Usage{"Too many arguments"};

		PrintJobs(client.ListFinished(limit));
	} else
		throw Usage{"Unknown job list"};
}

static void
Cpus(const RpcAddress &server, std::span<const char *const> args)
{
	if (!args.empty())
		throw Usage{"Too many arguments"};

	RpcClient client{server};
	const auto [used, total] = client.GetCpus();
	fmt::print("{}/{}\n", used, total);
}

static void
Configure(const RpcAddress &server, std::span<const char *const> args)
{
	RpcClient client{server};

	if (args.empty()) {
		for (const auto &[key, value] : client.GetConfig())
			fmt::print("{} {:?}\n", key, value);
	} else if (args.size() == 2) {
		client.SetConfig(args[0], args[1]);
	} else
		throw Usage{"KEY VALUE expected"};
}

int
main(int argc, char **argv)
try {
	std::span<const char *const> args{argv + 1, static_cast<std::size_t>(argc - 1)};

	const char *server = "localhost";

	while (!args.empty() && args.front()[0] == '-') {
		const char *const option = args.front();
		args = args.subspan(1);
		if (strncmp(option, "--server=", 9) == 0) {
			server = option + 9;
		} else
			throw Usage{"Unknown option"};
	}

	if (args.empty())
		throw Usage();

	const std::string_view command = args.front();
	args = args.subspan(1);

	const auto address = ParseRpcAddress(server, BATCH_RPC_DEFAULT_PORT);

	if (command == "submit")
		Submit(address, args);
	else if (command == "remove")
		Remove(address, args);
	else if (command == "run")
		Run(address, args);
	else if (command == "list")
		List(address, args);
	else if (command == "cpus")
		Cpus(address, args);
	else if (command == "config")
		Configure(address, args);
	else
		throw Usage{"Unknown command"};

	return EXIT_SUCCESS;
} catch (const Usage &u) {
	if (u.msg)
		fmt::print(stderr, "{}\n\n", u.msg);

	fmt::print(stderr, "Usage: {} [--server=SERVER[:PORT]] COMMAND ...\n"
		   "\n"
		   "Commands:\n"
		   "  submit [--name=NAME] [--cpus=N] [--priority=N]\n"
		   "         [--stdout=PATH] [--stderr=PATH] [--node=NODE]...\n"
		   "         [--mail-to=ADDRESS] [--mail-events=bea] SCRIPT\n"
		   "  remove JOBID\n"
		   "  run JOBID\n"
		   "  list [waiting|running|finished [LIMIT]]\n"
		   "  cpus\n"
		   "  config [KEY VALUE]\n",
		   argv[0]);
	return EXIT_FAILURE;
} catch (const RpcError &e) {
	fmt::print(stderr, "Error: {}\n", e.what());
	return EXIT_FAILURE;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
