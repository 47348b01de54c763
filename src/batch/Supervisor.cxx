// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Supervisor.hxx"
#include "Job.hxx"
#include "Error.hxx"
#include "io/OwnedFd.hxx"

#include <fmt/format.h>

#include <vector>

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

int
TranslateWaitStatus(int status) noexcept
{
	if (WIFSIGNALED(status))
		return -WTERMSIG(status);

	return WEXITSTATUS(status);
}

ProcessSupervisor::ProcessSupervisor(EventLoop &event_loop,
				     const Logger &parent_logger,
				     std::string_view _node_name)
	:logger(parent_logger, "supervisor"),
	 node_name(_node_name),
	 sigchld_event(event_loop, SIGCHLD,
		       [this](int signo){ OnSigchld(signo); })
{
	sigchld_event.Enable();
}

ProcessSupervisor::~ProcessSupervisor() noexcept
{
	sigchld_event.Disable();

	for (const auto &[pid, listener] : children) {
		logger(2, "killing process group ", pid);
		kill(-pid, SIGKILL);
	}
}

/**
 * Open an output file for the job, or /dev/null if no path was
 * specified.
 *
 * Throws #BatchError (LAUNCH) on error.
 */
static OwnedFd
OpenOutput(const std::string &path)
{
	const char *p = path.empty() ? "/dev/null" : path.c_str();

	OwnedFd fd{open(p, O_WRONLY|O_CREAT|O_TRUNC|O_CLOEXEC|O_NOCTTY, 0664)};
	if (!fd.IsDefined())
		throw FmtBatchError(BatchErrorCode::LAUNCH,
				    "Failed to open {:?}: {}",
				    p, strerror(errno));

	/* the umask may have removed bits */
	if (!path.empty())
		fchmod(fd.Get(), 0664);

	return fd;
}

/**
 * Copy the current environment, replacing all BATCH_* variables.
 */
static std::vector<std::string>
MakeEnvironment(const BatchJob &job, std::string_view node_name)
{
	std::vector<std::string> env;

	for (char **i = environ; *i != nullptr; ++i)
		if (strncmp(*i, "BATCH_", 6) != 0)
			env.emplace_back(*i);

	env.emplace_back(fmt::format("BATCH_JOBID={}", job.id));
	env.emplace_back(fmt::format("BATCH_JOBNAME={}", job.GetDisplayName()));
	env.emplace_back(fmt::format("BATCH_NODE={}", node_name));
	env.emplace_back(fmt::format("BATCH_NCPUS={}", job.requested_cpus));
	return env;
}

[[noreturn]]
static void
ExitWithErrno(int error_fd) noexcept
{
	const int e = errno;
	ssize_t nbytes = write(error_fd, &e, sizeof(e));
	(void)nbytes;
	_exit(127);
}

[[noreturn]]
static void
ExecChild(const std::string &directory,
	  int stdout_fd, int stderr_fd, int error_fd,
	  char *const*argv, char *const*envp) noexcept
{
	/* the child must not inherit the daemon's signal setup */
	signal(SIGPIPE, SIG_DFL);
	signal(SIGCHLD, SIG_DFL);

	sigset_t mask;
	sigemptyset(&mask);
	sigprocmask(SIG_SETMASK, &mask, nullptr);

	setsid();

	int dev_null = open("/dev/null", O_RDONLY|O_NOCTTY);
	if (dev_null >= 0 && dev_null != STDIN_FILENO)
		dup2(dev_null, STDIN_FILENO);

	if (dup2(stdout_fd, STDOUT_FILENO) < 0 ||
	    dup2(stderr_fd, STDERR_FILENO) < 0 ||
	    chdir(directory.c_str()) < 0)
		ExitWithErrno(error_fd);

	execve(argv[0], argv, envp);
	ExitWithErrno(error_fd);
}

int
ProcessSupervisor::Launch(const BatchJob &job, ProcessExitListener &listener)
{
	const std::string directory{job.GetDirectory()};

	struct stat st;
	if (stat(directory.c_str(), &st) < 0 || !S_ISDIR(st.st_mode))
		throw FmtBatchError(BatchErrorCode::LAUNCH,
				    "Working directory {:?} does not exist",
				    directory);

	if (stat(job.filename.c_str(), &st) < 0 || !S_ISREG(st.st_mode) ||
	    access(job.filename.c_str(), X_OK) < 0)
		throw FmtBatchError(BatchErrorCode::LAUNCH,
				    "Script {:?} is not an executable file",
				    job.filename);

	auto stdout_fd = OpenOutput(job.stdout_path);
	auto stderr_fd = OpenOutput(job.stderr_path);

	int error_pipe[2];
	if (pipe2(error_pipe, O_CLOEXEC) < 0)
		throw FmtBatchError(BatchErrorCode::LAUNCH,
				    "pipe() failed: {}", strerror(errno));

	OwnedFd error_r{error_pipe[0]}, error_w{error_pipe[1]};

	/* prepare everything now; the child must not allocate */

	const auto env = MakeEnvironment(job, node_name);
	std::vector<char *> envp;
	envp.reserve(env.size() + 1);
	for (const auto &i : env)
		envp.push_back(const_cast<char *>(i.c_str()));
	envp.push_back(nullptr);

	char *const argv[] = {
		const_cast<char *>(job.filename.c_str()),
		nullptr,
	};

	/* fork */

	const pid_t pid = fork();
	if (pid < 0)
		throw FmtBatchError(BatchErrorCode::LAUNCH,
				    "fork() failed: {}", strerror(errno));

	if (pid == 0)
		ExecChild(directory, stdout_fd.Get(), stderr_fd.Get(),
			  error_w.Get(), argv, envp.data());

	error_w.Close();

	int child_errno;
	ssize_t nbytes;
	do {
		nbytes = read(error_r.Get(), &child_errno, sizeof(child_errno));
	} while (nbytes < 0 && errno == EINTR);

	if (nbytes == (ssize_t)sizeof(child_errno)) {
		/* the child reported an error and has exited */
		int status;
		while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

		throw FmtBatchError(BatchErrorCode::LAUNCH,
				    "Failed to execute {:?}: {}",
				    job.filename, strerror(child_errno));
	}

	children.emplace(pid, &listener);

	logger(2, "job ", job.id, " running as pid ", pid);
	return pid;
}

bool
ProcessSupervisor::Terminate(int pid) noexcept
{
	if (children.find(pid) == children.end())
		return false;

	logger(2, "killing process group ", pid);

	if (kill(-pid, SIGKILL) < 0 && errno != ESRCH) {
		logger(1, "kill(", pid, ") failed: ", strerror(errno));
		return false;
	}

	return true;
}

void
ProcessSupervisor::OnSigchld(int) noexcept
{
	pid_t pid;
	int status;

	while ((pid = waitpid(-1, &status, WNOHANG)) > 0) {
		auto i = children.find(pid);
		if (i == children.end()) {
			logger(3, "ignoring unknown child process ", pid);
			continue;
		}

		auto &listener = *i->second;
		children.erase(i);

		if (WIFSIGNALED(status))
			logger(1, "pid ", pid, " died from signal ",
			       WTERMSIG(status),
			       WCOREDUMP(status) ? " (core dumped)" : "");
		else if (WEXITSTATUS(status) == 0)
			logger(3, "pid ", pid, " exited with success");
		else
			logger(2, "pid ", pid, " exited with status ",
			       WEXITSTATUS(status));

		listener.OnProcessExit(pid, TranslateWaitStatus(status));
	}
}
