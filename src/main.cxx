// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Instance.hxx"
#include "CommandLine.hxx"
#include "Config.hxx"
#include "Exception.hxx"

#ifdef HAVE_LIBSYSTEMD
#include <systemd/sd-daemon.h>
#endif

#include <stdlib.h>
#include <signal.h>

static void
SetupProcess() noexcept
{
	/* peers may disconnect at any time */
	signal(SIGPIPE, SIG_IGN);
}

static void
Run(const Config &config)
{
	SetupProcess();

	Instance instance{config};

	instance.Start();

#ifdef HAVE_LIBSYSTEMD
	/* tell systemd we're ready */
	sd_notify(0, "READY=1");
#endif

	/* main loop */

	instance.Run();
}

int
main(int argc, char **argv)
try {
	Config config;

	/* configuration */

	const auto cmdline = ParseCommandLine(argc, argv);
	LoadConfigFile(config, cmdline.config_path);

	if (cmdline.listen != nullptr)
		config.listen = cmdline.listen;

	config.Check();

	if (cmdline.check)
		return EXIT_SUCCESS;

	/* set up */

	Run(config);

	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
