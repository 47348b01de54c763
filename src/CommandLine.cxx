// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "Logger.hxx"
#include "version.h"

#include <fmt/core.h>

#include <stdio.h>
#include <stdlib.h>
#include <getopt.h>

#include <utility>

static constexpr struct option long_options[] = {
	{"help", no_argument, nullptr, 'h'},
	{"version", no_argument, nullptr, 'V'},
	{"verbose", no_argument, nullptr, 'v'},
	{"quiet", no_argument, nullptr, 'q'},
	{"config", required_argument, nullptr, 'c'},
	{"listen", required_argument, nullptr, 'l'},
	{"check", no_argument, nullptr, 'C'},
	{nullptr, 0, nullptr, 0}
};

static constexpr char short_options[] = "hVvqc:l:";

static void
PrintUsage(const char *argv0) noexcept
{
	fmt::print("usage: {} [options]\n\n"
		   "valid options:\n"
		   " -h, --help           help (this text)\n"
		   " -V, --version        show " PACKAGE " version\n"
		   " -v, --verbose        be more verbose\n"
		   " -q, --quiet          be quiet\n"
		   " -c, --config FILE    load this configuration file\n"
		   " -l, --listen ADDRESS listen on this address (HOST[:PORT])\n"
		   "     --check          check the configuration and exit\n"
		   "\n",
		   argv0);
}

template<typename... Args>
[[noreturn]]
static void
ArgError(const char *argv0, fmt::format_string<Args...> format_str,
	 Args&&... args) noexcept
{
	fmt::print(stderr, "{}: ", argv0);
	fmt::print(stderr, format_str, std::forward<Args>(args)...);
	fmt::print(stderr, "\nTry '{} --help' for more information.\n",
		   argv0);
	exit(EXIT_FAILURE);
}

CommandLine
ParseCommandLine(int argc, char **argv)
{
	CommandLine cmdline;
	unsigned log_level = 1;

	int option;
	while ((option = getopt_long(argc, argv, short_options,
				     long_options, nullptr)) != -1) {
		switch (option) {
		case 'h':
			PrintUsage(argv[0]);
			exit(EXIT_SUCCESS);

		case 'V':
			fmt::print(PACKAGE " v" VERSION "\n");
			exit(EXIT_SUCCESS);

		case 'v':
			++log_level;
			break;

		case 'q':
			log_level = 0;
			break;

		case 'c':
			cmdline.config_path = optarg;
			break;

		case 'l':
			cmdline.listen = optarg;
			break;

		case 'C':
			cmdline.check = true;
			break;

		default:
			/* getopt_long() has already printed a message */
			fmt::print(stderr, "Try '{} --help' for more information.\n",
				   argv[0]);
			exit(EXIT_FAILURE);
		}
	}

	if (optind < argc)
		ArgError(argv[0], "unrecognized argument: {}", argv[optind]);

	SetLogLevel(log_level);

	return cmdline;
}
