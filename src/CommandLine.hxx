// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

struct CommandLine {
	const char *config_path = "/etc/cm4all/batch/batch.conf";

	/**
	 * Overrides the "listen" setting of the configuration file.
	 */
	const char *listen = nullptr;

	/**
	 * Only load and check the configuration, then exit.
	 */
	bool check = false;
};

/**
 * Parse the command line.  Exits the process on "--help",
 * "--version" and on usage errors.
 */
CommandLine
ParseCommandLine(int argc, char **argv);
