// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct Config {
	/**
	 * The RPC listener address, see ParseRpcAddress().
	 */
	std::string listen = "*";

	/**
	 * The libpq connect string.  If empty, jobs are kept in
	 * memory only.
	 */
	std::string database;

	std::string database_schema;

	std::chrono::seconds tick{10};

	/**
	 * The default number of jobs returned by "list_finished".
	 */
	unsigned finished_limit = 5;

	/* the following settings can be changed at runtime with
	   "set_config" */

	std::string node_name;

	unsigned ncpus = 4;

	/**
	 * Relative script paths are resolved against this directory.
	 */
	std::string root = "/";

	int default_priority = 0;

	std::string mail_sender;
	std::string smtp_server;

	std::string slack_token;
	std::string slack_channel;

	/**
	 * Throws on error.
	 */
	void Check();

	/**
	 * Return the settings reported by "get_config".
	 */
	std::vector<std::pair<std::string, std::string>> GetRuntimeList() const;

	/**
	 * Change a setting at runtime.
	 *
	 * Throws #BatchError (CONFIG) if the key is unknown or
	 * read-only or if the value is malformed; in that case, the
	 * object is unchanged.
	 */
	void SetRuntime(std::string_view key, std::string_view value);
};

/**
 * Load and parse the specified configuration file.  Throws an
 * exception on error.
 */
void
LoadConfigFile(Config &config, const char *path);
