// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "batch/Error.hxx"
#include "io/TextFile.hxx"
#include "io/LineParser.hxx"
#include "Exception.hxx"

#include <climits>

#include <stdlib.h>
#include <string.h>
#include <unistd.h> // for gethostname()

static unsigned
ParsePositive(const char *s, unsigned max)
{
	char *endptr;
	const unsigned long value = strtoul(s, &endptr, 10);
	if (endptr == s || *endptr != 0 || *s == '-')
		throw std::invalid_argument("Not a number");

	if (value == 0)
		throw std::invalid_argument("Number must be positive");

	if (value > max)
		throw std::invalid_argument("Number is too large");

	return value;
}

static int
ParseInt(const char *s)
{
	char *endptr;
	const long value = strtol(s, &endptr, 10);
	if (endptr == s || *endptr != 0)
		throw std::invalid_argument("Not a number");

	if (value < INT_MIN || value > INT_MAX)
		throw std::invalid_argument("Number is out of range");

	return value;
}

static const char *
CheckRoot(const char *s)
{
	if (*s != '/')
		throw std::invalid_argument("Absolute path expected");

	return s;
}

void
Config::Check()
{
	if (node_name.empty()) {
		char name[256];
		if (gethostname(name, sizeof(name)) < 0)
			throw MakeErrno("gethostname() failed");

		node_name = name;
	}

	if (ncpus == 0)
		throw std::runtime_error("'ncpus' must be positive");

	if (root.empty() || root.front() != '/')
		throw std::runtime_error("'root' must be an absolute path");

	if (tick.count() <= 0)
		throw std::runtime_error("'tick' must be positive");

	if (!slack_token.empty() && slack_channel.empty())
		throw std::runtime_error("'slack_token' without 'slack_channel'");
}

std::vector<std::pair<std::string, std::string>>
Config::GetRuntimeList() const
{
	return {
		{"nodename", node_name},
		{"ncpus", std::to_string(ncpus)},
		{"root", root},
		{"default_priority", std::to_string(default_priority)},
		{"mail_sender", mail_sender},
		{"smtp_server", smtp_server},
		/* don't reveal the secret */
		{"slack_token", slack_token.empty() ? std::string{} : "***"},
		{"slack_channel", slack_channel},
	};
}

/**
 * Apply one runtime setting; throws std::invalid_argument if the
 * value is malformed.
 *
 * @return false if the key is not known
 */
static bool
ApplyRuntime(Config &config, const char *key, const char *value)
{
	if (strcmp(key, "ncpus") == 0)
		config.ncpus = ParsePositive(value, 65536);
	else if (strcmp(key, "root") == 0)
		config.root = CheckRoot(value);
	else if (strcmp(key, "default_priority") == 0)
		config.default_priority = ParseInt(value);
	else if (strcmp(key, "mail_sender") == 0)
		config.mail_sender = value;
	else if (strcmp(key, "smtp_server") == 0)
		config.smtp_server = value;
	else if (strcmp(key, "slack_token") == 0)
		config.slack_token = value;
	else if (strcmp(key, "slack_channel") == 0)
		config.slack_channel = value;
	else
		return false;

	return true;
}

void
Config::SetRuntime(std::string_view key, std::string_view value)
{
	const std::string key_s{key}, value_s{value};

	if (key == "nodename")
		throw FmtBatchError(BatchErrorCode::CONFIG,
				    "Setting {:?} is read-only", key);

	Config copy = *this;

	try {
		if (!ApplyRuntime(copy, key_s.c_str(), value_s.c_str()))
			throw FmtBatchError(BatchErrorCode::CONFIG,
					    "Unknown setting {:?}", key);
	} catch (const std::invalid_argument &e) {
		throw FmtBatchError(BatchErrorCode::CONFIG,
				    "Bad value {:?} for {:?}: {}",
				    value, key, e.what());
	}

	*this = std::move(copy);
}

static void
ParseLine(Config &config, LineParser &line)
{
	const char *word = line.ExpectWord();

	if (strcmp(word, "listen") == 0) {
		config.listen = line.ExpectValueAndEnd();
	} else if (strcmp(word, "database") == 0) {
		config.database = line.ExpectValueAndEnd();
	} else if (strcmp(word, "database_schema") == 0) {
		config.database_schema = line.ExpectValueAndEnd();
	} else if (strcmp(word, "tick") == 0) {
		config.tick = std::chrono::seconds(ParsePositive(line.ExpectValueAndEnd(),
								 86400));
	} else if (strcmp(word, "finished_limit") == 0) {
		config.finished_limit = ParsePositive(line.ExpectValueAndEnd(),
						      1000000);
	} else if (strcmp(word, "nodename") == 0) {
		config.node_name = line.ExpectValueAndEnd();
	} else {
		const char *value = line.ExpectValueAndEnd();
		if (!ApplyRuntime(config, word, value))
			throw LineParser::Error("Unknown option");
	}
}

void
LoadConfigFile(Config &config, const char *path)
{
	TextFile file(path);

	char *p;
	while ((p = file.ReadLine()) != nullptr) {
		try {
			LineParser line(p);
			if (line.IsEnd())
				continue;

			ParseLine(config, line);
		} catch (const std::exception &) {
			std::throw_with_nested(FmtRuntimeError("{} line {}",
							       file.GetPath(),
							       file.GetLineNumber()));
		}
	}
}
