#include "TempDirectory.hxx"
#include "Config.hxx"
#include "Exception.hxx"
#include "batch/Error.hxx"
#include "io/LineParser.hxx"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>

static std::string
LoadError(const char *path)
{
	Config config;

	try {
		LoadConfigFile(config, path);
	} catch (...) {
		return GetFullMessage(std::current_exception());
	}

	return {};
}

static BatchErrorCode
SetRuntimeError(Config &config, const char *key, const char *value)
{
	try {
		config.SetRuntime(key, value);
	} catch (const BatchError &e) {
		return e.GetCode();
	}

	throw std::runtime_error("No error");
}

TEST(LineParser, Words)
{
	char line[] = "  ncpus   8  # comment";
	LineParser p(line);
	EXPECT_FALSE(p.IsEnd());
	EXPECT_STREQ(p.ExpectWord(), "ncpus");
	EXPECT_STREQ(p.ExpectValue(), "8");
	EXPECT_TRUE(p.IsEnd());
	p.ExpectEnd();
}

TEST(LineParser, Quoted)
{
	char line[] = "mail_sender \"Batch \\\"Daemon\\\" <batch@example.com>\"";
	LineParser p(line);
	EXPECT_STREQ(p.ExpectWord(), "mail_sender");
	EXPECT_STREQ(p.ExpectValueAndEnd(),
		     "Batch \"Daemon\" <batch@example.com>");
}

TEST(LineParser, Errors)
{
	{
		char line[] = "-foo bar";
		LineParser p(line);
		EXPECT_THROW(p.ExpectWord(), LineParser::Error);
	}

	{
		char line[] = "foo";
		LineParser p(line);
		p.ExpectWord();
		EXPECT_THROW(p.ExpectValue(), LineParser::Error);
	}

	{
		char line[] = "foo \"bar";
		LineParser p(line);
		p.ExpectWord();
		EXPECT_THROW(p.ExpectValue(), LineParser::Error);
	}

	{
		char line[] = "foo bar baz";
		LineParser p(line);
		p.ExpectWord();
		EXPECT_THROW(p.ExpectValueAndEnd(), LineParser::Error);
	}

	{
		char line[] = "# only a comment";
		LineParser p(line);
		EXPECT_TRUE(p.IsEnd());
	}
}

TEST(Config, Defaults)
{
	Config config;
	EXPECT_EQ(config.listen, "*");
	EXPECT_TRUE(config.database.empty());
	EXPECT_EQ(config.tick, std::chrono::seconds(10));
	EXPECT_EQ(config.finished_limit, 5u);
	EXPECT_EQ(config.ncpus, 4u);
	EXPECT_EQ(config.root, "/");
	EXPECT_EQ(config.default_priority, 0);
}

TEST(Config, Load)
{
	TempDirectory dir;
	const auto path = dir.WriteFile("batch.conf",
					"# the batch daemon\n"
					"\n"
					"listen \"127.0.0.1:4000\"\n"
					"database \"dbname=batch user=batch\"\n"
					"tick 30\n"
					"finished_limit 20\n"
					"nodename node7   # overrides the host name\n"
					"ncpus 16\n"
					"root /srv/jobs\n"
					"default_priority -10\n"
					"mail_sender batch@example.com\n"
					"smtp_server smtp://mail.example.com\n"
					"slack_token xoxb-secret\n"
					"slack_channel \"#batch\"\n");

	Config config;
	LoadConfigFile(config, path.c_str());
	config.Check();

	EXPECT_EQ(config.listen, "127.0.0.1:4000");
	EXPECT_EQ(config.database, "dbname=batch user=batch");
	EXPECT_EQ(config.tick, std::chrono::seconds(30));
	EXPECT_EQ(config.finished_limit, 20u);
	EXPECT_EQ(config.node_name, "node7");
	EXPECT_EQ(config.ncpus, 16u);
	EXPECT_EQ(config.root, "/srv/jobs");
	EXPECT_EQ(config.default_priority, -10);
	EXPECT_EQ(config.mail_sender, "batch@example.com");
	EXPECT_EQ(config.smtp_server, "smtp://mail.example.com");
	EXPECT_EQ(config.slack_token, "xoxb-secret");
	EXPECT_EQ(config.slack_channel, "#batch");
}

TEST(Config, LoadErrors)
{
	TempDirectory dir;

	auto path = dir.WriteFile("unknown.conf", "ncpus 2\nfoo bar\n");
	EXPECT_EQ(LoadError(path.c_str()), path + " line 2; Unknown option");

	path = dir.WriteFile("bad.conf", "ncpus zero\n");
	EXPECT_EQ(LoadError(path.c_str()), path + " line 1; Not a number");

	path = dir.WriteFile("zero.conf", "\n\ntick 0\n");
	EXPECT_EQ(LoadError(path.c_str()),
		  path + " line 3; Number must be positive");

	path = dir.WriteFile("root.conf", "root relative/path\n");
	EXPECT_EQ(LoadError(path.c_str()),
		  path + " line 1; Absolute path expected");

	path = dir.WriteFile("garbage.conf", "listen a b\n");
	EXPECT_EQ(LoadError(path.c_str()),
		  path + " line 1; Unexpected tokens at end of line");

	EXPECT_FALSE(LoadError(dir.Make("missing.conf").c_str()).empty());
}

TEST(Config, Check)
{
	{
		Config config;
		config.Check();
		EXPECT_FALSE(config.node_name.empty());
	}

	{
		Config config;
		config.node_name = "node1";
		config.Check();
		EXPECT_EQ(config.node_name, "node1");
	}

	{
		Config config;
		config.slack_token = "xoxb-secret";
		EXPECT_THROW(config.Check(), std::runtime_error);

		config.slack_channel = "#batch";
		config.Check();
	}

	{
		Config config;
		config.root = "relative";
		EXPECT_THROW(config.Check(), std::runtime_error);
	}
}

TEST(Config, RuntimeList)
{
	Config config;
	config.node_name = "node1";
	config.slack_token = "xoxb-secret";
	config.slack_channel = "#batch";

	const auto list = config.GetRuntimeList();
	ASSERT_EQ(list.size(), 8u);
	EXPECT_EQ(list[0].first, "nodename");
	EXPECT_EQ(list[0].second, "node1");
	EXPECT_EQ(list[1].first, "ncpus");
	EXPECT_EQ(list[1].second, "4");
	EXPECT_EQ(list[6].first, "slack_token");
	EXPECT_EQ(list[6].second, "***");
	EXPECT_EQ(list[7].second, "#batch");

	config.slack_token.clear();
	EXPECT_EQ(config.GetRuntimeList()[6].second, "");
}

TEST(Config, SetRuntime)
{
	Config config;
	config.node_name = "node1";

	config.SetRuntime("ncpus", "8");
	EXPECT_EQ(config.ncpus, 8u);
	EXPECT_EQ(config.GetRuntimeList()[1].second, "8");

	config.SetRuntime("default_priority", "-3");
	EXPECT_EQ(config.default_priority, -3);

	config.SetRuntime("root", "/srv");
	EXPECT_EQ(config.root, "/srv");

	config.SetRuntime("smtp_server", "");
	EXPECT_TRUE(config.smtp_server.empty());

	EXPECT_EQ(SetRuntimeError(config, "nodename", "node2"),
		  BatchErrorCode::CONFIG);
	EXPECT_EQ(config.node_name, "node1");

	EXPECT_EQ(SetRuntimeError(config, "listen", "*:80"),
		  BatchErrorCode::CONFIG);
	EXPECT_EQ(SetRuntimeError(config, "foo", "bar"),
		  BatchErrorCode::CONFIG);

	/* a rejected value leaves the old one in place */
	EXPECT_EQ(SetRuntimeError(config, "ncpus", "0"),
		  BatchErrorCode::CONFIG);
	EXPECT_EQ(SetRuntimeError(config, "ncpus", "many"),
		  BatchErrorCode::CONFIG);
	EXPECT_EQ(config.ncpus, 8u);

	EXPECT_EQ(SetRuntimeError(config, "root", "relative"),
		  BatchErrorCode::CONFIG);
	EXPECT_EQ(config.root, "/srv");
}
