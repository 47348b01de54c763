#include "ClientThread.hxx"
#include "TempDirectory.hxx"
#include "Instance.hxx"
#include "Config.hxx"
#include "rpc/Client.hxx"
#include "rpc/Socket.hxx"

#include <gtest/gtest.h>

#include <string>

static BatchRpcError
CallErrorCode(auto &&f)
{
	try {
		f();
	} catch (const RpcError &e) {
		return e.GetCode();
	}

	ADD_FAILURE() << "no RpcError";
	return BatchRpcError{};
}

static std::string
GetConfigValue(RpcClient &client, std::string_view key)
{
	for (const auto &[name, value] : client.GetConfig())
		if (name == key)
			return value;

	return {};
}

static Config
MakeTestConfig()
{
	Config config;
	config.listen = "127.0.0.1:0";
	config.node_name = "node1";
	config.ncpus = 4;
	config.Check();
	return config;
}

struct InstanceTest : ::testing::Test {
	const TempDirectory dir;
	const std::string script = dir.WriteScript("job.sh", "sleep 60\n");

	Instance instance{MakeTestConfig()};
	const RpcAddress address{"127.0.0.1", instance.GetPort()};

	InstanceTest() {
		instance.Start();
	}
};

TEST_F(InstanceTest, ShrinkCpusBelowCommitted)
{
	RunClientThread(instance.GetEventLoop(), [this]{
		RpcClient client{address};

		JobSubmission s;
		s.name = "wide";
		s.script = script;
		s.requested_cpus = 4;
		client.Submit(s);

		EXPECT_EQ(client.GetCpus(), std::make_pair(4u, 4u));
		ASSERT_EQ(client.ListRunning().size(), 1u);

		EXPECT_EQ(CallErrorCode([&]{ client.SetConfig("ncpus", "2"); }),
			  BatchRpcError::CONFIG);

		/* nothing was changed */
		EXPECT_EQ(GetConfigValue(client, "ncpus"), "4");
		EXPECT_EQ(client.GetCpus(), std::make_pair(4u, 4u));

		/* growing is always allowed */
		client.SetConfig("ncpus", "6");
		EXPECT_EQ(GetConfigValue(client, "ncpus"), "6");
		EXPECT_EQ(client.GetCpus(), std::make_pair(4u, 6u));

		client.SetConfig("ncpus", "4");
		EXPECT_EQ(client.GetCpus(), std::make_pair(4u, 4u));
	});
}
