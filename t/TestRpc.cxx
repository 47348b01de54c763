#include "ClientThread.hxx"
#include "rpc/Server.hxx"
#include "rpc/Client.hxx"
#include "rpc/Handler.hxx"
#include "rpc/Builder.hxx"
#include "rpc/Socket.hxx"
#include "batch/Error.hxx"
#include "event/EventLoop.hxx"

#include <gtest/gtest.h>

#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/socket.h>

using namespace std::chrono_literals;

class FakeHandler final : public RpcHandler {
public:
	std::vector<JobSubmission> submissions;
	std::vector<JobId> removed, run;
	std::size_t last_limit = ~std::size_t{};
	std::map<std::string, std::string, std::less<>> config{
		{"ncpus", "4"},
		{"nodename", "node1"},
	};

	JobId OnSubmit(const JobSubmission &submission) override {
		if (submission.requested_cpus == 0)
			throw BatchError(BatchErrorCode::VALIDATION,
					 "At least one CPU must be requested");

		submissions.push_back(submission);
		return submissions.size();
	}

	void OnRemove(JobId id) override {
		if (id > submissions.size())
			throw FmtBatchError(BatchErrorCode::NOT_FOUND,
					    "No such job: {}", id);

		removed.push_back(id);
	}

	void OnRun(JobId id) override {
		if (id == 13)
			throw std::runtime_error("Unlucky");

		run.push_back(id);
	}

	std::vector<BatchJob> OnListRunning() override {
		BatchJob job;
		job.id = 1;
		job.name = "running";
		job.filename = "/tmp/a.sh";
		job.requested_cpus = 2;
		job.priority = -3;
		job.allowed_nodes = {"node1", "node2"};
		job.owner_uid = 1000;
		job.username = "alice";
		job.submitted_at = BatchTime{1600000000000000us};
		job.started_at = BatchTime{1600000001000000us};
		job.node = "node1";
		job.pid = 4242;
		return {job};
	}

	std::vector<BatchJob> OnListWaiting() override {
		std::vector<BatchJob> jobs(2);
		jobs[0].id = 2;
		jobs[0].filename = "/tmp/b.sh";
		jobs[1].id = 3;
		jobs[1].filename = "/tmp/c.sh";
		return jobs;
	}

	std::vector<BatchJob> OnListFinished(std::size_t limit) override {
		last_limit = limit;

		BatchJob job;
		job.id = 4;
		job.filename = "/tmp/d.sh";
		job.submitted_at = BatchTime{1600000000000000us};
		job.started_at = BatchTime{1600000001000000us};
		job.finished_at = BatchTime{1600000002000000us};
		job.exit_code = -9;
		job.node = "node1";
		return {job};
	}

	std::pair<unsigned, unsigned> OnGetCpus() override {
		return {3, 8};
	}

	RpcConfigList OnGetConfig() override {
		return {config.begin(), config.end()};
	}

	void OnSetConfig(std::string_view key, std::string_view value) override {
		auto i = config.find(key);
		if (i == config.end())
			throw FmtBatchError(BatchErrorCode::CONFIG,
					    "Unknown setting: {:?}", key);

		i->second = value;
	}
};

class RpcTest : public ::testing::Test {
protected:
	EventLoop event_loop;
	const RootLogger logger;
	FakeHandler handler;

	RpcServer server{
		event_loop, logger,
		OpenRpcListener(ParseRpcAddress("127.0.0.1:0",
						BATCH_RPC_DEFAULT_PORT)),
		handler,
	};

	const RpcAddress address{"127.0.0.1", server.GetPort()};

	void RunClient(std::function<void()> f) {
		RunClientThread(event_loop, std::move(f));
	}
};

static BatchRpcError
CallErrorCode(auto &&f)
{
	try {
		f();
	} catch (const RpcError &e) {
		return e.GetCode();
	}

	throw std::runtime_error("No error");
}

TEST(RpcAddressTest, Parse)
{
	auto a = ParseRpcAddress("localhost", 1234);
	EXPECT_EQ(a.host, "localhost");
	EXPECT_EQ(a.port, 1234);

	a = ParseRpcAddress("10.0.0.1:80", 1234);
	EXPECT_EQ(a.host, "10.0.0.1");
	EXPECT_EQ(a.port, 80);

	a = ParseRpcAddress("*:99", 1234);
	EXPECT_TRUE(a.host.empty());
	EXPECT_EQ(a.port, 99);

	a = ParseRpcAddress("[::1]:8080", 1234);
	EXPECT_EQ(a.host, "::1");
	EXPECT_EQ(a.port, 8080);

	a = ParseRpcAddress("::1", 1234);
	EXPECT_EQ(a.host, "::1");
	EXPECT_EQ(a.port, 1234);

	EXPECT_THROW(ParseRpcAddress("host:x", 1234), std::invalid_argument);
	EXPECT_THROW(ParseRpcAddress("host:70000", 1234), std::invalid_argument);
	EXPECT_THROW(ParseRpcAddress("[::1", 1234), std::invalid_argument);
}

TEST(RpcDispatchTest, MalformedArguments)
{
	FakeHandler handler;

	RpcMessage request{
		{BatchRpcCommand::METHOD, "remove"},
	};

	RpcBuilder response;
	DispatchRpcRequest(handler, request, response);

	RpcParser parser;
	parser.Feed(response.GetData());
	RpcMessage message;
	ASSERT_TRUE(parser.Next(message));
	ASSERT_EQ(message.size(), 1u);
	EXPECT_EQ(message.front().command, BatchRpcCommand::ERROR);
	const auto &payload = message.front().payload;
	ASSERT_GT(payload.size(), 2u);
	EXPECT_EQ(BatchRpcError((uint8_t(payload[0]) << 8) | uint8_t(payload[1])),
		  BatchRpcError::MALFORMED_REQUEST);
	EXPECT_TRUE(handler.removed.empty());
}

TEST(RpcDispatchTest, NotAMethodCall)
{
	FakeHandler handler;

	RpcMessage request{
		{BatchRpcCommand::JOB_ID, std::string(8, '\0')},
	};

	RpcBuilder response;
	EXPECT_THROW(DispatchRpcRequest(handler, request, response),
		     RpcProtocolError);
}

TEST(RpcParserTest, MessageTooLarge)
{
	const std::string payload(60000, 'x');

	RpcBuilder packet;
	packet.Add(BatchRpcCommand::NAME, payload);

	RpcBuilder end;
	end.AddEnd();

	RpcParser parser;
	RpcMessage message;

	/* 12 MB in one message is still acceptable */
	for (unsigned i = 0; i < 200; ++i) {
		parser.Feed(packet.GetData());
		ASSERT_FALSE(parser.Next(message));
	}

	parser.Feed(end.GetData());
	ASSERT_TRUE(parser.Next(message));
	EXPECT_EQ(message.size(), 200u);

	/* the budget starts over with each message */
	for (unsigned i = 0; i < 200; ++i) {
		parser.Feed(packet.GetData());
		ASSERT_FALSE(parser.Next(message));
	}

	/* 18 MB without END */
	EXPECT_THROW({
		for (unsigned i = 0; i < 100; ++i) {
			parser.Feed(packet.GetData());
			parser.Next(message);
		}
	}, RpcProtocolError);
}

TEST_F(RpcTest, Submit)
{
	RunClient([this]{
		RpcClient client{address};

		JobSubmission s;
		s.name = "test";
		s.script = "/tmp/x.sh";
		s.requested_cpus = 2;
		s.priority = -5;
		s.nodes = {"node1", "node2"};
		s.username = "alice";
		s.uid = 1000;
		s.mail_to = "alice@example.com";
		s.mail_events = "ea";

		EXPECT_EQ(client.Submit(s), 1u);

		s.priority.reset();
		EXPECT_EQ(client.Submit(s), 2u);
	});

	ASSERT_EQ(handler.submissions.size(), 2u);

	const auto &s = handler.submissions.front();
	EXPECT_EQ(s.name, "test");
	EXPECT_EQ(s.script, "/tmp/x.sh");
	EXPECT_EQ(s.requested_cpus, 2u);
	EXPECT_EQ(s.priority.value_or(0), -5);
	EXPECT_EQ(s.nodes, (std::vector<std::string>{"node1", "node2"}));
	EXPECT_EQ(s.username, "alice");
	EXPECT_EQ(s.uid, 1000u);
	EXPECT_EQ(s.mail_to, "alice@example.com");
	EXPECT_EQ(s.mail_events, "ea");

	EXPECT_FALSE(handler.submissions.back().priority.has_value());
}

TEST_F(RpcTest, Lists)
{
	RunClient([this]{
		RpcClient client{address};

		const auto running = client.ListRunning();
		ASSERT_EQ(running.size(), 1u);
		const auto &job = running.front();
		EXPECT_EQ(job.id, 1u);
		EXPECT_EQ(job.name, "running");
		EXPECT_EQ(job.filename, "/tmp/a.sh");
		EXPECT_EQ(job.requested_cpus, 2u);
		EXPECT_EQ(job.priority, -3);
		EXPECT_EQ(job.allowed_nodes.size(), 2u);
		EXPECT_EQ(job.owner_uid, 1000u);
		EXPECT_EQ(job.username, "alice");
		EXPECT_EQ(job.submitted_at, BatchTime{1600000000000000us});
		EXPECT_EQ(job.started_at, BatchTime{1600000001000000us});
		EXPECT_FALSE(IsSet(job.finished_at));
		EXPECT_EQ(job.GetState(), JobState::RUNNING);
		EXPECT_EQ(job.node, "node1");
		EXPECT_EQ(job.pid, 4242);

		const auto waiting = client.ListWaiting();
		ASSERT_EQ(waiting.size(), 2u);
		EXPECT_EQ(waiting[0].id, 2u);
		EXPECT_EQ(waiting[1].id, 3u);
		EXPECT_EQ(waiting[1].GetState(), JobState::WAITING);

		auto finished = client.ListFinished();
		ASSERT_EQ(finished.size(), 1u);
		EXPECT_EQ(finished.front().GetState(), JobState::DONE);
		EXPECT_EQ(finished.front().exit_code, -9);

		finished = client.ListFinished(7);
		EXPECT_EQ(finished.size(), 1u);
	});

	EXPECT_EQ(handler.last_limit, 7u);
}

TEST_F(RpcTest, Commands)
{
	RunClient([this]{
		RpcClient client{address};

		JobSubmission s;
		s.script = "/tmp/x.sh";
		s.requested_cpus = 1;
		client.Submit(s);

		client.Remove(1);
		client.Run(1);

		EXPECT_EQ(client.GetCpus(), std::make_pair(3u, 8u));
	});

	EXPECT_EQ(handler.removed, std::vector<JobId>{1});
	EXPECT_EQ(handler.run, std::vector<JobId>{1});
}

TEST_F(RpcTest, Config)
{
	RunClient([this]{
		RpcClient client{address};

		client.SetConfig("ncpus", "16");

		const auto config = client.GetConfig();
		ASSERT_EQ(config.size(), 2u);
		EXPECT_EQ(config[0].first, "ncpus");
		EXPECT_EQ(config[0].second, "16");
		EXPECT_EQ(config[1].first, "nodename");

		EXPECT_EQ(CallErrorCode([&]{ client.SetConfig("foo", "bar"); }),
			  BatchRpcError::CONFIG);
	});

	EXPECT_EQ(handler.config["ncpus"], "16");
}

TEST_F(RpcTest, Errors)
{
	RunClient([this]{
		RpcClient client{address};

		EXPECT_EQ(CallErrorCode([&]{ client.Remove(99); }),
			  BatchRpcError::NOT_FOUND);

		try {
			client.Remove(99);
			FAIL();
		} catch (const RpcError &e) {
			EXPECT_STREQ(e.what(), "No such job: 99");
		}

		EXPECT_EQ(CallErrorCode([&]{ client.Submit({}); }),
			  BatchRpcError::VALIDATION);

		EXPECT_EQ(CallErrorCode([&]{ client.Run(13); }),
			  BatchRpcError::INTERNAL);

		EXPECT_EQ(CallErrorCode([&]{
			RpcBuilder b;
			b.AddMethod("frobnicate");
			client.Call(std::move(b));
		}), BatchRpcError::METHOD_NOT_FOUND);

		EXPECT_EQ(CallErrorCode([&]{
			RpcBuilder b;
			b.AddMethod("get_cpus");
			b.AddU64(BatchRpcCommand::JOB_ID, 1);
			client.Call(std::move(b));
		}), BatchRpcError::MALFORMED_REQUEST);

		/* the connection is still usable after errors */
		EXPECT_EQ(client.GetCpus(), std::make_pair(3u, 8u));
	});

	EXPECT_TRUE(handler.removed.empty());
	EXPECT_TRUE(handler.run.empty());
}

static void
SendAll(int fd, std::span<const std::byte> data)
{
	while (!data.empty()) {
		const auto nbytes = send(fd, data.data(), data.size(),
					 MSG_NOSIGNAL);
		if (nbytes <= 0)
			throw std::runtime_error("send() failed");

		data = data.subspan(nbytes);
	}
}

TEST_F(RpcTest, Pipelined)
{
	RunClient([this]{
		auto fd = ConnectRpc(address);

		RpcBuilder b;
		b.AddMethod("get_cpus");
		b.AddEnd();
		b.AddMethod("list_waiting");
		b.AddEnd();
		SendAll(fd.Get(), b.GetData());

		RpcParser parser;
		std::vector<RpcMessage> responses;

		while (responses.size() < 2) {
			std::byte buffer[4096];
			const auto nbytes = recv(fd.Get(), buffer, sizeof(buffer), 0);
			ASSERT_GT(nbytes, 0);

			parser.Feed(std::span{buffer, std::size_t(nbytes)});

			RpcMessage message;
			while (parser.Next(message))
				responses.emplace_back(std::move(message));
		}

		ASSERT_EQ(responses.size(), 2u);

		ASSERT_EQ(responses[0].size(), 2u);
		EXPECT_EQ(responses[0][0].command, BatchRpcCommand::CPUS_USED);
		EXPECT_EQ(responses[0][0].GetU32(), 3u);
		EXPECT_EQ(responses[0][1].command, BatchRpcCommand::CPUS_TOTAL);
		EXPECT_EQ(responses[0][1].GetU32(), 8u);

		EXPECT_EQ(DecodeJobs(responses[1]).size(), 2u);
	});
}

TEST_F(RpcTest, ProtocolErrorClosesConnection)
{
	RunClient([this]{
		auto fd = ConnectRpc(address);

		RpcBuilder b;
		b.AddU64(BatchRpcCommand::JOB_ID, 1);
		b.AddEnd();
		SendAll(fd.Get(), b.GetData());

		std::byte buffer[256];
		EXPECT_EQ(recv(fd.Get(), buffer, sizeof(buffer), 0), 0);
	});
}
