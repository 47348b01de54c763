// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Client.hxx"
#include "Builder.hxx"
#include "Socket.hxx"
#include "Exception.hxx"

#include <array>

#include <errno.h>
#include <sys/socket.h>

RpcClient::RpcClient(const RpcAddress &address)
	:fd(ConnectRpc(address)) {}

void
RpcClient::SendAll(std::span<const std::byte> data)
{
	while (!data.empty()) {
		const ssize_t nbytes = send(fd.Get(), data.data(), data.size(),
					    MSG_NOSIGNAL);
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			throw MakeErrno("Failed to send");
		}

		data = data.subspan(nbytes);
	}
}

RpcMessage
RpcClient::Receive()
{
	RpcMessage message;

	while (!parser.Next(message)) {
		std::array<std::byte, 8192> buffer;
		const ssize_t nbytes = recv(fd.Get(), buffer.data(),
					    buffer.size(), 0);
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			throw MakeErrno("Failed to receive");
		}

		if (nbytes == 0)
			throw RpcProtocolError("Server closed the connection");

		parser.Feed(std::span{buffer}.first(nbytes));
	}

	return message;
}

static void
CheckError(const RpcMessage &response)
{
	for (const auto &packet : response) {
		if (packet.command != BatchRpcCommand::ERROR)
			continue;

		const std::string_view payload = packet.GetString();
		if (payload.size() < 2)
			throw RpcProtocolError("Malformed ERROR packet");

		const auto code = static_cast<BatchRpcError>
			((uint16_t(uint8_t(payload[0])) << 8) |
			 uint8_t(payload[1]));
		throw RpcError(code, std::string{payload.substr(2)});
	}
}

RpcMessage
RpcClient::Call(RpcBuilder &&request)
{
	request.AddEnd();
	SendAll(request.GetData());

	auto response = Receive();
	CheckError(response);
	return response;
}

JobId
RpcClient::Submit(const JobSubmission &submission)
{
	RpcBuilder b;
	b.AddMethod("submit");
	EncodeSubmission(b, submission);

	const auto response = Call(std::move(b));
	for (const auto &packet : response)
		if (packet.command == BatchRpcCommand::JOB_ID)
			return packet.GetU64();

	throw RpcProtocolError("No JOB_ID in response");
}

void
RpcClient::Remove(JobId id)
{
	RpcBuilder b;
	b.AddMethod("remove");
	b.AddU64(BatchRpcCommand::JOB_ID, id);
	Call(std::move(b));
}

void
RpcClient::Run(JobId id)
{
	RpcBuilder b;
	b.AddMethod("run");
	b.AddU64(BatchRpcCommand::JOB_ID, id);
	Call(std::move(b));
}

std::vector<BatchJob>
RpcClient::ListRunning()
{
	RpcBuilder b;
	b.AddMethod("list_running");
	return DecodeJobs(Call(std::move(b)));
}

std::vector<BatchJob>
RpcClient::ListWaiting()
{
	RpcBuilder b;
	b.AddMethod("list_waiting");
	return DecodeJobs(Call(std::move(b)));
}

std::vector<BatchJob>
RpcClient::ListFinished(std::size_t limit)
{
	RpcBuilder b;
	b.AddMethod("list_finished");
	if (limit > 0)
		b.AddU32(BatchRpcCommand::LIMIT, limit);
	return DecodeJobs(Call(std::move(b)));
}

std::pair<unsigned, unsigned>
RpcClient::GetCpus()
{
	RpcBuilder b;
	b.AddMethod("get_cpus");

	std::pair<unsigned, unsigned> result{0, 0};
	for (const auto &packet : Call(std::move(b))) {
		if (packet.command == BatchRpcCommand::CPUS_USED)
			result.first = packet.GetU32();
		else if (packet.command == BatchRpcCommand::CPUS_TOTAL)
			result.second = packet.GetU32();
	}

	return result;
}

RpcConfigList
RpcClient::GetConfig()
{
	RpcBuilder b;
	b.AddMethod("get_config");
	return DecodeConfig(Call(std::move(b)));
}

void
RpcClient::SetConfig(std::string_view key, std::string_view value)
{
	RpcBuilder b;
	b.AddMethod("set_config");
	b.Add(BatchRpcCommand::KEY, key);
	b.Add(BatchRpcCommand::VALUE, value);
	Call(std::move(b));
}
