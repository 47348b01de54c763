// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Packet.hxx"
#include "Codec.hxx"
#include "io/OwnedFd.hxx"
#include "batch/Job.hxx"

#include <cstddef>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

struct RpcAddress;
class RpcBuilder;

/**
 * The server has answered with an ERROR packet.
 */
class RpcError : public std::runtime_error {
	BatchRpcError code;

public:
	RpcError(BatchRpcError _code, const std::string &_msg)
		:std::runtime_error(_msg), code(_code) {}

	BatchRpcError GetCode() const noexcept {
		return code;
	}
};

/**
 * A blocking client for the batch RPC protocol.
 */
class RpcClient {
	OwnedFd fd;

	RpcParser parser;

public:
	/**
	 * Throws on connect error.
	 */
	explicit RpcClient(const RpcAddress &address);

	/**
	 * Send a request (without END) and wait for the response.
	 *
	 * Throws #RpcError if the server reports an error, and
	 * other exceptions on I/O or protocol errors.
	 */
	RpcMessage Call(RpcBuilder &&request);

	JobId Submit(const JobSubmission &submission);
	void Remove(JobId id);
	void Run(JobId id);

	std::vector<BatchJob> ListRunning();
	std::vector<BatchJob> ListWaiting();

	/**
	 * @param limit 0 means the server's default
	 */
	std::vector<BatchJob> ListFinished(std::size_t limit=0);

	/**
	 * @return the number of committed and the total number of
	 * CPUs
	 */
	std::pair<unsigned, unsigned> GetCpus();

	RpcConfigList GetConfig();
	void SetConfig(std::string_view key, std::string_view value);

private:
	void SendAll(std::span<const std::byte> data);
	RpcMessage Receive();
};
