// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Codec.hxx"
#include "batch/Job.hxx"

#include <cstddef>
#include <string_view>
#include <utility>
#include <vector>

/**
 * The operations offered by the RPC server.  All methods may throw
 * #BatchError, which is reported to the client.
 */
class RpcHandler {
public:
	virtual JobId OnSubmit(const JobSubmission &submission) = 0;
	virtual void OnRemove(JobId id) = 0;
	virtual void OnRun(JobId id) = 0;

	virtual std::vector<BatchJob> OnListRunning() = 0;
	virtual std::vector<BatchJob> OnListWaiting() = 0;

	/**
	 * @param limit the maximum number of jobs; 0 means the
	 * configured default
	 */
	virtual std::vector<BatchJob> OnListFinished(std::size_t limit) = 0;

	/**
	 * @return the number of committed and the total number of
	 * CPUs
	 */
	virtual std::pair<unsigned, unsigned> OnGetCpus() = 0;

	virtual RpcConfigList OnGetConfig() = 0;
	virtual void OnSetConfig(std::string_view key,
				 std::string_view value) = 0;
};

class RpcBuilder;

/**
 * Decode a request, invoke the handler and write the response
 * (result packets or ERROR, followed by END).
 *
 * Throws #RpcProtocolError if the request is not a method call at
 * all.
 */
void
DispatchRpcRequest(RpcHandler &handler, const RpcMessage &request,
		   RpcBuilder &response);
