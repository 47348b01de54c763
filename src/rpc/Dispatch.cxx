// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Handler.hxx"
#include "Builder.hxx"
#include "batch/Error.hxx"
#include "Exception.hxx"

#include <span>

namespace {

/**
 * The client has called a method which does not exist.
 */
class MethodNotFound : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

}

static void
NoArguments(std::span<const RpcPacket> args)
{
	if (!args.empty())
		throw RpcProtocolError("Too many arguments");
}

static JobId
GetJobIdArgument(std::span<const RpcPacket> args)
{
	if (args.size() != 1 || args.front().command != BatchRpcCommand::JOB_ID)
		throw RpcProtocolError("JOB_ID expected");

	return args.front().GetU64();
}

static void
EncodeJobs(RpcBuilder &response, const std::vector<BatchJob> &jobs)
{
	for (const auto &job : jobs)
		EncodeJob(response, job);
}

static void
Dispatch(RpcHandler &handler, std::string_view method,
	 std::span<const RpcPacket> args, RpcBuilder &response)
{
	if (method == "submit") {
		const auto id = handler.OnSubmit(DecodeSubmission(args));
		response.AddU64(BatchRpcCommand::JOB_ID, id);
	} else if (method == "remove") {
		handler.OnRemove(GetJobIdArgument(args));
	} else if (method == "run") {
		handler.OnRun(GetJobIdArgument(args));
	} else if (method == "list_running") {
		NoArguments(args);
		EncodeJobs(response, handler.OnListRunning());
	} else if (method == "list_waiting") {
		NoArguments(args);
		EncodeJobs(response, handler.OnListWaiting());
	} else if (method == "list_finished") {
		std::size_t limit = 0;
		if (!args.empty()) {
			if (args.size() != 1 ||
			    args.front().command != BatchRpcCommand::LIMIT)
				throw RpcProtocolError("LIMIT expected");

			limit = args.front().GetU32();
		}

		EncodeJobs(response, handler.OnListFinished(limit));
	} else if (method == "get_cpus") {
		NoArguments(args);
		const auto [used, total] = handler.OnGetCpus();
		response.AddU32(BatchRpcCommand::CPUS_USED, used);
		response.AddU32(BatchRpcCommand::CPUS_TOTAL, total);
	} else if (method == "get_config") {
		NoArguments(args);
		EncodeConfig(response, handler.OnGetConfig());
	} else if (method == "set_config") {
		const auto config = DecodeConfig(args);
		if (config.size() != 1)
			throw RpcProtocolError("One KEY/VALUE pair expected");

		handler.OnSetConfig(config.front().first,
				    config.front().second);
	} else
		throw MethodNotFound(fmt::format("No such method: {:?}",
						 method));
}

static_assert(uint16_t(BatchRpcError::NOT_FOUND) == uint16_t(BatchErrorCode::NOT_FOUND));
static_assert(uint16_t(BatchRpcError::CONFIG) == uint16_t(BatchErrorCode::CONFIG));

static constexpr BatchRpcError
ToRpcError(BatchErrorCode code) noexcept
{
	return static_cast<BatchRpcError>(code);
}

void
DispatchRpcRequest(RpcHandler &handler, const RpcMessage &request,
		   RpcBuilder &response)
{
	if (request.empty() || request.front().command != BatchRpcCommand::METHOD)
		throw RpcProtocolError("METHOD expected");

	const std::string_view method = request.front().GetString();
	const std::span<const RpcPacket> args{request.begin() + 1, request.end()};

	RpcBuilder result;

	try {
		Dispatch(handler, method, args, result);
	} catch (const BatchError &e) {
		response.AddError(ToRpcError(e.GetCode()),
				  GetFullMessage(std::current_exception()));
		response.AddEnd();
		return;
	} catch (const MethodNotFound &e) {
		response.AddError(BatchRpcError::METHOD_NOT_FOUND, e.what());
		response.AddEnd();
		return;
	} catch (const RpcProtocolError &e) {
		response.AddError(BatchRpcError::MALFORMED_REQUEST, e.what());
		response.AddEnd();
		return;
	} catch (...) {
		response.AddError(BatchRpcError::INTERNAL,
				  GetFullMessage(std::current_exception()));
		response.AddEnd();
		return;
	}

	response.Append(result.GetData());

	response.AddEnd();
}
