// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Builder.hxx"

#include <stdexcept>

#include <arpa/inet.h>
#include <endian.h>
#include <string.h>

void
RpcBuilder::Add(BatchRpcCommand command, std::span<const std::byte> payload)
{
	if (payload.size() > BATCH_RPC_MAX_PAYLOAD)
		throw std::length_error("Packet payload too large");

	BatchRpcHeader header;
	header.length = htons(static_cast<uint16_t>(payload.size()));
	header.command = htons(static_cast<uint16_t>(command));

	const auto *h = reinterpret_cast<const std::byte *>(&header);
	buffer.insert(buffer.end(), h, h + sizeof(header));
	buffer.insert(buffer.end(), payload.begin(), payload.end());
}

void
RpcBuilder::AddU16(BatchRpcCommand command, uint16_t value)
{
	value = htons(value);
	Add(command, std::as_bytes(std::span{&value, 1}));
}

void
RpcBuilder::AddU32(BatchRpcCommand command, uint32_t value)
{
	value = htonl(value);
	Add(command, std::as_bytes(std::span{&value, 1}));
}

void
RpcBuilder::AddU64(BatchRpcCommand command, uint64_t value)
{
	value = htobe64(value);
	Add(command, std::as_bytes(std::span{&value, 1}));
}

void
RpcBuilder::AddError(BatchRpcError code, std::string_view message)
{
	if (message.size() > BATCH_RPC_MAX_PAYLOAD - 2)
		message = message.substr(0, BATCH_RPC_MAX_PAYLOAD - 2);

	std::vector<std::byte> payload(2 + message.size());

	const uint16_t code_be = htons(static_cast<uint16_t>(code));
	memcpy(payload.data(), &code_be, sizeof(code_be));
	memcpy(payload.data() + 2, message.data(), message.size());

	Add(BatchRpcCommand::ERROR, payload);
}
