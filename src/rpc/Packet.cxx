// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Packet.hxx"

#include <arpa/inet.h>
#include <endian.h>
#include <string.h>

template<typename T>
static T
LoadPayload(const std::string &payload)
{
	if (payload.size() != sizeof(T))
		throw RpcProtocolError("Wrong integer size");

	T value;
	memcpy(&value, payload.data(), sizeof(value));
	return value;
}

uint16_t
RpcPacket::GetU16() const
{
	return ntohs(LoadPayload<uint16_t>(payload));
}

uint32_t
RpcPacket::GetU32() const
{
	return ntohl(LoadPayload<uint32_t>(payload));
}

uint64_t
RpcPacket::GetU64() const
{
	return be64toh(LoadPayload<uint64_t>(payload));
}

void
RpcParser::Feed(std::span<const std::byte> src)
{
	input.insert(input.end(), src.begin(), src.end());
}

bool
RpcParser::Next(RpcMessage &message)
{
	std::size_t position = 0;
	bool complete = false;

	while (input.size() - position >= sizeof(BatchRpcHeader)) {
		BatchRpcHeader header;
		memcpy(&header, input.data() + position, sizeof(header));

		const std::size_t length = ntohs(header.length);
		const auto command = static_cast<BatchRpcCommand>(ntohs(header.command));

		if (input.size() - position - sizeof(header) < length)
			/* incomplete payload */
			break;

		const char *payload = reinterpret_cast<const char *>(input.data() + position + sizeof(header));
		position += sizeof(header) + length;

		if (command == BatchRpcCommand::END) {
			complete = true;
			break;
		}

		if (command == BatchRpcCommand::NOP)
			continue;

		if (current.size() >= max_packets)
			throw RpcProtocolError("Too many packets");

		if (length > max_bytes - current_bytes)
			throw RpcProtocolError("Message too large");

		current_bytes += length;
		current.push_back({command, std::string{payload, length}});
	}

	input.erase(input.begin(), input.begin() + position);

	if (!complete)
		return false;

	message = std::move(current);
	current.clear();
	current_bytes = 0;
	return true;
}
