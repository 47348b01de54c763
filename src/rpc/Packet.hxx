// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Protocol.hxx"

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

/**
 * The peer has sent something which violates the protocol.
 */
class RpcProtocolError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * One decoded packet.
 */
struct RpcPacket {
	BatchRpcCommand command;

	std::string payload;

	std::string_view GetString() const noexcept {
		return payload;
	}

	/**
	 * Throws #RpcProtocolError if the payload size is wrong.
	 */
	uint16_t GetU16() const;
	uint32_t GetU32() const;
	uint64_t GetU64() const;

	int32_t GetI32() const {
		return static_cast<int32_t>(GetU32());
	}

	int64_t GetI64() const {
		return static_cast<int64_t>(GetU64());
	}
};

/**
 * A request or a response: all packets up to (excluding) END.
 */
using RpcMessage = std::vector<RpcPacket>;

/**
 * Splits an incoming byte stream into messages.
 */
class RpcParser {
	/**
	 * The maximum number of packets in one message.
	 */
	static constexpr std::size_t max_packets = 1 << 20;

	/**
	 * The maximum total payload size of one message.
	 */
	static constexpr std::size_t max_bytes = 16 << 20;

	std::vector<std::byte> input;

	RpcMessage current;

	/**
	 * The total payload size of #current.
	 */
	std::size_t current_bytes = 0;

public:
	/**
	 * Append received data.
	 */
	void Feed(std::span<const std::byte> src);

	/**
	 * Are there unparsed bytes or an incomplete message?
	 */
	bool HasPartial() const noexcept {
		return !input.empty() || !current.empty();
	}

	/**
	 * Extract the next complete message.
	 *
	 * @return false if no complete message is available yet
	 */
	bool Next(RpcMessage &message);
};
