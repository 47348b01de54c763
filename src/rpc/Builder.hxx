// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Protocol.hxx"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

/**
 * Build a sequence of packets.
 */
class RpcBuilder {
	std::vector<std::byte> buffer;

public:
	bool empty() const noexcept {
		return buffer.empty();
	}

	std::span<const std::byte> GetData() const noexcept {
		return buffer;
	}

	std::vector<std::byte> Release() noexcept {
		return std::move(buffer);
	}

	/**
	 * Throws std::length_error if the payload is too large.
	 */
	void Add(BatchRpcCommand command, std::span<const std::byte> payload={});

	/**
	 * Append already encoded packets.
	 */
	void Append(std::span<const std::byte> packets) {
		buffer.insert(buffer.end(), packets.begin(), packets.end());
	}

	void Add(BatchRpcCommand command, std::string_view payload) {
		Add(command, std::as_bytes(std::span{payload}));
	}

	void AddU16(BatchRpcCommand command, uint16_t value);
	void AddU32(BatchRpcCommand command, uint32_t value);
	void AddU64(BatchRpcCommand command, uint64_t value);

	void AddI32(BatchRpcCommand command, int32_t value) {
		AddU32(command, static_cast<uint32_t>(value));
	}

	void AddI64(BatchRpcCommand command, int64_t value) {
		AddU64(command, static_cast<uint64_t>(value));
	}

	void AddMethod(std::string_view name) {
		Add(BatchRpcCommand::METHOD, name);
	}

	void AddEnd() {
		Add(BatchRpcCommand::END);
	}

	void AddError(BatchRpcError code, std::string_view message);
};
