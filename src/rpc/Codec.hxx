// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Packet.hxx"

#include <span>
#include <string>
#include <utility>
#include <vector>

class RpcBuilder;
struct JobSubmission;
struct BatchJob;

using RpcConfigList = std::vector<std::pair<std::string, std::string>>;

void
EncodeSubmission(RpcBuilder &b, const JobSubmission &submission);

/**
 * Throws #RpcProtocolError on error.
 */
JobSubmission
DecodeSubmission(std::span<const RpcPacket> packets);

void
EncodeJob(RpcBuilder &b, const BatchJob &job);

/**
 * Decode a list of job records, each beginning with JOB_ID.
 *
 * Throws #RpcProtocolError on error.
 */
std::vector<BatchJob>
DecodeJobs(std::span<const RpcPacket> packets);

void
EncodeConfig(RpcBuilder &b, const RpcConfigList &config);

/**
 * Throws #RpcProtocolError on error.
 */
RpcConfigList
DecodeConfig(std::span<const RpcPacket> packets);
