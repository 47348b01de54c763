// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stddef.h>
#include <stdint.h>

/*

  The batch daemon listens on a TCP socket.  Both directions carry a
  stream of packets.  Each packet begins with a header (payload
  length and command, both 16 bit big-endian) followed by the
  payload.  Integers in payloads are big-endian; strings are raw
  bytes without a null terminator.

  A request is a METHOD packet, followed by argument packets,
  followed by END.  The response is a sequence of result packets
  followed by END, or one ERROR packet followed by END.  A client
  may send several requests over one connection; they are answered
  in order.

*/

static constexpr uint16_t BATCH_RPC_DEFAULT_PORT = 16219;

enum class BatchRpcCommand : uint16_t {
	NOP = 0,

	/**
	 * Terminates a request or a response.  No payload.
	 */
	END = 1,

	/**
	 * The first packet of a request.  Payload is the method
	 * name, e.g. "submit".
	 */
	METHOD = 2,

	/**
	 * The request has failed.  Payload is a 16 bit error code
	 * (#BatchRpcError) followed by a message.
	 */
	ERROR = 3,

	/**
	 * A job id (64 bit).  In a job record, this packet starts a
	 * new record.
	 */
	JOB_ID = 10,

	/**
	 * Limit for "list_finished" (32 bit).
	 */
	LIMIT = 11,

	/**
	 * A configuration key (string).
	 */
	KEY = 12,

	/**
	 * A configuration value (string); follows KEY.
	 */
	VALUE = 13,

	/* submission / job record attributes */

	NAME = 20,

	/**
	 * The script path (string).  In a job record, this is the
	 * resolved absolute path.
	 */
	SCRIPT = 21,

	/**
	 * Number of CPUs (32 bit).
	 */
	CPUS = 22,

	/**
	 * Signed 32 bit.
	 */
	PRIORITY = 23,

	STDOUT = 24,
	STDERR = 25,

	/**
	 * An allowed node; may be repeated.
	 */
	NODE = 26,

	USERNAME = 27,

	/**
	 * 32 bit.
	 */
	UID = 28,

	MAIL_TO = 29,

	/**
	 * A subset of "bea".
	 */
	MAIL_EVENTS = 30,

	/* job record attributes (responses only) */

	/**
	 * Timestamps are signed 64 bit microseconds since the epoch.
	 */
	SUBMITTED = 40,
	STARTED = 41,
	FINISHED = 42,

	/**
	 * Signed 32 bit; negative values are signal numbers.
	 */
	EXIT_CODE = 43,

	/**
	 * The node the job runs/ran on (string).
	 */
	RUNNING_NODE = 44,

	/**
	 * Signed 32 bit.
	 */
	PID = 45,

	/* "get_cpus" response */

	CPUS_USED = 50,
	CPUS_TOTAL = 51,
};

enum class BatchRpcError : uint16_t {
	NOT_FOUND = 1,
	VALIDATION = 2,
	CONFLICT = 3,
	LAUNCH = 4,
	STORAGE = 5,
	CONFIG = 6,

	METHOD_NOT_FOUND = 100,
	MALFORMED_REQUEST = 101,
	INTERNAL = 102,
};

struct BatchRpcHeader {
	uint16_t length;
	uint16_t command;
};

static_assert(sizeof(BatchRpcHeader) == 4);

static constexpr size_t BATCH_RPC_MAX_PAYLOAD = 0xffff;
