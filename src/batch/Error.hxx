// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <stdexcept>
#include <utility>

enum class BatchErrorCode : uint16_t {
	NOT_FOUND = 1,
	VALIDATION = 2,
	CONFLICT = 3,
	LAUNCH = 4,
	STORAGE = 5,
	CONFIG = 6,
};

[[gnu::const]]
const char *
ToString(BatchErrorCode code) noexcept;

/**
 * A domain error which is reported to the client.
 */
class BatchError : public std::runtime_error {
	BatchErrorCode code;

public:
	BatchError(BatchErrorCode _code, const char *msg)
		:std::runtime_error(msg), code(_code) {}

	BatchError(BatchErrorCode _code, const std::string &msg)
		:std::runtime_error(msg), code(_code) {}

	BatchErrorCode GetCode() const noexcept {
		return code;
	}
};

template<typename... Args>
[[nodiscard]]
inline BatchError
FmtBatchError(BatchErrorCode code,
	      fmt::format_string<Args...> format_str, Args&&... args)
{
	return BatchError(code, fmt::format(format_str,
					    std::forward<Args>(args)...));
}
