// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Result.hxx"

#include <exception>
#include <string>

namespace Pg {

/**
 * A failed query; carries the #Result which contains the error
 * message and the SQLSTATE.
 */
class Error final : public std::exception {
	Result result;

	std::string message;

public:
	explicit Error(Result &&_result);

	Error(Error &&other) noexcept = default;
	Error &operator=(Error &&other) noexcept = default;

	[[gnu::pure]]
	ExecStatusType GetStatus() const noexcept {
		return result.GetStatus();
	}

	/**
	 * Returns the SQLSTATE code or nullptr.
	 */
	[[gnu::pure]]
	const char *GetType() const noexcept {
		return result.GetErrorField(PG_DIAG_SQLSTATE);
	}

	const char *what() const noexcept override {
		return message.c_str();
	}
};

} // namespace Pg
