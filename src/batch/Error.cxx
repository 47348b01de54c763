// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"

const char *
ToString(BatchErrorCode code) noexcept
{
	switch (code) {
	case BatchErrorCode::NOT_FOUND:
		return "not found";

	case BatchErrorCode::VALIDATION:
		return "validation failed";

	case BatchErrorCode::CONFLICT:
		return "conflict";

	case BatchErrorCode::LAUNCH:
		return "launch failed";

	case BatchErrorCode::STORAGE:
		return "storage failure";

	case BatchErrorCode::CONFIG:
		return "configuration error";
	}

	return "unknown";
}
