// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <libpq-fe.h>

#include <cassert>
#include <cstdlib>
#include <string>
#include <utility>

namespace Pg {

/**
 * A thin C++ wrapper for a PGresult pointer.
 */
class Result {
	PGresult *result = nullptr;

public:
	Result() = default;
	explicit Result(PGresult *_result) noexcept:result(_result) {}

	Result(Result &&other) noexcept
		:result(std::exchange(other.result, nullptr)) {}

	~Result() noexcept {
		if (result != nullptr)
			::PQclear(result);
	}

	Result &operator=(Result &&other) noexcept {
		using std::swap;
		swap(result, other.result);
		return *this;
	}

	bool IsDefined() const noexcept {
		return result != nullptr;
	}

	[[gnu::pure]]
	ExecStatusType GetStatus() const noexcept {
		assert(IsDefined());

		return ::PQresultStatus(result);
	}

	[[gnu::pure]]
	bool IsCommandSuccessful() const noexcept {
		return GetStatus() == PGRES_COMMAND_OK;
	}

	[[gnu::pure]]
	bool IsQuerySuccessful() const noexcept {
		return GetStatus() == PGRES_TUPLES_OK;
	}

	[[gnu::pure]]
	bool IsError() const noexcept {
		const auto status = GetStatus();
		return status == PGRES_BAD_RESPONSE ||
			status == PGRES_NONFATAL_ERROR ||
			status == PGRES_FATAL_ERROR;
	}

	[[gnu::pure]]
	const char *GetErrorMessage() const noexcept {
		assert(IsDefined());

		return ::PQresultErrorMessage(result);
	}

	[[gnu::pure]]
	const char *GetErrorField(int fieldcode) const noexcept {
		assert(IsDefined());

		return ::PQresultErrorField(result, fieldcode);
	}

	/**
	 * Returns the number of rows that were affected by the command.
	 * The caller is responsible for checking GetStatus().
	 */
	[[gnu::pure]]
	unsigned GetAffectedRows() const noexcept {
		assert(IsDefined());
		assert(IsCommandSuccessful() || IsQuerySuccessful());

		return std::strtoul(::PQcmdTuples(result), nullptr, 10);
	}

	[[gnu::pure]]
	unsigned GetRowCount() const noexcept {
		assert(IsDefined());

		return ::PQntuples(result);
	}

	[[gnu::pure]]
	bool IsEmpty() const noexcept {
		return GetRowCount() == 0;
	}

	[[gnu::pure]]
	unsigned GetColumnCount() const noexcept {
		assert(IsDefined());

		return ::PQnfields(result);
	}

	[[gnu::pure]]
	const char *GetValue(unsigned row, unsigned column) const noexcept {
		assert(IsDefined());

		return ::PQgetvalue(result, row, column);
	}

	[[gnu::pure]]
	bool IsValueNull(unsigned row, unsigned column) const noexcept {
		assert(IsDefined());

		return ::PQgetisnull(result, row, column);
	}

	/**
	 * Returns the value as a string; an empty string for NULL or
	 * if there is no row.
	 */
	[[gnu::pure]]
	std::string GetOnlyStringChecked() const noexcept;

	/**
	 * Iterate over all rows.
	 */
	class RowIterator {
		const PGresult *result;
		unsigned row;

	public:
		constexpr RowIterator(const PGresult *_result,
				      unsigned _row) noexcept
			:result(_result), row(_row) {}

		constexpr bool operator==(const RowIterator &other) const noexcept {
			return row == other.row;
		}

		constexpr RowIterator &operator++() noexcept {
			++row;
			return *this;
		}

		constexpr const RowIterator &operator*() const noexcept {
			return *this;
		}

		[[gnu::pure]]
		const char *GetValue(unsigned column) const noexcept {
			return ::PQgetvalue(result, row, column);
		}

		[[gnu::pure]]
		bool IsValueNull(unsigned column) const noexcept {
			return ::PQgetisnull(result, row, column);
		}
	};

	RowIterator begin() const noexcept {
		return {result, 0};
	}

	RowIterator end() const noexcept {
		return {result, GetRowCount()};
	}
};

} // namespace Pg
