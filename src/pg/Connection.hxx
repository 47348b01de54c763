// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "ParamWrapper.hxx"
#include "Result.hxx"

#include <libpq-fe.h>

#include <cassert>
#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>

namespace Pg {

/**
 * A thin C++ wrapper for a PGconn pointer.  All query methods throw
 * #Pg::Error if the server reports an error.
 */
class Connection {
	PGconn *conn = nullptr;

public:
	Connection() = default;

	Connection(Connection &&other) noexcept
		:conn(std::exchange(other.conn, nullptr)) {}

	Connection &operator=(Connection &&other) noexcept {
		using std::swap;
		swap(conn, other.conn);
		return *this;
	}

	~Connection() noexcept {
		Disconnect();
	}

	bool IsDefined() const noexcept {
		return conn != nullptr;
	}

	[[gnu::pure]]
	ConnStatusType GetStatus() const noexcept {
		assert(IsDefined());

		return ::PQstatus(conn);
	}

	[[gnu::pure]]
	const char *GetErrorMessage() const noexcept {
		assert(IsDefined());

		return ::PQerrorMessage(conn);
	}

	[[gnu::pure]]
	int GetServerVersion() const noexcept {
		assert(IsDefined());

		return ::PQserverVersion(conn);
	}

	[[gnu::pure]]
	const char *GetParameterStatus(const char *name) const noexcept {
		assert(IsDefined());

		return ::PQparameterStatus(conn, name);
	}

	void Disconnect() noexcept {
		if (conn != nullptr) {
			::PQfinish(conn);
			conn = nullptr;
		}
	}

	/**
	 * Establish a connection, blocking.
	 *
	 * Throws std::runtime_error on error.
	 */
	void Connect(const char *conninfo);

	/**
	 * Throws on error.
	 */
	void SetSchema(const char *schema);

	/**
	 * Throws #Pg::Error on error.
	 */
	Result Execute(const char *query);

	/**
	 * Execute a query with text parameters; supported parameter
	 * types are those with a #ParamWrapper specialization.
	 *
	 * Throws #Pg::Error on error.
	 */
	template<typename... Params>
	Result ExecuteParams(const char *query, const Params&... params) {
		assert(IsDefined());
		assert(query != nullptr);

		constexpr std::size_t n = sizeof...(Params);
		return ExecuteWrapped(query, n,
				      ParamWrapper<std::decay_t<Params>>(params)...);
	}

	[[gnu::pure]]
	std::string Escape(const char *p, std::size_t length) const;

	[[gnu::pure]]
	std::string Escape(const char *p) const;

	[[gnu::pure]]
	std::string Escape(const std::string &p) const {
		return Escape(p.data(), p.length());
	}

private:
	/**
	 * Throws #Pg::Error if the result indicates an error.
	 */
	Result CheckResult(PGresult *result);

	Result ExecuteValues(const char *query, std::size_t n,
			     const char *const*values);

	template<typename... Wrappers>
	Result ExecuteWrapped(const char *query, std::size_t n,
			      const Wrappers&... wrappers) {
		if constexpr (sizeof...(Wrappers) == 0) {
			return ExecuteValues(query, n, nullptr);
		} else {
			const char *const values[] = {wrappers.GetValue()...};
			return ExecuteValues(query, n, values);
		}
	}
};

} // namespace Pg
