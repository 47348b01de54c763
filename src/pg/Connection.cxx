// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Connection.hxx"
#include "Error.hxx"
#include "Exception.hxx"

#include <new>

#include <string.h>

namespace Pg {

void
Connection::Connect(const char *conninfo)
{
	assert(!IsDefined());

	conn = ::PQconnectdb(conninfo);
	if (conn == nullptr)
		throw std::bad_alloc();

	if (GetStatus() != CONNECTION_OK) {
		std::string msg = GetErrorMessage();
		while (!msg.empty() && msg.back() == '\n')
			msg.pop_back();

		Disconnect();
		throw FmtRuntimeError("Failed to connect to database: {}",
				      msg);
	}
}

void
Connection::SetSchema(const char *schema)
{
	const std::string sql = "SET SCHEMA '" + Escape(schema) + "'";
	Execute(sql.c_str());
}

Result
Connection::CheckResult(PGresult *result)
{
	if (result == nullptr)
		throw std::bad_alloc();

	Result r{result};
	if (r.IsError())
		throw Error(std::move(r));

	return r;
}

Result
Connection::Execute(const char *query)
{
	assert(IsDefined());
	assert(query != nullptr);

	return CheckResult(::PQexec(conn, query));
}

Result
Connection::ExecuteValues(const char *query, std::size_t n,
			  const char *const*values)
{
	return CheckResult(::PQexecParams(conn, query, int(n),
					  nullptr, values, nullptr, nullptr,
					  0));
}

std::string
Connection::Escape(const char *p, std::size_t length) const
{
	assert(p != nullptr || length == 0);

	std::string result;
	result.resize(length * 2 + 1);

	const std::size_t n = ::PQescapeStringConn(conn, result.data(),
						   p, length, nullptr);
	result.resize(n);
	return result;
}

std::string
Connection::Escape(const char *p) const
{
	assert(p != nullptr);

	return Escape(p, strlen(p));
}

} // namespace Pg
