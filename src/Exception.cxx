// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Exception.hxx"

#include <fmt/core.h>

#include <stdio.h>

static void
AppendNested(std::string &result, const std::exception &e,
	     const char *separator) noexcept
{
	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception &nested) {
		result += separator;
		result += nested.what();
		AppendNested(result, nested, separator);
	} catch (const char *msg) {
		result += separator;
		result += msg;
	} catch (...) {
		result += separator;
		result += "Unrecognized nested exception";
	}
}

std::string
GetFullMessage(std::exception_ptr ep,
	       const char *fallback, const char *separator) noexcept
{
	if (!ep)
		return fallback;

	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		std::string result = e.what();
		AppendNested(result, e, separator);
		return result;
	} catch (const char *msg) {
		return msg;
	} catch (...) {
		return fallback;
	}
}

void
PrintException(std::exception_ptr ep) noexcept
{
	fmt::print(stderr, "{}\n", GetFullMessage(ep));
}
