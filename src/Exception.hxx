// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/format.h>

#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <errno.h>

[[nodiscard]]
inline std::system_error
MakeErrno(int code, const char *msg) noexcept
{
	return std::system_error(code, std::system_category(), msg);
}

[[nodiscard]]
inline std::system_error
MakeErrno(const char *msg) noexcept
{
	return MakeErrno(errno, msg);
}

template<typename... Args>
[[nodiscard]]
inline std::runtime_error
FmtRuntimeError(fmt::format_string<Args...> format_str, Args&&... args)
{
	return std::runtime_error(fmt::format(format_str,
					      std::forward<Args>(args)...));
}

template<typename... Args>
[[nodiscard]]
inline std::system_error
FmtErrno(int code, fmt::format_string<Args...> format_str, Args&&... args)
{
	return std::system_error(code, std::system_category(),
				 fmt::format(format_str,
					     std::forward<Args>(args)...));
}

/**
 * Obtain the full concatenated message of an exception and its
 * nested chain.
 */
[[gnu::pure]]
std::string
GetFullMessage(std::exception_ptr ep,
	       const char *fallback="Unknown exception",
	       const char *separator="; ") noexcept;

/**
 * Print the full message of the exception to stderr.
 */
void
PrintException(std::exception_ptr ep) noexcept;
