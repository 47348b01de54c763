// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "ExceptionFormatter.hxx"

#include <fmt/format.h>

#include <iterator>
#include <string>
#include <string_view>
#include <utility>

/**
 * Set the global log level: 0 means quiet, 1 is the default, and
 * bigger values make the daemon more verbose.
 */
void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
unsigned
GetLogLevel() noexcept;

[[gnu::pure]]
inline bool
CheckLogLevel(unsigned level) noexcept
{
	return level <= GetLogLevel();
}

/**
 * Write one line to the log (stderr, which is usually connected to
 * the journal).
 */
void
LogMessage(std::string_view domain, std::string_view message) noexcept;

namespace LoggerDetail {

template<typename T>
inline void
AppendArg(fmt::memory_buffer &buffer, const T &value)
{
	fmt::format_to(std::back_inserter(buffer), "{}", value);
}

inline void
AppendArg(fmt::memory_buffer &buffer, const char *value)
{
	if (value == nullptr)
		value = "(null)";

	buffer.append(std::string_view{value});
}

} // namespace LoggerDetail

/**
 * A logger with a "domain" prefix.  The call operator concatenates
 * all arguments; Fmt() uses a {fmt} format string.
 */
class Logger {
	std::string domain;

public:
	Logger() = default;

	explicit Logger(std::string_view _domain) noexcept
		:domain(_domain) {}

	Logger(const Logger &parent, std::string_view name) noexcept
		:domain(parent.domain.empty()
			? std::string{name}
			: fmt::format("{}/{}", parent.domain, name)) {}

	const std::string &GetDomain() const noexcept {
		return domain;
	}

	template<typename... Args>
	void operator()(unsigned level, Args&&... args) const noexcept {
		if (!CheckLogLevel(level))
			return;

		fmt::memory_buffer buffer;
		(LoggerDetail::AppendArg(buffer, args), ...);
		LogMessage(domain, {buffer.data(), buffer.size()});
	}

	template<typename... Args>
	void Fmt(unsigned level, fmt::format_string<Args...> format_str,
		 Args&&... args) const noexcept {
		if (!CheckLogLevel(level))
			return;

		LogMessage(domain,
			   fmt::format(format_str, std::forward<Args>(args)...));
	}
};

/**
 * The top-level logger without a domain.
 */
using RootLogger = Logger;

/**
 * A logger whose domain is appended to the parent's domain.
 */
class ChildLogger final : public Logger {
public:
	ChildLogger(const Logger &parent, std::string_view name) noexcept
		:Logger(parent, name) {}
};
