// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"

#include <fmt/core.h>

#include <atomic>

#include <stdio.h>

static std::atomic_uint log_level{1};

void
SetLogLevel(unsigned level) noexcept
{
	log_level.store(level, std::memory_order_relaxed);
}

unsigned
GetLogLevel() noexcept
{
	return log_level.load(std::memory_order_relaxed);
}

void
LogMessage(std::string_view domain, std::string_view message) noexcept
{
	if (domain.empty())
		fmt::print(stderr, "{}\n", message);
	else
		fmt::print(stderr, "[{}] {}\n", domain, message);
}
