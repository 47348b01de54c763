// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Exception.hxx"

#include <fmt/format.h>

#include <exception>

template<>
struct fmt::formatter<std::exception_ptr> : formatter<string_view>
{
	template<typename FormatContext>
	auto format(std::exception_ptr e, FormatContext &ctx) const {
		return formatter<string_view>::format(GetFullMessage(e), ctx);
	}
};
