// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace Pg {

/**
 * Convert a C++ value to a text query parameter.  Specializations
 * exist for all supported types.
 */
template<typename T>
struct ParamWrapper {
	ParamWrapper(const T &t) noexcept;
	const char *GetValue() const noexcept;
};

template<>
struct ParamWrapper<const char *> {
	const char *value;

	/**
	 * A nullptr becomes SQL NULL.
	 */
	constexpr ParamWrapper(const char *_value) noexcept:value(_value) {}

	constexpr const char *GetValue() const noexcept {
		return value;
	}
};

template<>
struct ParamWrapper<std::string> {
	const std::string &value;

	constexpr ParamWrapper(const std::string &_value) noexcept
		:value(_value) {}

	const char *GetValue() const noexcept {
		return value.c_str();
	}
};

/**
 * Formats an integer into an internal buffer.
 */
template<typename T>
struct IntegerParamWrapper {
	char buffer[24];

	IntegerParamWrapper(T i) noexcept {
		*fmt::format_to_n(buffer, sizeof(buffer) - 1, "{}", i).out = 0;
	}

	const char *GetValue() const noexcept {
		return buffer;
	}
};

template<>
struct ParamWrapper<int> : IntegerParamWrapper<int> {
	using IntegerParamWrapper::IntegerParamWrapper;
};

template<>
struct ParamWrapper<unsigned> : IntegerParamWrapper<unsigned> {
	using IntegerParamWrapper::IntegerParamWrapper;
};

template<>
struct ParamWrapper<long> : IntegerParamWrapper<long> {
	using IntegerParamWrapper::IntegerParamWrapper;
};

template<>
struct ParamWrapper<unsigned long> : IntegerParamWrapper<unsigned long> {
	using IntegerParamWrapper::IntegerParamWrapper;
};

template<>
struct ParamWrapper<long long> : IntegerParamWrapper<long long> {
	using IntegerParamWrapper::IntegerParamWrapper;
};

template<>
struct ParamWrapper<unsigned long long> : IntegerParamWrapper<unsigned long long> {
	using IntegerParamWrapper::IntegerParamWrapper;
};

template<>
struct ParamWrapper<bool> {
	const char *value;

	constexpr ParamWrapper(bool _value) noexcept
		:value(_value ? "t" : "f") {}

	constexpr const char *GetValue() const noexcept {
		return value;
	}
};

} // namespace Pg
