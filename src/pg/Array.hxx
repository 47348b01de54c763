// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <vector>

namespace Pg {

/**
 * Decode a PostgreSQL text array ("{a,b,\"c d\"}").  A nullptr or an
 * empty string is an empty array.
 *
 * Throws std::invalid_argument on syntax error.
 */
std::vector<std::string>
DecodeArray(const char *p);

/**
 * Encode a list of strings as a PostgreSQL text array.
 */
std::string
EncodeArray(const std::vector<std::string> &src) noexcept;

} // namespace Pg
