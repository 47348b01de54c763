// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Array.hxx"

#include <stdexcept>

#include <string.h>

namespace Pg {

std::vector<std::string>
DecodeArray(const char *p)
{
	std::vector<std::string> dest;

	if (p == nullptr || *p == 0)
		return dest;

	if (*p != '{')
		throw std::invalid_argument("'{' expected");

	if (p[1] == '}' && p[2] == 0)
		/* special case: empty array */
		return dest;

	do {
		++p;

		if (*p == '"') {
			++p;

			std::string value;

			while (*p != '"') {
				if (*p == '\\') {
					++p;

					if (*p == 0)
						throw std::invalid_argument("Backslash at end of string");

					value.push_back(*p++);
				} else if (*p == 0) {
					throw std::invalid_argument("Missing closing quote");
				} else {
					value.push_back(*p++);
				}
			}

			++p;

			if (*p != '}' && *p != ',')
				throw std::invalid_argument("'}' or ',' expected");

			dest.emplace_back(std::move(value));
		} else if (*p == 0) {
			throw std::invalid_argument("Unexpected end of array");
		} else if (*p == '{') {
			throw std::invalid_argument("Nested arrays not supported");
		} else {
			const char *end = strchr(p, ',');
			if (end == nullptr) {
				end = strchr(p, '}');
				if (end == nullptr)
					throw std::invalid_argument("'}' expected");
			}

			dest.emplace_back(p, end);

			p = end;
		}
	} while (*p == ',');

	if (*p != '}')
		throw std::invalid_argument("'}' expected");

	++p;

	if (*p != 0)
		throw std::invalid_argument("Garbage after '}'");

	return dest;
}

std::string
EncodeArray(const std::vector<std::string> &src) noexcept
{
	if (src.empty())
		return "{}";

	std::string dest("{");

	bool first = true;
	for (const auto &i : src) {
		if (first)
			first = false;
		else
			dest.push_back(',');

		dest.push_back('"');

		for (const auto ch : i) {
			if (ch == '\\' || ch == '"')
				dest.push_back('\\');
			dest.push_back(ch);
		}

		dest.push_back('"');
	}

	dest.push_back('}');
	return dest;
}

} // namespace Pg
