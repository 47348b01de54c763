// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LineParser.hxx"

static constexpr bool
IsWhitespace(char ch) noexcept
{
	return ch == ' ' || ch == '\t';
}

static constexpr bool
IsWordChar(char ch) noexcept
{
	return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
		(ch >= '0' && ch <= '9') || ch == '_';
}

void
LineParser::Strip() noexcept
{
	while (IsWhitespace(*p))
		++p;
}

void
LineParser::ExpectEnd()
{
	if (!IsEnd())
		throw Error("Unexpected tokens at end of line");
}

const char *
LineParser::ExpectWord()
{
	const char *result = p;
	while (IsWordChar(*p))
		++p;

	if (p == result)
		throw Error("Word expected");

	if (*p != 0) {
		if (!IsWhitespace(*p))
			throw Error("Whitespace expected");

		*p++ = 0;
		Strip();
	}

	return result;
}

const char *
LineParser::ExpectQuoted()
{
	++p;

	char *const result = p;
	char *dest = p;

	while (true) {
		char ch = *p++;
		if (ch == 0)
			throw Error("Missing closing quote");

		if (ch == '"')
			break;

		if (ch == '\\') {
			ch = *p++;
			if (ch == 0)
				throw Error("Missing closing quote");
		}

		*dest++ = ch;
	}

	if (*p != 0 && !IsWhitespace(*p))
		throw Error("Whitespace expected after closing quote");

	*dest = 0;
	Strip();
	return result;
}

const char *
LineParser::ExpectValue()
{
	if (*p == '"')
		return ExpectQuoted();

	if (IsEnd())
		throw Error("Value expected");

	const char *result = p;
	while (*p != 0 && !IsWhitespace(*p))
		++p;

	if (*p != 0) {
		*p++ = 0;
		Strip();
	}

	return result;
}
