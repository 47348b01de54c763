// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdexcept>

/**
 * Split one line of a configuration file into words and values.
 * Values may be quoted with double quotes; a '#' outside of quotes
 * starts a comment.  The parser modifies the line buffer in place.
 */
class LineParser {
	char *p;

public:
	class Error : public std::runtime_error {
	public:
		using std::runtime_error::runtime_error;
	};

	explicit LineParser(char *line) noexcept
		:p(line)
	{
		Strip();
	}

	char front() const noexcept {
		return *p;
	}

	/**
	 * Is this the end of the line (or the beginning of a
	 * comment)?
	 */
	bool IsEnd() const noexcept {
		return *p == 0 || *p == '#';
	}

	void ExpectEnd();

	/**
	 * Expect a word consisting of letters, digits and
	 * underscores.
	 */
	const char *ExpectWord();

	/**
	 * Expect a quoted or an unquoted value.
	 */
	const char *ExpectValue();

	const char *ExpectValueAndEnd() {
		const char *value = ExpectValue();
		ExpectEnd();
		return value;
	}

private:
	void Strip() noexcept;
	const char *ExpectQuoted();
};
