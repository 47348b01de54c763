// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdio.h>

/**
 * Read a file line-by-line.
 */
class TextFile {
	const char *const path;
	FILE *const file;

	unsigned no = 0;

	char buffer[4096];

public:
	/**
	 * Throws std::system_error on error.
	 */
	explicit TextFile(const char *_path);

	~TextFile() noexcept {
		fclose(file);
	}

	TextFile(const TextFile &) = delete;
	TextFile &operator=(const TextFile &) = delete;

	const char *GetPath() const noexcept {
		return path;
	}

	unsigned GetLineNumber() const noexcept {
		return no;
	}

	/**
	 * Read the next line, without the trailing whitespace.
	 *
	 * @return nullptr at the end of the file
	 */
	char *ReadLine() noexcept;
};
