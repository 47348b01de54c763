// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TextFile.hxx"
#include "Exception.hxx"

#include <errno.h>
#include <string.h>

static FILE *
OpenTextFile(const char *path)
{
	FILE *file = fopen(path, "re");
	if (file == nullptr)
		throw FmtErrno(errno, "Failed to open {}", path);

	return file;
}

TextFile::TextFile(const char *_path)
	:path(_path), file(OpenTextFile(path)) {}

char *
TextFile::ReadLine() noexcept
{
	if (fgets(buffer, sizeof(buffer), file) == nullptr)
		return nullptr;

	++no;

	char *end = buffer + strlen(buffer);
	while (end > buffer && (end[-1] == '\n' || end[-1] == '\r' ||
				end[-1] == ' ' || end[-1] == '\t'))
		--end;
	*end = 0;

	return buffer;
}
