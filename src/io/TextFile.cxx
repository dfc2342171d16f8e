// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TextFile.hxx"

#include <fmt/core.h>

#include <stdexcept>
#include <system_error>

#include <errno.h>
#include <string.h>

static FILE *
OpenReadOnly(const char *path)
{
	FILE *file = fopen(path, "r");
	if (file == nullptr)
		throw std::system_error(errno, std::system_category(),
					fmt::format("Failed to open {}", path));

	return file;
}

TextFile::TextFile(const char *_path)
	:path(_path), file(OpenReadOnly(_path))
{
}

char *
TextFile::ReadLine()
{
	if (fgets(buffer, sizeof(buffer), file) == nullptr) {
		if (ferror(file))
			throw std::system_error(errno, std::system_category(),
						fmt::format("Failed to read {}", path));

		return nullptr;
	}

	++no;

	size_t length = strlen(buffer);
	if (length > 0 && buffer[length - 1] == '\n')
		buffer[--length] = 0;
	else if (!feof(file))
		throw std::runtime_error(fmt::format("Line {} is too long", no));

	if (length > 0 && buffer[length - 1] == '\r')
		buffer[--length] = 0;

	return buffer;
}
