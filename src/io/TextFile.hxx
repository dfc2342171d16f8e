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
	 * Throws std::system_error if the file cannot be opened.
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
	 * Read the next line, without the trailing newline.
	 *
	 * Throws on I/O error or if the line is too long.
	 *
	 * @return the line (valid until the next call) or nullptr at
	 * the end of the file
	 */
	char *ReadLine();
};
