// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "time/Zoned.hxx"

#include <optional>

struct CommandLine {
	const char *schedule_path = nullptr;

	/**
	 * How many run times shall be printed?
	 */
	unsigned count = 5;

	/**
	 * The time to start from; the current time if not specified.
	 */
	std::optional<ZonedTime> now;
};

/**
 * Read options from the command line.  Exits the process on usage
 * errors.
 */
CommandLine
ParseCommandLine(int argc, char **argv);
