// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Option.hxx"

#include <memory>
#include <vector>

class IntervalSchedule;
class TextFile;

/**
 * A schedule described by a text file.
 */
struct ScheduleFileConfig {
	/**
	 * The "interval" setting; 0 if it was not specified.
	 */
	int interval = 0;

	IntervalUnit unit = IntervalUnit::SECOND;

	/**
	 * All other settings, in the order they appeared.
	 */
	std::vector<ScheduleOption> options;

	/**
	 * Throws std::runtime_error if a mandatory setting is missing.
	 */
	void Check() const;

	/**
	 * Construct the schedule.  Throws #ScheduleConfigError if the
	 * settings are inconsistent.
	 */
	std::unique_ptr<IntervalSchedule> MakeSchedule() const;
};

/**
 * Parse one line of a schedule file into @a config.  Empty lines and
 * comments are ignored.  The line buffer is modified.
 *
 * Throws std::runtime_error on error.
 */
void
ParseScheduleLine(ScheduleFileConfig &config, char *line);

/**
 * Load and parse a schedule file.  Throws an exception on error; the
 * file name and line number are attached as a nested exception.
 */
ScheduleFileConfig
LoadScheduleFile(TextFile &file);

ScheduleFileConfig
LoadScheduleFile(const char *path);
