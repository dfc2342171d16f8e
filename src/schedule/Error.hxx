// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdexcept>

/**
 * The kinds of configuration errors detected by Validate().
 */
enum class ScheduleError {
	NONE,

	/**
	 * The interval is less than 1 or longer than
	 * #MAX_INTERVAL_YEARS.
	 */
	INVALID_INTERVAL,

	/**
	 * The daily window does not start before it ends.
	 */
	INVALID_TIME_WINDOW,

	/**
	 * A weekday restriction is present, but admits no day.
	 */
	EMPTY_WEEKDAY_SET,

	/**
	 * A weekday restriction was combined with a week, month or year
	 * interval; stepping by whole weeks/months/years and skipping
	 * days do not mix.
	 */
	INCOMPATIBLE_WEEKDAY_FILTER,
};

[[gnu::const]]
const char *
ToString(ScheduleError error) noexcept;

/**
 * Thrown by #IntervalSchedule if a configuration is rejected.
 */
class ScheduleConfigError : public std::runtime_error {
	ScheduleError code;

public:
	explicit ScheduleConfigError(ScheduleError _code)
		:std::runtime_error(ToString(_code)), code(_code) {}

	ScheduleError GetCode() const noexcept {
		return code;
	}
};
