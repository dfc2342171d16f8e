// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"

const char *
ToString(ScheduleError error) noexcept
{
	switch (error) {
	case ScheduleError::NONE:
		return "No error";

	case ScheduleError::INVALID_INTERVAL:
		return "Invalid interval; must be at least 1 and span at most 100 years";

	case ScheduleError::INVALID_TIME_WINDOW:
		return "Invalid time window; start time must be before end time";

	case ScheduleError::EMPTY_WEEKDAY_SET:
		return "Weekday restriction does not allow any day";

	case ScheduleError::INCOMPATIBLE_WEEKDAY_FILTER:
		return "Weekday restriction cannot be combined with week, month or year intervals";
	}

	return "Unknown error";
}
