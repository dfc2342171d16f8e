// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "TimeWindow.hxx"
#include "WeekdayFilter.hxx"
#include "IntervalStepper.hxx"
#include "time/Zoned.hxx"

#include <functional>
#include <optional>

class IntervalSchedule;

/**
 * Invoked at the beginning of each IntervalSchedule::Next() call.  It
 * may reconfigure the schedule with IntervalSchedule::Set().
 */
using BeforeHook = std::function<void(IntervalSchedule &schedule)>;

/**
 * Invoked with each newly calculated run time.
 */
using AfterHook = std::function<void(const ZonedTime &next)>;

/**
 * The complete configuration of an #IntervalSchedule.  All fields
 * are plain values, so a copy is independent of the original.
 */
struct ScheduleConfig {
	/**
	 * The schedule does not fire before this instant.
	 */
	std::optional<ZonedTime> start_date;

	TimeWindow window;

	WeekdayFilter weekdays;

	int interval = 0;
	IntervalUnit interval_unit = IntervalUnit::SECOND;

	bool enabled = true;

	/**
	 * true: step strictly from the query time; false: align to a
	 * grid anchored at the window start.
	 */
	bool precision = true;

	/**
	 * The result of the previous calculation, or a manually set
	 * override.  As long as it lies in the future, it is returned
	 * without recalculation.
	 */
	std::optional<ZonedTime> next_run;

	BeforeHook before_hook;
	AfterHook after_hook;

	IntervalStepper GetStepper() const noexcept {
		return {interval, interval_unit};
	}
};
