// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Config.hxx"

#include <concepts>
#include <functional>
#include <optional>

/**
 * A modification of a #ScheduleConfig.  Options never fail; only the
 * resulting configuration as a whole is validated.
 */
using ScheduleOption = std::function<void(ScheduleConfig &config)>;

/**
 * Set the beginning of the daily window; std::nullopt disables the
 * window.
 */
ScheduleOption
SetStartTime(std::optional<TimeOfDay> t);

/**
 * Set the end of the daily window; std::nullopt means the end of
 * the day.
 */
ScheduleOption
SetEndTime(std::optional<TimeOfDay> t);

/**
 * The schedule will not fire before this instant; std::nullopt
 * removes the restriction.
 */
ScheduleOption
SetStartDate(std::optional<ZonedTime> t);

/**
 * Replace the weekday restriction by the given set, even if it is
 * empty (which Validate() rejects).
 */
ScheduleOption
SetAllowedWeekdays(WeekdaySet days);

/**
 * Restrict the schedule to the given weekdays.  Without arguments,
 * the restriction is removed.
 */
template<std::same_as<Weekday>... Days>
ScheduleOption
SetAllowedWeekdays(Days... days)
{
	if constexpr (sizeof...(Days) == 0)
		return [](ScheduleConfig &config){
			config.weekdays = {};
		};
	else
		return SetAllowedWeekdays(WeekdaySet{days...});
}

ScheduleOption
SetInterval(int interval);

ScheduleOption
SetIntervalUnit(IntervalUnit unit);

/**
 * An empty function removes the hook.
 */
ScheduleOption
SetBeforeHook(BeforeHook hook);

/**
 * An empty function removes the hook.
 */
ScheduleOption
SetAfterHook(AfterHook hook);

ScheduleOption
Enable();

/**
 * While disabled, IntervalSchedule::Next() returns "now" plus five
 * minutes, so the driver keeps polling.
 */
ScheduleOption
Disable();

ScheduleOption
EnablePrecision();

ScheduleOption
DisablePrecision();

/**
 * Override the cached next run time.  A time in the future pauses
 * the schedule until then; std::nullopt forces a recalculation.
 */
ScheduleOption
SetNextRun(std::optional<ZonedTime> t);
