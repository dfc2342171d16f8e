// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Option.hxx"

ScheduleOption
SetStartTime(std::optional<TimeOfDay> t)
{
	return [t](ScheduleConfig &config){
		config.window.start = t;
	};
}

ScheduleOption
SetEndTime(std::optional<TimeOfDay> t)
{
	return [t](ScheduleConfig &config){
		config.window.end = t;
	};
}

ScheduleOption
SetStartDate(std::optional<ZonedTime> t)
{
	return [t](ScheduleConfig &config){
		config.start_date = t;
	};
}

ScheduleOption
SetAllowedWeekdays(WeekdaySet days)
{
	return [days](ScheduleConfig &config){
		config.weekdays = WeekdayFilter{days};
	};
}

ScheduleOption
SetInterval(int interval)
{
	return [interval](ScheduleConfig &config){
		config.interval = interval;
	};
}

ScheduleOption
SetIntervalUnit(IntervalUnit unit)
{
	return [unit](ScheduleConfig &config){
		config.interval_unit = unit;
	};
}

ScheduleOption
SetBeforeHook(BeforeHook hook)
{
	return [hook = std::move(hook)](ScheduleConfig &config){
		config.before_hook = hook;
	};
}

ScheduleOption
SetAfterHook(AfterHook hook)
{
	return [hook = std::move(hook)](ScheduleConfig &config){
		config.after_hook = hook;
	};
}

ScheduleOption
Enable()
{
	return [](ScheduleConfig &config){
		config.enabled = true;
	};
}

ScheduleOption
Disable()
{
	return [](ScheduleConfig &config){
		config.enabled = false;
	};
}

ScheduleOption
EnablePrecision()
{
	return [](ScheduleConfig &config){
		config.precision = true;
	};
}

ScheduleOption
DisablePrecision()
{
	return [](ScheduleConfig &config){
		config.precision = false;
	};
}

ScheduleOption
SetNextRun(std::optional<ZonedTime> t)
{
	return [t](ScheduleConfig &config){
		config.next_run = t;
	};
}
