// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Validate.hxx"
#include "Config.hxx"

static constexpr bool
IsMultiDayUnit(IntervalUnit unit) noexcept
{
	return unit == IntervalUnit::WEEK || unit == IntervalUnit::MONTH ||
		unit == IntervalUnit::YEAR;
}

ScheduleError
Validate(const ScheduleConfig &config) noexcept
{
	if (config.interval < 1 ||
	    config.interval > GetMaxInterval(config.interval_unit))
		return ScheduleError::INVALID_INTERVAL;

	if (!config.window.IsValid())
		return ScheduleError::INVALID_TIME_WINDOW;

	if (config.weekdays.IsEmpty())
		return ScheduleError::EMPTY_WEEKDAY_SET;

	if (config.weekdays.IsRestricted() && IsMultiDayUnit(config.interval_unit))
		return ScheduleError::INCOMPATIBLE_WEEKDAY_FILTER;

	return ScheduleError::NONE;
}

void
CheckScheduleConfig(const ScheduleConfig &config)
{
	const auto error = Validate(config);
	if (error != ScheduleError::NONE)
		throw ScheduleConfigError(error);
}
