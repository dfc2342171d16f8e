// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Schedule.hxx"
#include "NextRun.hxx"
#include "Validate.hxx"
#include "time/ISO8601.hxx"

static ScheduleConfig
MakeScheduleConfig(int interval, IntervalUnit unit,
		   std::span<const ScheduleOption> options)
{
	ScheduleConfig config;
	config.interval = interval;
	config.interval_unit = unit;

	for (const auto &option : options)
		option(config);

	CheckScheduleConfig(config);
	return config;
}

IntervalSchedule::IntervalSchedule(int interval, IntervalUnit unit,
				   std::span<const ScheduleOption> options)
	:logger("schedule"),
	 config(MakeScheduleConfig(interval, unit, options))
{
}

void
IntervalSchedule::Set(std::span<const ScheduleOption> options)
{
	const std::scoped_lock lock{mutex};

	ScheduleConfig candidate = config;
	for (const auto &option : options)
		option(candidate);

	CheckScheduleConfig(candidate);

	config = std::move(candidate);
}

ScheduleConfig
IntervalSchedule::GetConfig() const
{
	const std::scoped_lock lock{mutex};
	return config;
}

void
IntervalSchedule::InvokeBeforeHook()
{
	/* copy the hook, because it may replace itself with Set() */
	const auto hook = config.before_hook;
	if (!hook)
		return;

	try {
		hook(*this);
	} catch (...) {
		logger.Exception(2, "Before-hook failed",
				 std::current_exception());
	}
}

void
IntervalSchedule::InvokeAfterHook(const ZonedTime &next)
{
	const auto hook = config.after_hook;
	if (!hook)
		return;

	try {
		hook(next);
	} catch (...) {
		logger.Exception(2, "After-hook failed",
				 std::current_exception());
	}
}

ZonedTime
IntervalSchedule::Next(const ZonedTime &now)
{
	const std::scoped_lock lock{mutex};

	InvokeBeforeHook();

	if (!config.enabled)
		return now + DISABLED_POLL_INTERVAL;

	if (config.next_run && *config.next_run > now)
		return *config.next_run;

	const auto next = CalculateNextRun(config, now);

	if (Logger::CheckLevel(4))
		logger.Fmt(4, "next run after {} is {}",
			   FormatISO8601(now), FormatISO8601(next));

	InvokeAfterHook(next);

	config.next_run = next;
	return next;
}
