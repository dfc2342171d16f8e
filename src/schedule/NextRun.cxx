// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "NextRun.hxx"
#include "Config.hxx"
#include "time/Math.hxx"

#include <cassert>

/**
 * The window start on the next allowed day after the day of
 * @a today_start.
 */
static ZonedTime
NextAllowedWindowStart(const ScheduleConfig &config,
		       const ZonedTime &today_start)
{
	return config.weekdays.Advance(AddDays(today_start, 1),
				       config.window.start);
}

static ZonedTime
CalculatePrecise(const ScheduleConfig &config, const ZonedTime &now,
		 const ZonedTime &today_start, const ZonedTime &today_end)
{
	if (now < today_start)
		return today_start;

	if (now > today_end)
		return NextAllowedWindowStart(config, today_start);

	const auto next = config.GetStepper().Step(now);
	if (next > today_end)
		return NextAllowedWindowStart(config, today_start);

	return next;
}

/**
 * Align to the grid of intervals anchored at the window start.
 */
static ZonedTime
CalculateAligned(const ScheduleConfig &config, const ZonedTime &now,
		 const ZonedTime &today_start, const ZonedTime &today_end)
{
	const auto stepper = config.GetStepper();

	auto next = today_start;

	if (const auto step = stepper.GetDuration(); step && next <= now) {
		/* fixed-size steps: jump directly to the first grid point
		   after "now" */
		const auto n = (now.time - next.time) / *step + 1;
		next = next + *step * n;
	}

	while (next <= now)
		next = stepper.Step(next);

	if (StartOfDay(next) != StartOfDay(now)) {
		/* the grid has left today: keep the grid point if it
		   is inside the window of an allowed day */
		if (!config.weekdays.Allows(next))
			return config.weekdays.Advance(next, config.window.start);

		const auto opens = config.window.OpensOn(next);
		if (next < opens)
			return opens;

		if (next > config.window.ClosesOn(next))
			return NextAllowedWindowStart(config, opens);

		return next;
	}

	if (next > today_end)
		return NextAllowedWindowStart(config, today_start);

	return next;
}

static ZonedTime
CalculateInWindow(const ScheduleConfig &config, const ZonedTime &now)
{
	assert(config.window.IsDefined());

	const auto today_start = config.window.OpensOn(now);
	const auto today_end = config.window.ClosesOn(now);

	if (!config.weekdays.Allows(now))
		return NextAllowedWindowStart(config, today_start);

	return config.precision
		? CalculatePrecise(config, now, today_start, today_end)
		: CalculateAligned(config, now, today_start, today_end);
}

ZonedTime
CalculateNextRun(const ScheduleConfig &config, const ZonedTime &now)
{
	if (config.start_date && now < *config.start_date) {
		const auto &start_date = *config.start_date;

		if (config.window.start)
			return WithTimeOfDay(start_date, *config.window.start,
					     now.utc_offset);

		return start_date.In(now.utc_offset);
	}

	if (config.window.IsDefined())
		return CalculateInWindow(config, now);

	const auto next = config.GetStepper().Step(now);

	/* the step may have crossed into a day which is not allowed
	   (the search returns "next" unchanged if its day is
	   allowed) */
	return config.weekdays.Advance(next, std::nullopt);
}
