// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "WeekdayFilter.hxx"
#include "time/Math.hxx"

#include <stdexcept>

#include <strings.h>

struct WeekdayName {
	const char *abbreviation, *name;
	Weekday value;
};

static constexpr WeekdayName weekday_names[] = {
	{ "sun", "sunday", Weekday::SUNDAY },
	{ "mon", "monday", Weekday::MONDAY },
	{ "tue", "tuesday", Weekday::TUESDAY },
	{ "wed", "wednesday", Weekday::WEDNESDAY },
	{ "thu", "thursday", Weekday::THURSDAY },
	{ "fri", "friday", Weekday::FRIDAY },
	{ "sat", "saturday", Weekday::SATURDAY },
};

Weekday
ParseWeekday(const char *s)
{
	for (const auto &i : weekday_names)
		if (strcasecmp(s, i.abbreviation) == 0 ||
		    strcasecmp(s, i.name) == 0)
			return i.value;

	throw std::runtime_error("Unknown weekday name");
}

bool
WeekdayFilter::Allows(const ZonedTime &t) const
{
	return !allowed || allowed->Contains(GetWeekday(t));
}

ZonedTime
WeekdayFilter::Advance(const ZonedTime &from,
		       const std::optional<TimeOfDay> &time_of_day) const
{
	if (!allowed)
		return from;

	ZonedTime current = from;

	for (unsigned i = 0; i < MAX_SEARCH_DAYS; ++i) {
		if (Allows(current))
			return time_of_day
				? WithTimeOfDay(current, *time_of_day)
				: current;

		current = AddDays(current, 1);
		current = time_of_day
			? WithTimeOfDay(current, *time_of_day)
			: StartOfDay(current);
	}

	/* only reachable with an empty set, which Validate()
	   rejects */
	return from;
}
