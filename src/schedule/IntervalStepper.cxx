// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "IntervalStepper.hxx"
#include "time/Math.hxx"

#include <stdexcept>

#include <limits.h>
#include <string.h>
#include <strings.h>

int
GetMaxInterval(IntervalUnit unit) noexcept
{
	/* leap days are ignored */
	constexpr long days = MAX_INTERVAL_YEARS * 365L;

	switch (unit) {
	case IntervalUnit::SECOND:
		/* INT_MAX seconds is about 68 years */
		return INT_MAX;

	case IntervalUnit::MINUTE:
		return days * 24 * 60;

	case IntervalUnit::HOUR:
		return days * 24;

	case IntervalUnit::DAY:
		return days;

	case IntervalUnit::WEEK:
		return days / 7;

	case IntervalUnit::MONTH:
		return MAX_INTERVAL_YEARS * 12;

	case IntervalUnit::YEAR:
		return MAX_INTERVAL_YEARS;
	}

	/* unknown units step by FALLBACK_STEP regardless of the
	   amount */
	return INT_MAX;
}

std::optional<std::chrono::seconds>
IntervalStepper::GetDuration() const noexcept
{
	switch (unit) {
	case IntervalUnit::SECOND:
		return std::chrono::seconds{amount};

	case IntervalUnit::MINUTE:
		return std::chrono::minutes{amount};

	case IntervalUnit::HOUR:
		return std::chrono::hours{amount};

	case IntervalUnit::DAY:
	case IntervalUnit::WEEK:
	case IntervalUnit::MONTH:
	case IntervalUnit::YEAR:
		return std::nullopt;
	}

	return FALLBACK_STEP;
}

ZonedTime
IntervalStepper::Step(const ZonedTime &t) const
{
	switch (unit) {
	case IntervalUnit::SECOND:
		return t + std::chrono::seconds{amount};

	case IntervalUnit::MINUTE:
		return t + std::chrono::minutes{amount};

	case IntervalUnit::HOUR:
		return t + std::chrono::hours{amount};

	case IntervalUnit::DAY:
		return AddDays(t, amount);

	case IntervalUnit::WEEK:
		return AddDays(t, amount * 7);

	case IntervalUnit::MONTH:
		return AddMonths(t, amount);

	case IntervalUnit::YEAR:
		return AddYears(t, amount);
	}

	return t + FALLBACK_STEP;
}

struct IntervalUnitName {
	const char *name;
	IntervalUnit value;
};

static constexpr IntervalUnitName interval_unit_names[] = {
	{ "second", IntervalUnit::SECOND },
	{ "minute", IntervalUnit::MINUTE },
	{ "hour", IntervalUnit::HOUR },
	{ "day", IntervalUnit::DAY },
	{ "week", IntervalUnit::WEEK },
	{ "month", IntervalUnit::MONTH },
	{ "year", IntervalUnit::YEAR },
};

IntervalUnit
ParseIntervalUnit(const char *s)
{
	for (const auto &i : interval_unit_names) {
		const size_t length = strlen(i.name);
		if (strncasecmp(s, i.name, length) == 0 &&
		    (s[length] == 0 ||
		     ((s[length] == 's' || s[length] == 'S') && s[length + 1] == 0)))
			return i.value;
	}

	throw std::runtime_error("Unknown interval unit");
}

const char *
ToString(IntervalUnit unit) noexcept
{
	for (const auto &i : interval_unit_names)
		if (i.value == unit)
			return i.name;

	return "?";
}
