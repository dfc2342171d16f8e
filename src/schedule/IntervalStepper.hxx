// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "time/Zoned.hxx"

#include <chrono>
#include <optional>

enum class IntervalUnit : unsigned {
	SECOND,
	MINUTE,
	HOUR,
	DAY,
	WEEK,
	MONTH,
	YEAR,
};

/**
 * The step used for an #IntervalUnit value which is not one of the
 * enumerators.
 */
static constexpr std::chrono::minutes FALLBACK_STEP{5};

/**
 * The longest supported step.  Longer intervals cannot be
 * represented by #ZonedTime::duration.
 */
static constexpr unsigned MAX_INTERVAL_YEARS = 100;

/**
 * The largest interval amount of the given unit which does not
 * exceed #MAX_INTERVAL_YEARS.
 */
[[gnu::const]]
int
GetMaxInterval(IntervalUnit unit) noexcept;

/**
 * Advances a time by a fixed interval.  Second, minute and hour steps
 * are exact durations; day, week, month and year steps operate on
 * the calendar date in the time's own offset and keep the
 * wall-clock time.
 */
class IntervalStepper {
	int amount;
	IntervalUnit unit;

public:
	constexpr IntervalStepper(int _amount, IntervalUnit _unit) noexcept
		:amount(_amount), unit(_unit) {}

	/**
	 * The exact length of one step, or std::nullopt if the unit is
	 * a calendar unit (day and above).
	 */
	std::optional<std::chrono::seconds> GetDuration() const noexcept;

	ZonedTime Step(const ZonedTime &t) const;

	ZonedTime operator()(const ZonedTime &t) const {
		return Step(t);
	}
};

/**
 * Parse a unit name such as "minute" or "hours".
 *
 * Throws std::runtime_error on error.
 */
IntervalUnit
ParseIntervalUnit(const char *s);

[[gnu::const]]
const char *
ToString(IntervalUnit unit) noexcept;
