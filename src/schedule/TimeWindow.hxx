// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "time/TimeOfDay.hxx"
#include "time/Zoned.hxx"

#include <optional>

/**
 * An optional daily window [start, end] in wall-clock time.  The
 * window is active as soon as #start is set; without #end, it lasts
 * until the end of the day.
 */
struct TimeWindow {
	std::optional<TimeOfDay> start, end;

	constexpr bool IsDefined() const noexcept {
		return start.has_value();
	}

	/**
	 * Is this window consistent, i.e. does it begin before it ends?
	 * Only the seconds of both ends are compared.
	 */
	constexpr bool IsValid() const noexcept {
		return !start || !end ||
			start->SecondsOfDay() < end->SecondsOfDay();
	}

	/**
	 * The end of the window, with the default applied.
	 */
	constexpr TimeOfDay GetEnd() const noexcept {
		return end.value_or(TimeOfDay::EndOfDay());
	}

	/**
	 * The opening instant of the window on the day of @a day.
	 * Must only be called if IsDefined().
	 */
	ZonedTime OpensOn(const ZonedTime &day) const;

	/**
	 * The closing instant of the window on the day of @a day.
	 * Must only be called if IsDefined().
	 */
	ZonedTime ClosesOn(const ZonedTime &day) const;

	/**
	 * Is @a t inside the window of its own day (both ends
	 * included)?  Always true if no window is defined.
	 */
	[[gnu::pure]]
	bool Contains(const ZonedTime &t) const;

	constexpr bool operator==(const TimeWindow &other) const noexcept = default;
};
