// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "time/TimeOfDay.hxx"
#include "time/Zoned.hxx"

#include <bitset>
#include <initializer_list>
#include <optional>

/**
 * Days of the week, numbered like "struct tm" tm_wday.
 */
enum class Weekday : unsigned {
	SUNDAY,
	MONDAY,
	TUESDAY,
	WEDNESDAY,
	THURSDAY,
	FRIDAY,
	SATURDAY,
};

/**
 * A set of weekdays; bit 0 is Sunday.
 */
class WeekdaySet {
	std::bitset<7> b;

public:
	constexpr WeekdaySet() noexcept = default;

	WeekdaySet(std::initializer_list<Weekday> days) noexcept {
		for (const auto day : days)
			Add(day);
	}

	bool operator==(const WeekdaySet &other) const noexcept = default;

	std::size_t count() const noexcept {
		return b.count();
	}

	bool empty() const noexcept {
		return b.none();
	}

	bool Contains(unsigned tm_wday) const noexcept {
		return tm_wday < b.size() && b[tm_wday];
	}

	bool Contains(Weekday day) const noexcept {
		return Contains(static_cast<unsigned>(day));
	}

	WeekdaySet &Add(Weekday day) noexcept {
		b.set(static_cast<unsigned>(day));
		return *this;
	}
};

/**
 * An optional restriction of the weekdays a schedule may fire on.
 * Without a restriction, all seven days are allowed.
 */
class WeekdayFilter {
	std::optional<WeekdaySet> allowed;

public:
	/**
	 * The maximum number of days Advance() looks at.
	 */
	static constexpr unsigned MAX_SEARCH_DAYS = 14;

	WeekdayFilter() noexcept = default;

	explicit WeekdayFilter(WeekdaySet _allowed) noexcept
		:allowed(_allowed) {}

	bool operator==(const WeekdayFilter &other) const noexcept = default;

	bool IsRestricted() const noexcept {
		return allowed.has_value();
	}

	/**
	 * Is a restriction present which admits no day at all?
	 */
	bool IsEmpty() const noexcept {
		return allowed && allowed->empty();
	}

	[[gnu::pure]]
	bool Allows(Weekday day) const noexcept {
		return !allowed || allowed->Contains(day);
	}

	/**
	 * Is the day of @a t (in its own offset) allowed?
	 */
	[[gnu::pure]]
	bool Allows(const ZonedTime &t) const;

	/**
	 * Find the first allowed day, beginning with the day of @a from
	 * itself, looking at most #MAX_SEARCH_DAYS days ahead.
	 *
	 * If @a time_of_day is given, the result is at that wall-clock
	 * time.  Otherwise it is @a from if its day is allowed, or the
	 * midnight which starts the allowed day.
	 *
	 * @return the result, or @a from unchanged if there is no
	 * restriction or if no allowed day was found
	 */
	ZonedTime Advance(const ZonedTime &from,
			  const std::optional<TimeOfDay> &time_of_day) const;
};

/**
 * Parse an English weekday name, either abbreviated ("mon") or
 * complete ("monday"), case insensitive.
 *
 * Throws std::runtime_error on error.
 */
Weekday
ParseWeekday(const char *s);
