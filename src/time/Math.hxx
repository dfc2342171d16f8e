// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Zoned.hxx"

struct tm;
struct TimeOfDay;

/*
 * Calendar arithmetic on the wall-clock fields of a #ZonedTime.  All
 * results keep the offset of their input.  Overflowing fields are
 * normalized the way timegm() does it, so adding one month to
 * January 31st yields March 2nd or 3rd.
 */

/**
 * Obtain the wall-clock fields of the given time in its own offset.
 * The sub-second part is not included.
 */
struct tm
GetFields(const ZonedTime &t);

/**
 * The weekday of the given time (0 = Sunday) in its own offset.
 */
[[gnu::pure]]
unsigned
GetWeekday(const ZonedTime &t);

ZonedTime
AddDays(const ZonedTime &t, int days);

ZonedTime
AddMonths(const ZonedTime &t, int months);

ZonedTime
AddYears(const ZonedTime &t, int years);

/**
 * Combine the date of @a day with the given wall-clock time.
 */
ZonedTime
WithTimeOfDay(const ZonedTime &day, const TimeOfDay &time_of_day);

/**
 * Combine the calendar date of @a day (read in its own offset) with
 * the given wall-clock time, and interpret the result in another
 * offset.
 */
ZonedTime
WithTimeOfDay(const ZonedTime &day, const TimeOfDay &time_of_day,
	      std::chrono::seconds utc_offset);

/**
 * Midnight at the beginning of the day of @a t.
 */
ZonedTime
StartOfDay(const ZonedTime &t);
