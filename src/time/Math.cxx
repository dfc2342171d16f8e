// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Math.hxx"
#include "Convert.hxx"
#include "TimeOfDay.hxx"

#include <time.h>

/**
 * Convert (possibly denormalized) wall-clock fields back to a
 * #ZonedTime in the given offset.
 */
static ZonedTime
FromFields(struct tm &tm, std::chrono::nanoseconds sub_second,
	   std::chrono::seconds utc_offset) noexcept
{
	const auto shifted = TimeGm(tm) +
		std::chrono::duration_cast<ZonedTime::duration>(sub_second);
	return {shifted - utc_offset, utc_offset};
}

struct tm
GetFields(const ZonedTime &t)
{
	return GmTime(t.GetShifted());
}

unsigned
GetWeekday(const ZonedTime &t)
{
	return GetFields(t).tm_wday;
}

ZonedTime
AddDays(const ZonedTime &t, int days)
{
	auto tm = GetFields(t);
	tm.tm_mday += days;
	return FromFields(tm, SubSecond(t.GetShifted()), t.utc_offset);
}

ZonedTime
AddMonths(const ZonedTime &t, int months)
{
	auto tm = GetFields(t);
	tm.tm_mon += months;
	return FromFields(tm, SubSecond(t.GetShifted()), t.utc_offset);
}

ZonedTime
AddYears(const ZonedTime &t, int years)
{
	auto tm = GetFields(t);
	tm.tm_year += years;
	return FromFields(tm, SubSecond(t.GetShifted()), t.utc_offset);
}

ZonedTime
WithTimeOfDay(const ZonedTime &day, const TimeOfDay &time_of_day,
	      std::chrono::seconds utc_offset)
{
	auto tm = GetFields(day);
	tm.tm_hour = time_of_day.hour;
	tm.tm_min = time_of_day.minute;
	tm.tm_sec = time_of_day.second;
	return FromFields(tm, std::chrono::nanoseconds{time_of_day.nanosecond},
			  utc_offset);
}

ZonedTime
WithTimeOfDay(const ZonedTime &day, const TimeOfDay &time_of_day)
{
	return WithTimeOfDay(day, time_of_day, day.utc_offset);
}

ZonedTime
StartOfDay(const ZonedTime &t)
{
	return WithTimeOfDay(t, TimeOfDay{});
}
