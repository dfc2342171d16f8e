// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TimeUtil.hxx"
#include "time/Math.hxx"
#include "time/TimeOfDay.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

using std::chrono::hours;
using std::chrono::minutes;

TEST(Time, ParseISO8601)
{
	const auto utc = ParseISO8601("2024-03-11T09:00:00Z");
	EXPECT_EQ(utc.time, std::chrono::system_clock::from_time_t(1710147600));
	EXPECT_EQ(utc.utc_offset, hours(0));

	const auto plus = ParseISO8601("2024-03-11T10:00:00+01:00");
	EXPECT_EQ(plus, utc);
	EXPECT_EQ(plus.utc_offset, hours(1));

	const auto minus = ParseISO8601("2024-03-11T03:30:00-05:30");
	EXPECT_EQ(minus, utc);
	EXPECT_EQ(minus.utc_offset, -(hours(5) + minutes(30)));

	const auto fraction = ParseISO8601("2024-03-11T09:00:00.25Z");
	EXPECT_EQ(fraction.time - utc.time, std::chrono::milliseconds(250));

	EXPECT_THROW(ParseISO8601("2024-03-11"), std::runtime_error);
	EXPECT_THROW(ParseISO8601("2024-03-11T09:00:00"), std::runtime_error);
	EXPECT_THROW(ParseISO8601("2024-03-11T09:00:00+1"), std::runtime_error);
	EXPECT_THROW(ParseISO8601("2024-03-11T09:00:00Zx"), std::runtime_error);
}

TEST(Time, FormatISO8601)
{
	EXPECT_EQ(FormatISO8601(ParseISO8601("2024-03-11T09:00:00Z")),
		  "2024-03-11T09:00:00Z");
	EXPECT_EQ(FormatISO8601(ParseISO8601("2024-03-11T23:30:00+04:00")),
		  "2024-03-11T23:30:00+04:00");
	EXPECT_EQ(FormatISO8601(ParseISO8601("2024-03-11T23:30:00-02:30")),
		  "2024-03-11T23:30:00-02:30");
	EXPECT_EQ(FormatISO8601(ParseISO8601("2024-03-11T09:00:00.5Z")),
		  "2024-03-11T09:00:00.500000000Z");

	/* the same instant, read in another offset */
	EXPECT_EQ(FormatISO8601(ParseISO8601("2024-03-11T23:30:00Z").In(hours(2))),
		  "2024-03-12T01:30:00+02:00");
}

TEST(Time, CalendarMath)
{
	const auto t = ParseISO8601("2024-02-28T10:15:00+03:00");

	EXPECT_EQ(AddDays(t, 1), ParseISO8601("2024-02-29T10:15:00+03:00"));
	EXPECT_EQ(AddDays(t, 2), ParseISO8601("2024-03-01T10:15:00+03:00"));
	EXPECT_EQ(AddDays(t, 2).utc_offset, hours(3));
	EXPECT_EQ(AddMonths(t, 10), ParseISO8601("2024-12-28T10:15:00+03:00"));
	EXPECT_EQ(AddMonths(t, 11), ParseISO8601("2025-01-28T10:15:00+03:00"));
	EXPECT_EQ(AddYears(t, 1), ParseISO8601("2025-02-28T10:15:00+03:00"));

	/* overflowing days are normalized */
	EXPECT_EQ(AddMonths(ParseISO8601("2024-01-31T08:00:00Z"), 1),
		  ParseISO8601("2024-03-02T08:00:00Z"));
	EXPECT_EQ(AddMonths(ParseISO8601("2023-01-31T08:00:00Z"), 1),
		  ParseISO8601("2023-03-03T08:00:00Z"));
	EXPECT_EQ(AddYears(ParseISO8601("2024-02-29T08:00:00Z"), 1),
		  ParseISO8601("2025-03-01T08:00:00Z"));

	/* the sub-second part survives */
	const auto fraction = ParseISO8601("2024-03-11T09:00:00.125Z");
	EXPECT_EQ(AddDays(fraction, 1), ParseISO8601("2024-03-12T09:00:00.125Z"));
}

TEST(Time, WallClock)
{
	/* 23:30 UTC is already the next day in +02:00 */
	const auto t = ParseISO8601("2024-03-11T23:30:00Z").In(hours(2));
	EXPECT_EQ(GetWeekday(t), 2u); // Tuesday
	EXPECT_EQ(StartOfDay(t), ParseISO8601("2024-03-12T00:00:00+02:00"));
	EXPECT_EQ(WithTimeOfDay(t, TimeOfDay{9, 30}),
		  ParseISO8601("2024-03-12T09:30:00+02:00"));

	/* date from one offset, time of day in another */
	EXPECT_EQ(WithTimeOfDay(t, TimeOfDay{9, 30}, hours(-5)),
		  ParseISO8601("2024-03-12T09:30:00-05:00"));
}

TEST(Time, ParseTimeOfDay)
{
	EXPECT_EQ(ParseTimeOfDay("09:00"), (TimeOfDay{9, 0}));
	EXPECT_EQ(ParseTimeOfDay("17:45:30"), (TimeOfDay{17, 45, 30}));
	EXPECT_EQ(ParseTimeOfDay("23:59:59.5"), (TimeOfDay{23, 59, 59, 500000000}));
	EXPECT_EQ(ParseTimeOfDay("0:05"), (TimeOfDay{0, 5}));

	EXPECT_EQ(ParseTimeOfDay("17:45:30").SecondsOfDay(), 17u * 3600 + 45 * 60 + 30);
	EXPECT_EQ(TimeOfDay::EndOfDay().SecondsOfDay(), 86399u);

	EXPECT_THROW(ParseTimeOfDay(""), std::runtime_error);
	EXPECT_THROW(ParseTimeOfDay("9"), std::runtime_error);
	EXPECT_THROW(ParseTimeOfDay("24:00"), std::runtime_error);
	EXPECT_THROW(ParseTimeOfDay("12:60"), std::runtime_error);
	EXPECT_THROW(ParseTimeOfDay("12:00:00.1234567890"), std::runtime_error);
	EXPECT_THROW(ParseTimeOfDay("12:00 "), std::runtime_error);
	EXPECT_THROW(ParseTimeOfDay(" 12:00"), std::runtime_error);
	EXPECT_THROW(ParseTimeOfDay("-1:00"), std::runtime_error);
}
