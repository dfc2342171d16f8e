// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TimeUtil.hxx"
#include "schedule/IntervalStepper.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

#include <limits.h>

TEST(IntervalStepper, Units)
{
	const auto now = ParseTime("2024-03-11T10:00:00Z");

	EXPECT_EQ(IntervalStepper(5, IntervalUnit::SECOND).Step(now),
		  ParseTime("2024-03-11T10:00:05Z"));
	EXPECT_EQ(IntervalStepper(2, IntervalUnit::MINUTE).Step(now),
		  ParseTime("2024-03-11T10:02:00Z"));
	EXPECT_EQ(IntervalStepper(1, IntervalUnit::HOUR).Step(now),
		  ParseTime("2024-03-11T11:00:00Z"));
	EXPECT_EQ(IntervalStepper(2, IntervalUnit::DAY).Step(now),
		  ParseTime("2024-03-13T10:00:00Z"));
	EXPECT_EQ(IntervalStepper(1, IntervalUnit::WEEK).Step(now),
		  ParseTime("2024-03-18T10:00:00Z"));
	EXPECT_EQ(IntervalStepper(1, IntervalUnit::MONTH).Step(now),
		  ParseTime("2024-04-11T10:00:00Z"));
	EXPECT_EQ(IntervalStepper(1, IntervalUnit::YEAR).Step(now),
		  ParseTime("2025-03-11T10:00:00Z"));
}

TEST(IntervalStepper, CalendarUnitsKeepWallClock)
{
	/* a day step is a calendar day in the offset of the input */
	const auto t = ParseTime("2024-03-11T23:30:00-08:00");
	const auto next = IntervalStepper(1, IntervalUnit::DAY).Step(t);
	EXPECT_EQ(next, ParseTime("2024-03-12T23:30:00-08:00"));
	EXPECT_EQ(next.utc_offset, t.utc_offset);

	EXPECT_EQ(IntervalStepper(1, IntervalUnit::MONTH).Step(ParseTime("2024-01-31T09:00:00Z")),
		  ParseTime("2024-03-02T09:00:00Z"));
	EXPECT_EQ(IntervalStepper(13, IntervalUnit::MONTH).Step(ParseTime("2024-01-15T09:00:00Z")),
		  ParseTime("2025-02-15T09:00:00Z"));
}

TEST(IntervalStepper, Fallback)
{
	const auto now = ParseTime("2024-03-11T10:00:00Z");
	const IntervalStepper bogus(3, static_cast<IntervalUnit>(42));

	EXPECT_EQ(bogus.Step(now), ParseTime("2024-03-11T10:05:00Z"));
	EXPECT_EQ(bogus.GetDuration(), std::chrono::seconds{300});
}

TEST(IntervalStepper, Duration)
{
	EXPECT_EQ(IntervalStepper(7, IntervalUnit::SECOND).GetDuration(),
		  std::chrono::seconds{7});
	EXPECT_EQ(IntervalStepper(15, IntervalUnit::MINUTE).GetDuration(),
		  std::chrono::seconds{900});
	EXPECT_EQ(IntervalStepper(2, IntervalUnit::HOUR).GetDuration(),
		  std::chrono::seconds{7200});
	EXPECT_FALSE(IntervalStepper(1, IntervalUnit::DAY).GetDuration());
	EXPECT_FALSE(IntervalStepper(1, IntervalUnit::YEAR).GetDuration());
}

TEST(IntervalStepper, ParseUnit)
{
	EXPECT_EQ(ParseIntervalUnit("second"), IntervalUnit::SECOND);
	EXPECT_EQ(ParseIntervalUnit("minutes"), IntervalUnit::MINUTE);
	EXPECT_EQ(ParseIntervalUnit("Hours"), IntervalUnit::HOUR);
	EXPECT_EQ(ParseIntervalUnit("day"), IntervalUnit::DAY);
	EXPECT_EQ(ParseIntervalUnit("weeks"), IntervalUnit::WEEK);
	EXPECT_EQ(ParseIntervalUnit("MONTH"), IntervalUnit::MONTH);
	EXPECT_EQ(ParseIntervalUnit("years"), IntervalUnit::YEAR);

	EXPECT_THROW(ParseIntervalUnit("fortnight"), std::runtime_error);
	EXPECT_THROW(ParseIntervalUnit("minutess"), std::runtime_error);
	EXPECT_THROW(ParseIntervalUnit("min"), std::runtime_error);

	EXPECT_STREQ(ToString(IntervalUnit::WEEK), "week");
}

TEST(IntervalStepper, MaxInterval)
{
	EXPECT_EQ(GetMaxInterval(IntervalUnit::SECOND), INT_MAX);
	EXPECT_EQ(GetMaxInterval(IntervalUnit::MINUTE), 52560000);
	EXPECT_EQ(GetMaxInterval(IntervalUnit::HOUR), 876000);
	EXPECT_EQ(GetMaxInterval(IntervalUnit::DAY), 36500);
	EXPECT_EQ(GetMaxInterval(IntervalUnit::WEEK), 5214);
	EXPECT_EQ(GetMaxInterval(IntervalUnit::MONTH), 1200);
	EXPECT_EQ(GetMaxInterval(IntervalUnit::YEAR), 100);

	/* the largest steps still move forward */
	const auto now = ParseTime("2024-03-11T10:00:00Z");
	EXPECT_EQ(IntervalStepper(INT_MAX, IntervalUnit::SECOND).Step(now),
		  now + std::chrono::seconds{INT_MAX});
	EXPECT_EQ(IntervalStepper(876000, IntervalUnit::HOUR).Step(now),
		  ParseTime("2124-02-16T10:00:00Z"));
	EXPECT_EQ(IntervalStepper(5214, IntervalUnit::WEEK).Step(now),
		  ParseTime("2124-02-14T10:00:00Z"));
	EXPECT_EQ(IntervalStepper(100, IntervalUnit::YEAR).Step(now),
		  ParseTime("2124-03-11T10:00:00Z"));
}
