// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "schedule/Validate.hxx"
#include "schedule/Config.hxx"

#include <gtest/gtest.h>

#include <limits.h>

static ScheduleConfig
MakeConfig(int interval, IntervalUnit unit)
{
	ScheduleConfig config;
	config.interval = interval;
	config.interval_unit = unit;
	return config;
}

TEST(Validate, Valid)
{
	auto config = MakeConfig(1, IntervalUnit::SECOND);
	EXPECT_EQ(Validate(config), ScheduleError::NONE);

	config.window = {TimeOfDay{9}, TimeOfDay{17}};
	config.weekdays = WeekdayFilter{WeekdaySet{Weekday::MONDAY}};
	config.interval_unit = IntervalUnit::DAY;
	EXPECT_EQ(Validate(config), ScheduleError::NONE);

	/* validating twice gives the same answer */
	EXPECT_EQ(Validate(config), ScheduleError::NONE);
	EXPECT_NO_THROW(CheckScheduleConfig(config));
}

TEST(Validate, Interval)
{
	EXPECT_EQ(Validate(MakeConfig(0, IntervalUnit::SECOND)),
		  ScheduleError::INVALID_INTERVAL);
	EXPECT_EQ(Validate(MakeConfig(-5, IntervalUnit::HOUR)),
		  ScheduleError::INVALID_INTERVAL);
}

TEST(Validate, IntervalTooLarge)
{
	/* too large for the nanosecond clock */
	EXPECT_EQ(Validate(MakeConfig(3000000, IntervalUnit::HOUR)),
		  ScheduleError::INVALID_INTERVAL);
	EXPECT_EQ(Validate(MakeConfig(400000000, IntervalUnit::WEEK)),
		  ScheduleError::INVALID_INTERVAL);
	EXPECT_EQ(Validate(MakeConfig(INT_MAX, IntervalUnit::MINUTE)),
		  ScheduleError::INVALID_INTERVAL);
	EXPECT_EQ(Validate(MakeConfig(INT_MAX, IntervalUnit::DAY)),
		  ScheduleError::INVALID_INTERVAL);
	EXPECT_EQ(Validate(MakeConfig(1201, IntervalUnit::MONTH)),
		  ScheduleError::INVALID_INTERVAL);
	EXPECT_EQ(Validate(MakeConfig(101, IntervalUnit::YEAR)),
		  ScheduleError::INVALID_INTERVAL);

	/* the largest accepted value of each unit */
	for (const auto unit : {IntervalUnit::SECOND, IntervalUnit::MINUTE,
				IntervalUnit::HOUR, IntervalUnit::DAY,
				IntervalUnit::WEEK, IntervalUnit::MONTH,
				IntervalUnit::YEAR}) {
		EXPECT_EQ(Validate(MakeConfig(GetMaxInterval(unit), unit)),
			  ScheduleError::NONE);

		if (GetMaxInterval(unit) < INT_MAX)
			EXPECT_EQ(Validate(MakeConfig(GetMaxInterval(unit) + 1, unit)),
				  ScheduleError::INVALID_INTERVAL);
	}
}

TEST(Validate, TimeWindow)
{
	auto config = MakeConfig(1, IntervalUnit::MINUTE);

	config.window = {TimeOfDay{10}, TimeOfDay{9}};
	EXPECT_EQ(Validate(config), ScheduleError::INVALID_TIME_WINDOW);

	config.window = {TimeOfDay{9}, TimeOfDay{9}};
	EXPECT_EQ(Validate(config), ScheduleError::INVALID_TIME_WINDOW);

	/* only a start: the end defaults to the end of the day */
	config.window = {TimeOfDay{23, 59, 59}, std::nullopt};
	EXPECT_EQ(Validate(config), ScheduleError::NONE);
}

TEST(Validate, Weekdays)
{
	auto config = MakeConfig(1, IntervalUnit::HOUR);

	config.weekdays = WeekdayFilter{WeekdaySet{}};
	EXPECT_EQ(Validate(config), ScheduleError::EMPTY_WEEKDAY_SET);

	config.weekdays = WeekdayFilter{WeekdaySet{Weekday::FRIDAY}};
	for (const auto unit : {IntervalUnit::WEEK, IntervalUnit::MONTH, IntervalUnit::YEAR}) {
		config.interval_unit = unit;
		EXPECT_EQ(Validate(config), ScheduleError::INCOMPATIBLE_WEEKDAY_FILTER);
	}

	/* without a restriction, all units are fine */
	config.weekdays = {};
	EXPECT_EQ(Validate(config), ScheduleError::NONE);
}

TEST(Validate, Order)
{
	/* the first failing check wins */
	auto config = MakeConfig(0, IntervalUnit::YEAR);
	config.window = {TimeOfDay{10}, TimeOfDay{9}};
	config.weekdays = WeekdayFilter{WeekdaySet{}};
	EXPECT_EQ(Validate(config), ScheduleError::INVALID_INTERVAL);

	config.interval = 1;
	EXPECT_EQ(Validate(config), ScheduleError::INVALID_TIME_WINDOW);

	config.window = {};
	EXPECT_EQ(Validate(config), ScheduleError::EMPTY_WEEKDAY_SET);

	config.weekdays = WeekdayFilter{WeekdaySet{Weekday::MONDAY}};
	EXPECT_EQ(Validate(config), ScheduleError::INCOMPATIBLE_WEEKDAY_FILTER);
}

TEST(Validate, Exception)
{
	try {
		CheckScheduleConfig(MakeConfig(0, IntervalUnit::SECOND));
		FAIL() << "exception expected";
	} catch (const ScheduleConfigError &e) {
		EXPECT_EQ(e.GetCode(), ScheduleError::INVALID_INTERVAL);
		EXPECT_STREQ(e.what(), ToString(ScheduleError::INVALID_INTERVAL));
	}
}
