// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TimeUtil.hxx"
#include "schedule/Schedule.hxx"
#include "schedule/NextRun.hxx"
#include "schedule/Error.hxx"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <vector>

using namespace std::chrono_literals;

static ScheduleOption
WorkDays()
{
	return SetAllowedWeekdays(Weekday::MONDAY, Weekday::TUESDAY,
				  Weekday::WEDNESDAY, Weekday::THURSDAY,
				  Weekday::FRIDAY);
}

static ScheduleError
GetConstructorError(int interval, IntervalUnit unit,
		    std::initializer_list<ScheduleOption> options)
{
	try {
		IntervalSchedule schedule{interval, unit, options};
		return ScheduleError::NONE;
	} catch (const ScheduleConfigError &e) {
		return e.GetCode();
	}
}

TEST(Schedule, Plain)
{
	IntervalSchedule schedule{90, IntervalUnit::SECOND};

	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T10:00:00Z")),
		  ParseTime("2024-03-11T10:01:30Z"));
	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T10:01:30Z")),
		  ParseTime("2024-03-11T10:03:00Z"));

	/* the result is in the offset of "now" */
	const auto next = schedule.Next(ParseTime("2024-03-11T12:00:00+02:00"));
	EXPECT_EQ(next, ParseTime("2024-03-11T12:01:30+02:00"));
	EXPECT_EQ(next.utc_offset, 2h);
}

TEST(Schedule, WindowBoundary)
{
	IntervalSchedule schedule{2, IntervalUnit::SECOND, {
			SetStartTime(TimeOfDay{9}),
			SetEndTime(TimeOfDay{17}),
		}};

	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T10:30:00Z")),
		  ParseTime("2024-03-11T10:30:02Z"));
	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T16:59:59Z")),
		  ParseTime("2024-03-12T09:00:00Z"));

	/* exactly when the window opens */
	EXPECT_EQ(schedule.Next(ParseTime("2024-03-12T09:00:00Z")),
		  ParseTime("2024-03-12T09:00:02Z"));
}

TEST(Schedule, BeforeWindow)
{
	/* a daily maintenance job */
	IntervalSchedule schedule{1, IntervalUnit::DAY, {
			SetStartTime(TimeOfDay{2}),
		}};

	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T01:30:00Z")),
		  ParseTime("2024-03-11T02:00:00Z"));
	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T03:00:00Z")),
		  ParseTime("2024-03-12T02:00:00Z"));
}

TEST(Schedule, WindowInOffset)
{
	IntervalSchedule schedule{1, IntervalUnit::HOUR, {
			SetStartTime(TimeOfDay{9}),
			SetEndTime(TimeOfDay{17}),
		}};

	/* 04:00 UTC is 09:30 in India */
	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T04:00:00Z").In(5h + 30min)),
		  ParseTime("2024-03-11T10:30:00+05:30"));

	/* 23:00 UTC on Monday is already Tuesday morning in Tokyo */
	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T23:00:00Z").In(9h)),
		  ParseTime("2024-03-12T09:00:00+09:00"));
}

TEST(Schedule, Precision)
{
	IntervalSchedule precise{2, IntervalUnit::SECOND, {
			SetStartTime(TimeOfDay{9}),
			SetEndTime(TimeOfDay{17}),
		}};

	EXPECT_EQ(precise.Next(ParseTime("2024-03-11T10:00:01Z")),
		  ParseTime("2024-03-11T10:00:03Z"));

	IntervalSchedule aligned{2, IntervalUnit::SECOND, {
			SetStartTime(TimeOfDay{9}),
			SetEndTime(TimeOfDay{17}),
			DisablePrecision(),
		}};

	EXPECT_EQ(aligned.Next(ParseTime("2024-03-11T10:00:01Z")),
		  ParseTime("2024-03-11T10:00:02Z"));

	/* a grid point equal to "now" is skipped */
	EXPECT_EQ(aligned.Next(ParseTime("2024-03-11T10:00:04Z")),
		  ParseTime("2024-03-11T10:00:06Z"));
}

TEST(Schedule, AlignedCalendarUnit)
{
	IntervalSchedule schedule{1, IntervalUnit::DAY, {
			SetStartTime(TimeOfDay{6}),
			DisablePrecision(),
		}};

	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T05:00:00Z")),
		  ParseTime("2024-03-11T06:00:00Z"));
	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T06:00:00Z")),
		  ParseTime("2024-03-12T06:00:00Z"));
}

TEST(Schedule, AlignedLongIntervals)
{
	const auto next = [](int interval, IntervalUnit unit, const char *now){
		IntervalSchedule schedule{interval, unit, {
				SetStartTime(TimeOfDay{9}),
				DisablePrecision(),
			}};
		return schedule.Next(ParseTime(now));
	};

	/* the grid keeps its length instead of falling back to the
	   next day */
	EXPECT_EQ(next(3, IntervalUnit::DAY, "2024-03-11T10:00:00Z"),
		  ParseTime("2024-03-14T09:00:00Z"));
	EXPECT_EQ(next(1, IntervalUnit::WEEK, "2024-03-11T10:00:00Z"),
		  ParseTime("2024-03-18T09:00:00Z"));
	EXPECT_EQ(next(1, IntervalUnit::MONTH, "2024-03-11T10:00:00Z"),
		  ParseTime("2024-04-11T09:00:00Z"));
	EXPECT_EQ(next(1, IntervalUnit::YEAR, "2024-03-11T10:00:00Z"),
		  ParseTime("2025-03-11T09:00:00Z"));

	/* before the window opens, today's start is still used */
	EXPECT_EQ(next(1, IntervalUnit::WEEK, "2024-03-11T08:00:00Z"),
		  ParseTime("2024-03-11T09:00:00Z"));
}

TEST(Schedule, AlignedLongIntervalsWeekdays)
{
	IntervalSchedule schedule{2, IntervalUnit::DAY, {
			SetStartTime(TimeOfDay{9}),
			SetEndTime(TimeOfDay{17}),
			WorkDays(),
			DisablePrecision(),
		}};

	/* Thursday + 2 days is Saturday: moved to Monday */
	EXPECT_EQ(schedule.Next(ParseTime("2024-03-14T10:00:00Z")),
		  ParseTime("2024-03-18T09:00:00Z"));
}

TEST(Schedule, AlignedAcrossMidnight)
{
	const auto next = [](int interval, IntervalUnit unit,
			     std::initializer_list<ScheduleOption> options,
			     const char *now){
		IntervalSchedule schedule{interval, unit, options};
		return schedule.Next(ParseTime(now));
	};

	/* a grid point after midnight, before the window opens */
	EXPECT_EQ(next(25, IntervalUnit::MINUTE,
		       {SetStartTime(TimeOfDay{22, 30}), DisablePrecision()},
		       "2024-03-11T23:50:00Z"),
		  ParseTime("2024-03-12T22:30:00Z"));

	const std::initializer_list<ScheduleOption> office{
		SetStartTime(TimeOfDay{9}),
		SetEndTime(TimeOfDay{17}),
		DisablePrecision(),
	};

	/* inside tomorrow's window */
	EXPECT_EQ(next(31, IntervalUnit::HOUR, office, "2024-03-11T10:00:00Z"),
		  ParseTime("2024-03-12T16:00:00Z"));

	/* before tomorrow's window */
	EXPECT_EQ(next(16, IntervalUnit::HOUR, office, "2024-03-11T10:00:00Z"),
		  ParseTime("2024-03-12T09:00:00Z"));

	/* after tomorrow's window */
	EXPECT_EQ(next(33, IntervalUnit::HOUR, office, "2024-03-11T10:00:00Z"),
		  ParseTime("2024-03-13T09:00:00Z"));
}

TEST(Schedule, WindowEnd)
{
	const auto make = [](bool precision){
		return std::make_unique<IntervalSchedule>(15, IntervalUnit::MINUTE,
							  std::initializer_list<ScheduleOption>{
								  SetStartTime(TimeOfDay{8}),
								  SetEndTime(TimeOfDay{18, 10}),
								  precision ? EnablePrecision() : DisablePrecision(),
							  });
	};

	for (const bool precision : {true, false}) {
		/* the step would leave the window */
		EXPECT_EQ(make(precision)->Next(ParseTime("2024-03-12T18:00:00Z")),
			  ParseTime("2024-03-13T08:00:00Z"));

		/* exactly at the end of the window */
		EXPECT_EQ(make(precision)->Next(ParseTime("2024-03-12T18:10:00Z")),
			  ParseTime("2024-03-13T08:00:00Z"));

		/* after the end of the window */
		EXPECT_EQ(make(precision)->Next(ParseTime("2024-03-12T22:00:00Z")),
			  ParseTime("2024-03-13T08:00:00Z"));
	}

	/* the last slot which fits into the window */
	EXPECT_EQ(make(true)->Next(ParseTime("2024-03-12T17:55:00Z")),
		  ParseTime("2024-03-12T18:10:00Z"));
}

TEST(Schedule, EndOfDay)
{
	/* without an end time, the window lasts until midnight */
	IntervalSchedule schedule{1, IntervalUnit::HOUR, {
			SetStartTime(TimeOfDay{20}),
		}};

	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T22:30:00Z")),
		  ParseTime("2024-03-11T23:30:00Z"));
	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T23:30:00Z")),
		  ParseTime("2024-03-12T20:00:00Z"));
}

TEST(Schedule, WeekdaySkip)
{
	const auto make = [](){
		return std::make_unique<IntervalSchedule>(1, IntervalUnit::DAY,
							  std::initializer_list<ScheduleOption>{
								  SetStartTime(TimeOfDay{9}),
								  WorkDays(),
							  });
	};

	/* Friday, Saturday and Sunday all lead to Monday */
	EXPECT_EQ(make()->Next(ParseTime("2024-03-15T10:00:00Z")),
		  ParseTime("2024-03-18T09:00:00Z"));
	EXPECT_EQ(make()->Next(ParseTime("2024-03-16T10:00:00Z")),
		  ParseTime("2024-03-18T09:00:00Z"));
	EXPECT_EQ(make()->Next(ParseTime("2024-03-17T10:00:00Z")),
		  ParseTime("2024-03-18T09:00:00Z"));

	EXPECT_EQ(make()->Next(ParseTime("2024-03-12T10:00:00Z")),
		  ParseTime("2024-03-13T09:00:00Z"));

	/* early on a disallowed day */
	EXPECT_EQ(make()->Next(ParseTime("2024-03-17T05:00:00Z")),
		  ParseTime("2024-03-18T09:00:00Z"));
}

TEST(Schedule, BusinessHours)
{
	const auto make = [](){
		return std::make_unique<IntervalSchedule>(2, IntervalUnit::SECOND,
							  std::initializer_list<ScheduleOption>{
								  SetStartTime(TimeOfDay{9}),
								  SetEndTime(TimeOfDay{17}),
								  WorkDays(),
							  });
	};

	EXPECT_EQ(make()->Next(ParseTime("2024-03-11T16:59:59Z")),
		  ParseTime("2024-03-12T09:00:00Z"));
	EXPECT_EQ(make()->Next(ParseTime("2024-03-11T10:30:00Z")),
		  ParseTime("2024-03-11T10:30:02Z"));
	EXPECT_EQ(make()->Next(ParseTime("2024-03-10T10:00:00Z")),
		  ParseTime("2024-03-11T09:00:00Z"));
}

TEST(Schedule, PastEndHonoursWeekdays)
{
	IntervalSchedule schedule{10, IntervalUnit::MINUTE, {
			SetStartTime(TimeOfDay{9}),
			SetEndTime(TimeOfDay{18}),
			WorkDays(),
		}};

	/* Friday evening: the next window opens on Monday */
	EXPECT_EQ(schedule.Next(ParseTime("2024-03-15T18:05:00Z")),
		  ParseTime("2024-03-18T09:00:00Z"));
}

TEST(Schedule, PastEndSkipsDays)
{
	for (const bool precision : {true, false}) {
		IntervalSchedule schedule{15, IntervalUnit::MINUTE, {
				SetStartTime(TimeOfDay{8}),
				SetEndTime(TimeOfDay{18, 10}),
				SetAllowedWeekdays(Weekday::MONDAY,
						   Weekday::WEDNESDAY,
						   Weekday::FRIDAY),
				precision ? EnablePrecision() : DisablePrecision(),
			}};

		EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T23:50:00Z")),
			  ParseTime("2024-03-13T08:00:00Z"));
	}
}

TEST(Schedule, NoWindowWeekdays)
{
	IntervalSchedule schedule{15, IntervalUnit::MINUTE, {
			SetAllowedWeekdays(Weekday::MONDAY,
					   Weekday::WEDNESDAY,
					   Weekday::FRIDAY),
		}};

	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T10:00:00Z")),
		  ParseTime("2024-03-11T10:15:00Z"));

	/* stepping into Tuesday: midnight of Wednesday */
	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T23:50:00Z")),
		  ParseTime("2024-03-13T00:00:00Z"));

	/* a step which stays on a disallowed day is moved as well */
	schedule.Set(SetNextRun(std::nullopt));
	EXPECT_EQ(schedule.Next(ParseTime("2024-03-12T10:00:00Z")),
		  ParseTime("2024-03-13T00:00:00Z"));
}

TEST(Schedule, StartDate)
{
	IntervalSchedule schedule{1, IntervalUnit::DAY, {
			SetStartTime(TimeOfDay{2}),
			SetStartDate(ParseTime("2025-03-15T00:00:00+04:00")),
		}};

	const auto next = schedule.Next(ParseTime("2025-03-01T10:00:00+04:00"));
	EXPECT_EQ(next, ParseTime("2025-03-15T02:00:00+04:00"));
	EXPECT_EQ(next.utc_offset, 4h);

	/* once the start date has passed, the window applies */
	EXPECT_EQ(schedule.Next(ParseTime("2025-03-15T03:00:00+04:00")),
		  ParseTime("2025-03-16T02:00:00+04:00"));
}

TEST(Schedule, StartDateOwnOffset)
{
	/* the date is taken from the start date in its own offset
	   (March 14th), the time of day in the offset of "now" */
	IntervalSchedule schedule{1, IntervalUnit::DAY, {
			SetStartTime(TimeOfDay{2}),
			SetStartDate(ParseTime("2025-03-14T22:00:00Z")),
		}};

	EXPECT_EQ(schedule.Next(ParseTime("2025-03-01T10:00:00+04:00")),
		  ParseTime("2025-03-14T02:00:00+04:00"));
}

TEST(Schedule, StartDateWithoutWindow)
{
	IntervalSchedule schedule{1, IntervalUnit::HOUR, {
			SetStartDate(ParseTime("2025-03-15T12:34:56Z")),
		}};

	const auto next = schedule.Next(ParseTime("2025-03-01T10:00:00-05:00"));
	EXPECT_EQ(next, ParseTime("2025-03-15T12:34:56Z"));
	EXPECT_EQ(next.utc_offset, -5h);
}

TEST(Schedule, Disabled)
{
	unsigned after_calls = 0;

	IntervalSchedule schedule{1, IntervalUnit::DAY, {
			SetStartTime(TimeOfDay{9}),
			WorkDays(),
			SetAfterHook([&after_calls](const ZonedTime &){ ++after_calls; }),
			Disable(),
		}};

	for (const char *s : {"2024-03-11T10:00:00Z", "2024-03-16T23:58:00+01:00",
			      "2024-03-11T10:00:00.5Z"}) {
		const auto now = ParseTime(s);
		EXPECT_EQ(schedule.Next(now), now + 5min);
	}

	EXPECT_EQ(after_calls, 0U);
	EXPECT_FALSE(schedule.GetConfig().next_run);

	schedule.Set(Enable());
	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T10:00:00Z")),
		  ParseTime("2024-03-12T09:00:00Z"));
	EXPECT_EQ(after_calls, 1U);
}

TEST(Schedule, Cache)
{
	IntervalSchedule schedule{1, IntervalUnit::HOUR};

	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T10:00:00Z")),
		  ParseTime("2024-03-11T11:00:00Z"));
	EXPECT_EQ(schedule.GetConfig().next_run,
		  ParseTime("2024-03-11T11:00:00Z"));

	/* the cached value is returned while it is in the future */
	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T10:30:00Z")),
		  ParseTime("2024-03-11T11:00:00Z"));

	/* reconfiguring does not discard it */
	schedule.Set(SetInterval(2));
	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T10:45:00Z")),
		  ParseTime("2024-03-11T11:00:00Z"));

	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T11:00:00Z")),
		  ParseTime("2024-03-11T13:00:00Z"));

	/* clearing it forces a recalculation */
	schedule.Set(SetNextRun(std::nullopt));
	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T11:30:00Z")),
		  ParseTime("2024-03-11T13:30:00Z"));
}

TEST(Schedule, ManualOverride)
{
	unsigned after_calls = 0;

	IntervalSchedule schedule{10, IntervalUnit::MINUTE, {
			SetAfterHook([&after_calls](const ZonedTime &){ ++after_calls; }),
		}};

	schedule.Set(SetNextRun(ParseTime("2024-03-11T15:00:00Z")));

	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T10:00:00Z")),
		  ParseTime("2024-03-11T15:00:00Z"));
	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T14:59:59Z")),
		  ParseTime("2024-03-11T15:00:00Z"));
	EXPECT_EQ(after_calls, 0U);

	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T15:00:00Z")),
		  ParseTime("2024-03-11T15:10:00Z"));
	EXPECT_EQ(after_calls, 1U);
}

TEST(Schedule, Rejected)
{
	EXPECT_EQ(GetConstructorError(0, IntervalUnit::SECOND, {}),
		  ScheduleError::INVALID_INTERVAL);
	EXPECT_EQ(GetConstructorError(-1, IntervalUnit::DAY, {}),
		  ScheduleError::INVALID_INTERVAL);
	EXPECT_EQ(GetConstructorError(1, IntervalUnit::HOUR, {
				SetStartTime(TimeOfDay{10}),
				SetEndTime(TimeOfDay{9}),
			}),
		  ScheduleError::INVALID_TIME_WINDOW);
	EXPECT_EQ(GetConstructorError(1, IntervalUnit::HOUR, {
				SetAllowedWeekdays(WeekdaySet{}),
			}),
		  ScheduleError::EMPTY_WEEKDAY_SET);

	for (const auto unit : {IntervalUnit::WEEK, IntervalUnit::MONTH, IntervalUnit::YEAR})
		EXPECT_EQ(GetConstructorError(1, unit, {WorkDays()}),
			  ScheduleError::INCOMPATIBLE_WEEKDAY_FILTER);

	EXPECT_EQ(GetConstructorError(1, IntervalUnit::DAY, {WorkDays()}),
		  ScheduleError::NONE);
}

TEST(Schedule, IntervalTooLarge)
{
	EXPECT_EQ(GetConstructorError(3000000, IntervalUnit::HOUR, {}),
		  ScheduleError::INVALID_INTERVAL);
	EXPECT_EQ(GetConstructorError(400000000, IntervalUnit::WEEK, {}),
		  ScheduleError::INVALID_INTERVAL);

	/* changing the unit alone can make the amount too large */
	IntervalSchedule schedule{1000000, IntervalUnit::MINUTE};
	EXPECT_THROW(schedule.Set(SetIntervalUnit(IntervalUnit::HOUR)),
		     ScheduleConfigError);
	EXPECT_EQ(schedule.GetConfig().interval_unit, IntervalUnit::MINUTE);

	/* the largest accepted intervals still yield a future time */
	const auto now = ParseTime("2024-03-11T10:00:00Z");
	for (const auto unit : {IntervalUnit::SECOND, IntervalUnit::MINUTE,
				IntervalUnit::HOUR, IntervalUnit::DAY,
				IntervalUnit::WEEK, IntervalUnit::MONTH,
				IntervalUnit::YEAR}) {
		IntervalSchedule s{GetMaxInterval(unit), unit};
		EXPECT_GT(s.Next(now), now);
	}
}

TEST(Schedule, SetRollback)
{
	IntervalSchedule schedule{1, IntervalUnit::MINUTE};

	schedule.Set(SetInterval(10));
	EXPECT_EQ(schedule.GetConfig().interval, 10);

	try {
		schedule.Set(SetInterval(-5));
		FAIL() << "exception expected";
	} catch (const ScheduleConfigError &e) {
		EXPECT_EQ(e.GetCode(), ScheduleError::INVALID_INTERVAL);
	}

	EXPECT_EQ(schedule.GetConfig().interval, 10);

	/* all options of a failed Set() are discarded, even the valid
	   ones */
	EXPECT_THROW(schedule.Set(SetStartTime(TimeOfDay{9}),
				  SetEndTime(TimeOfDay{8})),
		     ScheduleConfigError);
	EXPECT_FALSE(schedule.GetConfig().window.IsDefined());

	EXPECT_THROW(schedule.Set(WorkDays(), SetIntervalUnit(IntervalUnit::MONTH)),
		     ScheduleConfigError);
	EXPECT_FALSE(schedule.GetConfig().weekdays.IsRestricted());
	EXPECT_EQ(schedule.GetConfig().interval_unit, IntervalUnit::MINUTE);

	/* later options may repair earlier ones */
	schedule.Set(SetInterval(0), SetInterval(3));
	EXPECT_EQ(schedule.GetConfig().interval, 3);
}

TEST(Schedule, NoOpSet)
{
	IntervalSchedule schedule{2, IntervalUnit::SECOND, {
			SetStartTime(TimeOfDay{9}),
			SetEndTime(TimeOfDay{17}),
			WorkDays(),
		}};

	const auto before = schedule.GetConfig();

	schedule.Set();
	schedule.Set(SetInterval(2), SetStartTime(TimeOfDay{9}), WorkDays());

	const auto after = schedule.GetConfig();
	EXPECT_EQ(after.interval, before.interval);
	EXPECT_EQ(after.interval_unit, before.interval_unit);
	EXPECT_EQ(after.window, before.window);
	EXPECT_EQ(after.weekdays, before.weekdays);
	EXPECT_EQ(after.enabled, before.enabled);
	EXPECT_EQ(after.precision, before.precision);

	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T10:30:00Z")),
		  ParseTime("2024-03-11T10:30:02Z"));
}

TEST(Schedule, ClearOptions)
{
	IntervalSchedule schedule{1, IntervalUnit::HOUR, {
			SetStartTime(TimeOfDay{9}),
			SetEndTime(TimeOfDay{17}),
			WorkDays(),
			SetStartDate(ParseTime("2030-01-01T00:00:00Z")),
		}};

	schedule.Set(SetStartTime(std::nullopt), SetEndTime(std::nullopt),
		     SetAllowedWeekdays(), SetStartDate(std::nullopt));

	const auto config = schedule.GetConfig();
	EXPECT_FALSE(config.window.start);
	EXPECT_FALSE(config.window.end);
	EXPECT_FALSE(config.weekdays.IsRestricted());
	EXPECT_FALSE(config.start_date);

	/* a plain hourly schedule now, even on Sunday night */
	EXPECT_EQ(schedule.Next(ParseTime("2024-03-10T23:30:00Z")),
		  ParseTime("2024-03-11T00:30:00Z"));

	/* without a restriction, calendar units are fine */
	schedule.Set(SetIntervalUnit(IntervalUnit::WEEK));
	EXPECT_EQ(schedule.GetConfig().interval_unit, IntervalUnit::WEEK);
}

TEST(Schedule, Hooks)
{
	std::vector<ZonedTime> results;
	unsigned before_calls = 0;

	IntervalSchedule schedule{5, IntervalUnit::MINUTE, {
			SetBeforeHook([&before_calls](IntervalSchedule &){ ++before_calls; }),
			SetAfterHook([&results](const ZonedTime &next){ results.push_back(next); }),
		}};

	schedule.Next(ParseTime("2024-03-11T10:00:00Z"));
	schedule.Next(ParseTime("2024-03-11T10:01:00Z"));
	schedule.Next(ParseTime("2024-03-11T10:05:00Z"));

	/* the before-hook runs on every call, the after-hook only
	   when a new value was calculated */
	EXPECT_EQ(before_calls, 3U);
	ASSERT_EQ(results.size(), 2U);
	EXPECT_EQ(results[0], ParseTime("2024-03-11T10:05:00Z"));
	EXPECT_EQ(results[1], ParseTime("2024-03-11T10:10:00Z"));

	schedule.Set(SetBeforeHook({}), SetAfterHook({}));
	schedule.Next(ParseTime("2024-03-11T10:10:00Z"));
	EXPECT_EQ(before_calls, 3U);
	EXPECT_EQ(results.size(), 2U);
}

TEST(Schedule, HookExceptions)
{
	const unsigned old_verbose = log_verbose;
	log_verbose = 0;

	IntervalSchedule schedule{5, IntervalUnit::MINUTE, {
			SetBeforeHook([](IntervalSchedule &){
				throw std::runtime_error("before");
			}),
			SetAfterHook([](const ZonedTime &){
				throw std::runtime_error("after");
			}),
		}};

	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T10:00:00Z")),
		  ParseTime("2024-03-11T10:05:00Z"));

	/* the result was cached despite the failing after-hook */
	EXPECT_EQ(schedule.GetConfig().next_run,
		  ParseTime("2024-03-11T10:05:00Z"));

	log_verbose = old_verbose;
}

TEST(Schedule, BeforeHookReconfigures)
{
	IntervalSchedule schedule{1, IntervalUnit::MINUTE, {
			SetBeforeHook([](IntervalSchedule &s){
				s.Set(SetInterval(10));
			}),
		}};

	/* the new interval applies to the same call */
	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T10:00:00Z")),
		  ParseTime("2024-03-11T10:10:00Z"));
	EXPECT_EQ(schedule.GetConfig().interval, 10);
}

TEST(Schedule, BeforeHookDisables)
{
	IntervalSchedule schedule{1, IntervalUnit::MINUTE, {
			SetBeforeHook([](IntervalSchedule &s){
				s.Set(Disable());
			}),
		}};

	const auto now = ParseTime("2024-03-11T10:00:00Z");
	EXPECT_EQ(schedule.Next(now), now + 5min);
}

TEST(Schedule, BeforeHookRejected)
{
	const unsigned old_verbose = log_verbose;
	log_verbose = 0;

	/* an invalid Set() inside the hook is logged and ignored */
	IntervalSchedule schedule{1, IntervalUnit::MINUTE, {
			SetBeforeHook([](IntervalSchedule &s){
				s.Set(SetInterval(0));
			}),
		}};

	EXPECT_EQ(schedule.Next(ParseTime("2024-03-11T10:00:00Z")),
		  ParseTime("2024-03-11T10:01:00Z"));
	EXPECT_EQ(schedule.GetConfig().interval, 1);

	log_verbose = old_verbose;
}

TEST(Schedule, HookReplacesItself)
{
	unsigned first_calls = 0, second_calls = 0;

	const BeforeHook second = [&second_calls](IntervalSchedule &){
		++second_calls;
	};

	IntervalSchedule schedule{1, IntervalUnit::MINUTE, {
			SetBeforeHook([&first_calls, second](IntervalSchedule &s){
				s.Set(SetBeforeHook(second));

				/* the captures are still alive here */
				++first_calls;
			}),
		}};

	schedule.Next(ParseTime("2024-03-11T10:00:00Z"));
	schedule.Next(ParseTime("2024-03-11T10:01:00Z"));
	schedule.Next(ParseTime("2024-03-11T10:02:00Z"));

	EXPECT_EQ(first_calls, 1U);
	EXPECT_EQ(second_calls, 2U);
}

/**
 * Without a start date and a cached value, every result is after
 * "now".
 */
TEST(Schedule, StrictlyAfter)
{
	const std::vector<std::vector<ScheduleOption>> variants{
		{},
		{WorkDays()},
		{SetStartTime(TimeOfDay{9}), SetEndTime(TimeOfDay{17}), WorkDays()},
		{SetStartTime(TimeOfDay{8}), SetEndTime(TimeOfDay{18, 10}),
		 DisablePrecision()},
		{SetStartTime(TimeOfDay{2}), SetAllowedWeekdays(Weekday::SATURDAY)},
		{SetStartTime(TimeOfDay{22, 30}), DisablePrecision(),
		 SetAllowedWeekdays(Weekday::SUNDAY, Weekday::WEDNESDAY)},
	};

	for (const auto &options : variants) {
		for (const auto unit : {IntervalUnit::SECOND, IntervalUnit::MINUTE,
					IntervalUnit::HOUR, IntervalUnit::DAY}) {
			const IntervalSchedule schedule{unit == IntervalUnit::SECOND ? 2 : 7,
							unit,
							std::span<const ScheduleOption>{options}};
			const auto config = schedule.GetConfig();

			for (const std::chrono::seconds offset : std::initializer_list<std::chrono::seconds>{0h, 5h + 30min, -8h}) {
				auto now = ParseTime("2024-03-09T00:00:00Z").In(offset);
				const auto end = now + 24h * 8;

				for (; now < end; now = now + 37min + 3s) {
					const auto next = CalculateNextRun(config, now);
					EXPECT_GT(next, now);
				}
			}
		}
	}
}
