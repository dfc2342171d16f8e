// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TimeUtil.hxx"
#include "schedule/TimeWindow.hxx"

#include <gtest/gtest.h>

TEST(TimeWindow, Defaults)
{
	const TimeWindow w;
	EXPECT_FALSE(w.IsDefined());
	EXPECT_TRUE(w.IsValid());
	EXPECT_EQ(w.GetEnd(), TimeOfDay::EndOfDay());
	EXPECT_TRUE(w.Contains(ParseTime("2024-03-11T03:00:00Z")));
}

TEST(TimeWindow, Validity)
{
	EXPECT_TRUE((TimeWindow{TimeOfDay{9}, TimeOfDay{17}}).IsValid());
	EXPECT_FALSE((TimeWindow{TimeOfDay{10}, TimeOfDay{9}}).IsValid());
	EXPECT_FALSE((TimeWindow{TimeOfDay{9}, TimeOfDay{9}}).IsValid());

	/* only whole seconds are compared */
	EXPECT_FALSE((TimeWindow{TimeOfDay{9, 0, 0}, TimeOfDay{9, 0, 0, 500}}).IsValid());

	/* an end without a start is meaningless, but harmless */
	EXPECT_TRUE((TimeWindow{std::nullopt, TimeOfDay{9}}).IsValid());
	EXPECT_FALSE((TimeWindow{std::nullopt, TimeOfDay{9}}).IsDefined());
}

TEST(TimeWindow, Bounds)
{
	const TimeWindow w{TimeOfDay{9}, TimeOfDay{17, 30}};
	const auto day = ParseTime("2024-03-11T12:00:00+02:00");

	EXPECT_EQ(w.OpensOn(day), ParseTime("2024-03-11T09:00:00+02:00"));
	EXPECT_EQ(w.ClosesOn(day), ParseTime("2024-03-11T17:30:00+02:00"));

	const TimeWindow open_end{TimeOfDay{9}, std::nullopt};
	EXPECT_EQ(open_end.ClosesOn(day), ParseTime("2024-03-11T23:59:59.999999999+02:00"));
}

TEST(TimeWindow, Contains)
{
	const TimeWindow w{TimeOfDay{9}, TimeOfDay{17}};

	EXPECT_FALSE(w.Contains(ParseTime("2024-03-11T08:59:59Z")));
	EXPECT_TRUE(w.Contains(ParseTime("2024-03-11T09:00:00Z")));
	EXPECT_TRUE(w.Contains(ParseTime("2024-03-11T12:00:00Z")));
	EXPECT_TRUE(w.Contains(ParseTime("2024-03-11T17:00:00Z")));
	EXPECT_FALSE(w.Contains(ParseTime("2024-03-11T17:00:01Z")));

	/* the wall clock of the given offset counts */
	EXPECT_TRUE(w.Contains(ParseTime("2024-03-11T07:00:00Z").In(std::chrono::hours{3})));
}
