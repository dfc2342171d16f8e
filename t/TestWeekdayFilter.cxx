// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TimeUtil.hxx"
#include "schedule/WeekdayFilter.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

static const WeekdaySet business_days{
	Weekday::MONDAY, Weekday::TUESDAY, Weekday::WEDNESDAY,
	Weekday::THURSDAY, Weekday::FRIDAY,
};

TEST(WeekdayFilter, Unrestricted)
{
	const WeekdayFilter f;
	EXPECT_FALSE(f.IsRestricted());
	EXPECT_FALSE(f.IsEmpty());

	for (unsigned i = 0; i < 7; ++i)
		EXPECT_TRUE(f.Allows(Weekday(i)));

	const auto t = ParseTime("2024-03-10T10:00:00Z"); // Sunday
	EXPECT_TRUE(f.Allows(t));
	EXPECT_EQ(f.Advance(t, TimeOfDay{9}), t);
	EXPECT_EQ(f.Advance(t, std::nullopt), t);
}

TEST(WeekdayFilter, Membership)
{
	const WeekdayFilter f{business_days};
	EXPECT_TRUE(f.IsRestricted());
	EXPECT_FALSE(f.IsEmpty());
	EXPECT_EQ(business_days.count(), 5u);

	EXPECT_FALSE(f.Allows(Weekday::SUNDAY));
	EXPECT_TRUE(f.Allows(Weekday::MONDAY));
	EXPECT_TRUE(f.Allows(Weekday::FRIDAY));
	EXPECT_FALSE(f.Allows(Weekday::SATURDAY));

	EXPECT_TRUE(f.Allows(ParseTime("2024-03-15T23:00:00Z"))); // Friday
	/* ... but Saturday already in +02:00 */
	EXPECT_FALSE(f.Allows(ParseTime("2024-03-15T23:00:00Z").In(std::chrono::hours{2})));

	EXPECT_TRUE(WeekdayFilter{WeekdaySet{}}.IsEmpty());
	EXPECT_TRUE(WeekdayFilter{WeekdaySet{}}.IsRestricted());
}

TEST(WeekdayFilter, AdvancePreservingTime)
{
	const WeekdayFilter f{business_days};

	/* allowed day: only the time of day is applied */
	EXPECT_EQ(f.Advance(ParseTime("2024-03-12T14:00:00Z"), TimeOfDay{9}),
		  ParseTime("2024-03-12T09:00:00Z"));

	/* Saturday and Sunday are skipped */
	EXPECT_EQ(f.Advance(ParseTime("2024-03-16T14:00:00Z"), TimeOfDay{9}),
		  ParseTime("2024-03-18T09:00:00Z"));
	EXPECT_EQ(f.Advance(ParseTime("2024-03-17T00:00:00+05:00"), TimeOfDay{9}),
		  ParseTime("2024-03-18T09:00:00+05:00"));
}

TEST(WeekdayFilter, AdvanceWithoutTime)
{
	const WeekdayFilter f{WeekdaySet{Weekday::MONDAY, Weekday::WEDNESDAY, Weekday::FRIDAY}};

	/* allowed day: unchanged */
	const auto monday = ParseTime("2024-03-11T23:50:00Z");
	EXPECT_EQ(f.Advance(monday, std::nullopt), monday);

	/* Tuesday is skipped; Wednesday begins at midnight */
	EXPECT_EQ(f.Advance(ParseTime("2024-03-12T00:05:00Z"), std::nullopt),
		  ParseTime("2024-03-13T00:00:00Z"));
}

TEST(WeekdayFilter, AdvanceEmpty)
{
	/* no allowed day: the search gives up and returns its input */
	const WeekdayFilter f{WeekdaySet{}};
	const auto t = ParseTime("2024-03-12T00:05:00Z");
	EXPECT_EQ(f.Advance(t, std::nullopt), t);
	EXPECT_EQ(f.Advance(t, TimeOfDay{9}), t);
}

TEST(WeekdayFilter, Parse)
{
	EXPECT_EQ(ParseWeekday("mon"), Weekday::MONDAY);
	EXPECT_EQ(ParseWeekday("Tue"), Weekday::TUESDAY);
	EXPECT_EQ(ParseWeekday("WEDNESDAY"), Weekday::WEDNESDAY);
	EXPECT_EQ(ParseWeekday("sunday"), Weekday::SUNDAY);
	EXPECT_EQ(ParseWeekday("sat"), Weekday::SATURDAY);

	EXPECT_THROW(ParseWeekday("mo"), std::runtime_error);
	EXPECT_THROW(ParseWeekday("monsday"), std::runtime_error);
	EXPECT_THROW(ParseWeekday(""), std::runtime_error);
}
