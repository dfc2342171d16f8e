// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TimeUtil.hxx"
#include "schedule/File.hxx"
#include "schedule/Schedule.hxx"
#include "schedule/Error.hxx"
#include "Logger.hxx"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include <stdlib.h>
#include <unistd.h>

static void
ParseLine(ScheduleFileConfig &config, const char *s)
{
	std::string line{s};
	ParseScheduleLine(config, line.data());
}

static ScheduleConfig
ApplyOptions(const ScheduleFileConfig &file_config)
{
	ScheduleConfig config;
	config.interval = file_config.interval;
	config.interval_unit = file_config.unit;

	for (const auto &option : file_config.options)
		option(config);

	return config;
}

/**
 * A temporary file which is deleted by the destructor.
 */
class TemporaryFile {
	std::string path;

public:
	explicit TemporaryFile(std::string_view contents) {
		char buffer[] = "/tmp/TestScheduleFile.XXXXXX";
		const int fd = mkstemp(buffer);
		if (fd < 0)
			throw std::runtime_error("mkstemp() failed");

		path = buffer;

		const ssize_t nbytes = write(fd, contents.data(), contents.size());
		close(fd);
		if (nbytes != ssize_t(contents.size()))
			throw std::runtime_error("write() failed");
	}

	~TemporaryFile() noexcept {
		unlink(path.c_str());
	}

	TemporaryFile(const TemporaryFile &) = delete;
	TemporaryFile &operator=(const TemporaryFile &) = delete;

	const char *c_str() const noexcept {
		return path.c_str();
	}
};

TEST(ScheduleFile, Empty)
{
	ScheduleFileConfig config;
	ParseLine(config, "");
	ParseLine(config, "   \t ");
	ParseLine(config, "# interval 5 minutes");
	ParseLine(config, "  # indented comment");

	EXPECT_EQ(config.interval, 0);
	EXPECT_TRUE(config.options.empty());
	EXPECT_THROW(config.Check(), std::runtime_error);
}

TEST(ScheduleFile, Interval)
{
	ScheduleFileConfig config;
	ParseLine(config, "interval 30 minutes");
	EXPECT_EQ(config.interval, 30);
	EXPECT_EQ(config.unit, IntervalUnit::MINUTE);
	EXPECT_NO_THROW(config.Check());

	ParseLine(config, "\tinterval  1 Day # daily");
	EXPECT_EQ(config.interval, 1);
	EXPECT_EQ(config.unit, IntervalUnit::DAY);

	ParseLine(config, "interval 2 weeks#comment");
	EXPECT_EQ(config.interval, 2);
	EXPECT_EQ(config.unit, IntervalUnit::WEEK);

	EXPECT_THROW(ParseLine(config, "interval"), std::runtime_error);
	EXPECT_THROW(ParseLine(config, "interval 5"), std::runtime_error);
	EXPECT_THROW(ParseLine(config, "interval 0 seconds"), std::runtime_error);
	EXPECT_THROW(ParseLine(config, "interval -3 seconds"), std::runtime_error);
	EXPECT_THROW(ParseLine(config, "interval 5x seconds"), std::runtime_error);
	EXPECT_THROW(ParseLine(config, "interval 5 decades"), std::runtime_error);
	EXPECT_THROW(ParseLine(config, "interval 5 seconds now"), std::runtime_error);

	/* failed lines do not modify the configuration */
	EXPECT_EQ(config.interval, 2);
	EXPECT_EQ(config.unit, IntervalUnit::WEEK);
	EXPECT_TRUE(config.options.empty());
}

TEST(ScheduleFile, Directives)
{
	ScheduleFileConfig file_config;
	ParseLine(file_config, "interval 2 seconds");
	ParseLine(file_config, "start_date 2024-03-11T00:00:00+01:00");
	ParseLine(file_config, "start_time 09:00");
	ParseLine(file_config, "end_time 17:00:30");
	ParseLine(file_config, "weekdays mon tue Wednesday thu fri");
	ParseLine(file_config, "precision no");
	ParseLine(file_config, "enabled off");
	ParseLine(file_config, "next_run 2024-03-11T15:00:00Z");

	EXPECT_EQ(file_config.options.size(), 7U);

	const auto config = ApplyOptions(file_config);
	EXPECT_EQ(config.interval, 2);
	EXPECT_EQ(config.interval_unit, IntervalUnit::SECOND);
	EXPECT_EQ(config.start_date, ParseTime("2024-03-10T23:00:00Z"));
	EXPECT_EQ(config.window.start, (TimeOfDay{9, 0, 0}));
	EXPECT_EQ(config.window.end, (TimeOfDay{17, 0, 30}));
	EXPECT_EQ(config.weekdays,
		  WeekdayFilter(WeekdaySet{Weekday::MONDAY, Weekday::TUESDAY,
					   Weekday::WEDNESDAY, Weekday::THURSDAY,
					   Weekday::FRIDAY}));
	EXPECT_FALSE(config.precision);
	EXPECT_FALSE(config.enabled);
	EXPECT_EQ(config.next_run, ParseTime("2024-03-11T15:00:00Z"));
}

TEST(ScheduleFile, ClearSettings)
{
	ScheduleFileConfig file_config;
	ParseLine(file_config, "interval 1 hour");
	ParseLine(file_config, "start_date 2024-03-11T00:00:00Z");
	ParseLine(file_config, "start_time 09:00");
	ParseLine(file_config, "end_time 17:00");
	ParseLine(file_config, "weekdays sat sun");
	ParseLine(file_config, "next_run 2024-03-11T15:00:00Z");
	ParseLine(file_config, "precision yes");
	ParseLine(file_config, "enabled true");

	/* later lines override earlier ones */
	ParseLine(file_config, "start_date none");
	ParseLine(file_config, "start_time none");
	ParseLine(file_config, "end_time none");
	ParseLine(file_config, "weekdays");
	ParseLine(file_config, "next_run none");

	const auto config = ApplyOptions(file_config);
	EXPECT_FALSE(config.start_date);
	EXPECT_FALSE(config.window.IsDefined());
	EXPECT_FALSE(config.window.end);
	EXPECT_FALSE(config.weekdays.IsRestricted());
	EXPECT_FALSE(config.next_run);
	EXPECT_TRUE(config.precision);
	EXPECT_TRUE(config.enabled);
}

TEST(ScheduleFile, Malformed)
{
	ScheduleFileConfig config;

	EXPECT_THROW(ParseLine(config, "start_time"), std::runtime_error);
	EXPECT_THROW(ParseLine(config, "start_time 25:00"), std::runtime_error);
	EXPECT_THROW(ParseLine(config, "end_time 9"), std::runtime_error);
	EXPECT_THROW(ParseLine(config, "start_date yesterday"), std::runtime_error);
	EXPECT_THROW(ParseLine(config, "start_date 2024-03-11"), std::runtime_error);
	EXPECT_THROW(ParseLine(config, "weekdays mon funday"), std::runtime_error);
	EXPECT_THROW(ParseLine(config, "precision maybe"), std::runtime_error);
	EXPECT_THROW(ParseLine(config, "enabled"), std::runtime_error);
	EXPECT_THROW(ParseLine(config, "enabled yes no"), std::runtime_error);

	try {
		ParseLine(config, "frequency 5");
		FAIL() << "exception expected";
	} catch (const std::runtime_error &e) {
		EXPECT_STREQ(e.what(), "Unknown option 'frequency'");
	}

	EXPECT_TRUE(config.options.empty());
}

TEST(ScheduleFile, MakeSchedule)
{
	ScheduleFileConfig config;
	ParseLine(config, "interval 2 seconds");
	ParseLine(config, "start_time 09:00");
	ParseLine(config, "end_time 17:00");
	ParseLine(config, "weekdays mon tue wed thu fri");

	const auto schedule = config.MakeSchedule();
	EXPECT_EQ(schedule->Next(ParseTime("2024-03-15T16:59:59Z")),
		  ParseTime("2024-03-18T09:00:00Z"));
}

TEST(ScheduleFile, MakeScheduleRejected)
{
	ScheduleFileConfig config;
	ParseLine(config, "interval 1 month");
	ParseLine(config, "weekdays mon");

	try {
		config.MakeSchedule();
		FAIL() << "exception expected";
	} catch (const ScheduleConfigError &e) {
		EXPECT_EQ(e.GetCode(), ScheduleError::INCOMPATIBLE_WEEKDAY_FILTER);
	}
}

TEST(ScheduleFile, Load)
{
	const TemporaryFile file{
		"# nightly backup\n"
		"\n"
		"interval 1 day\r\n"
		"start_time 02:30\n"
		"weekdays mon wed fri # no weekends\n"
	};

	const auto config = LoadScheduleFile(file.c_str());
	EXPECT_EQ(config.interval, 1);
	EXPECT_EQ(config.unit, IntervalUnit::DAY);
	EXPECT_EQ(config.options.size(), 2U);

	const auto schedule = config.MakeSchedule();
	EXPECT_EQ(schedule->Next(ParseTime("2024-03-11T03:00:00+01:00")),
		  ParseTime("2024-03-13T02:30:00+01:00"));
}

TEST(ScheduleFile, LoadErrors)
{
	const TemporaryFile bad_line{
		"interval 5 minutes\n"
		"\n"
		"start_time 9:00\n"
		"bogus 1\n"
	};

	try {
		LoadScheduleFile(bad_line.c_str());
		FAIL() << "exception expected";
	} catch (...) {
		EXPECT_EQ(GetFullMessage(std::current_exception()),
			  std::string{bad_line.c_str()} + " line 4: Unknown option 'bogus'");
	}

	const TemporaryFile no_interval{
		"start_time 09:00\n"
	};

	try {
		LoadScheduleFile(no_interval.c_str());
		FAIL() << "exception expected";
	} catch (...) {
		EXPECT_EQ(GetFullMessage(std::current_exception()),
			  std::string{no_interval.c_str()} + ": Missing 'interval' setting");
	}

	EXPECT_THROW(LoadScheduleFile("/nonexistent/schedule.conf"),
		     std::system_error);
}
