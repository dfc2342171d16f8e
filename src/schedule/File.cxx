// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "File.hxx"
#include "Schedule.hxx"
#include "io/TextFile.hxx"
#include "time/ISO8601.hxx"

#include <fmt/core.h>

#include <exception>
#include <stdexcept>

#include <limits.h>
#include <stdlib.h>
#include <string.h>

static constexpr bool
IsWhitespace(char ch) noexcept
{
	return ch == ' ' || ch == '\t';
}

/**
 * Split off the next whitespace-separated word and terminate it.
 *
 * @return the word or nullptr at the end of the line (or at the
 * beginning of a comment)
 */
static char *
NextWord(char *&p) noexcept
{
	while (IsWhitespace(*p))
		++p;

	if (*p == 0 || *p == '#')
		return nullptr;

	char *word = p;
	while (*p != 0 && !IsWhitespace(*p) && *p != '#')
		++p;

	if (IsWhitespace(*p))
		*p++ = 0;
	else if (*p == '#')
		/* comment directly after the word: terminate here and
		   stop parsing */
		*p = 0;

	return word;
}

static char *
ExpectWord(char *&p)
{
	char *word = NextWord(p);
	if (word == nullptr)
		throw std::runtime_error("Value expected");

	return word;
}

static void
ExpectEnd(char *&p)
{
	if (NextWord(p) != nullptr)
		throw std::runtime_error("Too many arguments");
}

static char *
ExpectValueAndEnd(char *&p)
{
	char *value = ExpectWord(p);
	ExpectEnd(p);
	return value;
}

static bool
ParseBool(const char *s)
{
	if (strcmp(s, "yes") == 0 || strcmp(s, "true") == 0 ||
	    strcmp(s, "on") == 0)
		return true;

	if (strcmp(s, "no") == 0 || strcmp(s, "false") == 0 ||
	    strcmp(s, "off") == 0)
		return false;

	throw std::runtime_error("Boolean value expected");
}

static int
ParsePositive(const char *s)
{
	char *endptr;
	long value = strtol(s, &endptr, 10);
	if (endptr == s || *endptr != 0)
		throw std::runtime_error("Failed to parse number");

	if (value < 1)
		throw std::runtime_error("Number is too small");

	if (value > INT_MAX)
		throw std::runtime_error("Number is too large");

	return value;
}

/**
 * Parse a time of day, or "none" to clear the setting.
 */
static std::optional<TimeOfDay>
ParseOptionalTimeOfDay(const char *s)
{
	if (strcmp(s, "none") == 0)
		return std::nullopt;

	return ParseTimeOfDay(s);
}

static std::optional<ZonedTime>
ParseOptionalTimestamp(const char *s)
{
	if (strcmp(s, "none") == 0)
		return std::nullopt;

	return ParseISO8601(s);
}

void
ParseScheduleLine(ScheduleFileConfig &config, char *line)
{
	char *p = line;
	const char *key = NextWord(p);
	if (key == nullptr)
		return;

	if (strcmp(key, "interval") == 0) {
		const int interval = ParsePositive(ExpectWord(p));
		const auto unit = ParseIntervalUnit(ExpectValueAndEnd(p));
		config.interval = interval;
		config.unit = unit;
	} else if (strcmp(key, "start_date") == 0) {
		config.options.emplace_back(SetStartDate(ParseOptionalTimestamp(ExpectValueAndEnd(p))));
	} else if (strcmp(key, "start_time") == 0) {
		config.options.emplace_back(SetStartTime(ParseOptionalTimeOfDay(ExpectValueAndEnd(p))));
	} else if (strcmp(key, "end_time") == 0) {
		config.options.emplace_back(SetEndTime(ParseOptionalTimeOfDay(ExpectValueAndEnd(p))));
	} else if (strcmp(key, "weekdays") == 0) {
		WeekdaySet days;
		const char *word;
		while ((word = NextWord(p)) != nullptr)
			days.Add(ParseWeekday(word));

		if (days.empty())
			/* "weekdays" without arguments removes the
			   restriction */
			config.options.emplace_back(SetAllowedWeekdays());
		else
			config.options.emplace_back(SetAllowedWeekdays(days));
	} else if (strcmp(key, "precision") == 0) {
		config.options.emplace_back(ParseBool(ExpectValueAndEnd(p))
					    ? EnablePrecision()
					    : DisablePrecision());
	} else if (strcmp(key, "enabled") == 0) {
		config.options.emplace_back(ParseBool(ExpectValueAndEnd(p))
					    ? Enable()
					    : Disable());
	} else if (strcmp(key, "next_run") == 0) {
		config.options.emplace_back(SetNextRun(ParseOptionalTimestamp(ExpectValueAndEnd(p))));
	} else
		throw std::runtime_error(fmt::format("Unknown option '{}'", key));
}

void
ScheduleFileConfig::Check() const
{
	if (interval < 1)
		throw std::runtime_error("Missing 'interval' setting");
}

std::unique_ptr<IntervalSchedule>
ScheduleFileConfig::MakeSchedule() const
{
	return std::make_unique<IntervalSchedule>(interval, unit,
						  std::span<const ScheduleOption>{options});
}

ScheduleFileConfig
LoadScheduleFile(TextFile &file)
{
	ScheduleFileConfig config;

	char *line;
	while ((line = file.ReadLine()) != nullptr) {
		try {
			ParseScheduleLine(config, line);
		} catch (...) {
			std::throw_with_nested(std::runtime_error(fmt::format("{} line {}",
									      file.GetPath(),
									      file.GetLineNumber())));
		}
	}

	try {
		config.Check();
	} catch (...) {
		std::throw_with_nested(std::runtime_error(file.GetPath()));
	}

	return config;
}

ScheduleFileConfig
LoadScheduleFile(const char *path)
{
	TextFile file{path};
	return LoadScheduleFile(file);
}
