// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ISO8601.hxx"
#include "Convert.hxx"
#include "Math.hxx"

#include <fmt/core.h>

#include <stdexcept>

#include <time.h>

std::string
FormatISO8601(const ZonedTime &t)
{
	const auto tm = GetFields(t);

	char buffer[64];
	strftime(buffer, sizeof(buffer), "%FT%T", &tm);

	std::string result{buffer};

	const auto sub_second = SubSecond(t.GetShifted());
	if (sub_second.count() != 0)
		result += fmt::format(".{:09}", sub_second.count());

	const auto offset = t.utc_offset.count();
	if (offset == 0)
		result.push_back('Z');
	else {
		const auto abs_offset = offset < 0 ? -offset : offset;
		result += fmt::format("{}{:02}:{:02}", offset < 0 ? '-' : '+',
				      abs_offset / 3600, abs_offset / 60 % 60);
	}

	return result;
}

static unsigned
ParseTwoDigits(const char *s)
{
	if (s[0] < '0' || s[0] > '9' || s[1] < '0' || s[1] > '9')
		throw std::runtime_error("Failed to parse ISO8601 offset");

	return (s[0] - '0') * 10 + (s[1] - '0');
}

ZonedTime
ParseISO8601(const char *s)
{
	struct tm tm{};
	const char *end = strptime(s, "%Y-%m-%dT%H:%M:%S", &tm);
	if (end == nullptr)
		throw std::runtime_error("Failed to parse ISO8601");

	std::chrono::nanoseconds sub_second{0};
	if (*end == '.') {
		++end;

		unsigned n = 0;
		long long value = 0;
		for (; *end >= '0' && *end <= '9'; ++end, ++n) {
			if (n >= 9)
				throw std::runtime_error("Too many fraction digits in ISO8601");
			value = value * 10 + (*end - '0');
		}

		if (n == 0)
			throw std::runtime_error("Fraction digits expected in ISO8601");

		for (; n < 9; ++n)
			value *= 10;

		sub_second = std::chrono::nanoseconds{value};
	}

	std::chrono::seconds offset{0};
	if (*end == 'Z') {
		++end;
	} else if (*end == '+' || *end == '-') {
		const bool negative = *end == '-';
		++end;

		const unsigned hours = ParseTwoDigits(end);
		end += 2;
		if (*end == ':')
			++end;
		const unsigned minutes = ParseTwoDigits(end);
		end += 2;

		if (hours > 23 || minutes > 59)
			throw std::runtime_error("ISO8601 offset out of range");

		offset = std::chrono::hours{hours} + std::chrono::minutes{minutes};
		if (negative)
			offset = -offset;
	} else
		throw std::runtime_error("Missing ISO8601 time zone designator");

	if (*end != 0)
		throw std::runtime_error("Garbage at end of ISO8601");

	const auto shifted = TimeGm(tm) +
		std::chrono::duration_cast<ZonedTime::duration>(sub_second);
	return {shifted - offset, offset};
}
