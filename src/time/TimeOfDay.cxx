// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TimeOfDay.hxx"

#include <stdexcept>

#include <stdlib.h>

static unsigned
ParseField(const char *&s, unsigned max)
{
	if (*s < '0' || *s > '9')
		throw std::runtime_error("Digit expected in time of day");

	char *endptr;
	unsigned long value = strtoul(s, &endptr, 10);
	if (endptr - s > 2)
		throw std::runtime_error("Failed to parse time of day");

	if (value > max)
		throw std::runtime_error("Time of day field is too large");

	s = endptr;
	return value;
}

TimeOfDay
ParseTimeOfDay(const char *s)
{
	TimeOfDay t;

	t.hour = ParseField(s, 23);
	if (*s++ != ':')
		throw std::runtime_error("Colon expected in time of day");

	t.minute = ParseField(s, 59);

	if (*s == ':') {
		++s;
		t.second = ParseField(s, 59);

		if (*s == '.') {
			++s;

			/* up to nine fraction digits, padded on the right */
			unsigned n = 0;
			for (; *s >= '0' && *s <= '9'; ++s, ++n) {
				if (n >= 9)
					throw std::runtime_error("Too many fraction digits");

				t.nanosecond = t.nanosecond * 10 + (*s - '0');
			}

			if (n == 0)
				throw std::runtime_error("Fraction digits expected");

			for (; n < 9; ++n)
				t.nanosecond *= 10;
		}
	}

	if (*s != 0)
		throw std::runtime_error("Garbage at end of time of day");

	return t;
}
