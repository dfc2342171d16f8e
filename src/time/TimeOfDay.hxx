// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>

/**
 * A wall-clock time of day without a date and without a time zone.
 * The fields are interpreted in whatever offset the date they are
 * combined with lives in.
 */
struct TimeOfDay {
	unsigned hour = 0, minute = 0, second = 0;
	uint_least32_t nanosecond = 0;

	/**
	 * The last representable instant of a day.
	 */
	static constexpr TimeOfDay EndOfDay() noexcept {
		return {23, 59, 59, 999999999};
	}

	constexpr unsigned SecondsOfDay() const noexcept {
		return hour * 3600 + minute * 60 + second;
	}

	constexpr bool operator==(const TimeOfDay &other) const noexcept = default;
};

/**
 * Parse a time of day in the form "HH:MM", "HH:MM:SS" or
 * "HH:MM:SS.fraction".
 *
 * Throws std::runtime_error on error.
 */
TimeOfDay
ParseTimeOfDay(const char *s);
