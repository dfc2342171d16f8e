// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <compare>

/**
 * An instant together with the fixed UTC offset in which its
 * wall-clock fields (date, hour, minute, ...) are read.
 *
 * Comparisons only look at the instant; two objects describing the
 * same instant in different offsets are equal.
 */
struct ZonedTime {
	using clock_type = std::chrono::system_clock;
	using time_point = clock_type::time_point;
	using duration = clock_type::duration;

	time_point time;

	/**
	 * The offset east of UTC.
	 */
	std::chrono::seconds utc_offset{0};

	constexpr bool operator==(const ZonedTime &other) const noexcept {
		return time == other.time;
	}

	constexpr std::strong_ordering operator<=>(const ZonedTime &other) const noexcept {
		return time <=> other.time;
	}

	/**
	 * The same instant, read in another offset.
	 */
	constexpr ZonedTime In(std::chrono::seconds offset) const noexcept {
		return {time, offset};
	}

	/**
	 * Add an exact duration; the offset is kept.
	 */
	template<typename Rep, typename Period>
	constexpr ZonedTime operator+(std::chrono::duration<Rep, Period> d) const noexcept {
		return {time + std::chrono::duration_cast<duration>(d), utc_offset};
	}

	/**
	 * The "local" time point, i.e. the instant shifted by the
	 * offset so that UTC-based conversions yield the wall-clock
	 * fields.
	 */
	constexpr time_point GetShifted() const noexcept {
		return time + utc_offset;
	}
};

/**
 * Construct a #ZonedTime from UTC seconds since the epoch (for
 * tests and command line parsing).
 */
constexpr ZonedTime
MakeZonedTime(std::chrono::sys_seconds t, std::chrono::seconds utc_offset={}) noexcept
{
	return {t, utc_offset};
}
