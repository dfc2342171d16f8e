// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>

struct tm;

/**
 * Convert a UTC-based time point to a UTC-based "struct tm".  The
 * sub-second part is discarded (rounding towards the past, also for
 * time points before the epoch).
 *
 * Throws std::runtime_error if the time point cannot be represented.
 */
struct tm
GmTime(std::chrono::system_clock::time_point tp);

/**
 * Convert a UTC-based "struct tm" to a UTC-based time point.
 * Out-of-range fields are normalized (e.g. tm_mday=32 becomes the
 * first day of the next month), and the "struct tm" is updated.
 */
[[gnu::pure]]
std::chrono::system_clock::time_point
TimeGm(struct tm &tm) noexcept;

/**
 * Return the sub-second part of the given time point, i.e. the
 * distance to the previous full second.
 */
[[gnu::const]]
std::chrono::nanoseconds
SubSecond(std::chrono::system_clock::time_point tp) noexcept;
