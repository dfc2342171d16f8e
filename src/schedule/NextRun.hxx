// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "time/Zoned.hxx"

#include <chrono>

struct ScheduleConfig;

/**
 * While a schedule is disabled, the driver is asked to come back
 * after this duration.
 */
static constexpr std::chrono::minutes DISABLED_POLL_INTERVAL{5};

/**
 * Determine when to run the job next time, ignoring the "enabled"
 * flag, the cached #ScheduleConfig::next_run and the hooks (these
 * are handled by IntervalSchedule::Next()).
 *
 * All wall-clock calculations happen in the offset of @a now, and
 * the result is in that offset.
 *
 * @param config a valid configuration
 * @param now the current time
 * @return the next run time; it is after @a now unless the start
 * date or a weekday search produced an earlier instant
 */
ZonedTime
CalculateNextRun(const ScheduleConfig &config, const ZonedTime &now);
