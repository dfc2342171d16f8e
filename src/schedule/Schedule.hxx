// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Config.hxx"
#include "Option.hxx"
#include "Logger.hxx"

#include <array>
#include <concepts>
#include <initializer_list>
#include <mutex>
#include <span>

/**
 * A recurring schedule with a fixed interval, an optional daily
 * time window, an optional start date and an optional weekday
 * restriction.  A driver calls Next() to learn when to run the job
 * next time.
 *
 * All methods are thread-safe.  Hooks are invoked while the
 * internal lock is held; they may call Set() (but not Next()).
 */
class IntervalSchedule {
	const Logger logger;

	mutable std::recursive_mutex mutex;

	ScheduleConfig config;

public:
	/**
	 * Throws #ScheduleConfigError if the resulting configuration is
	 * invalid.
	 */
	IntervalSchedule(int interval, IntervalUnit unit,
			 std::span<const ScheduleOption> options={});

	IntervalSchedule(int interval, IntervalUnit unit,
			 std::initializer_list<ScheduleOption> options)
		:IntervalSchedule(interval, unit,
				  std::span<const ScheduleOption>{options.begin(), options.size()}) {}

	IntervalSchedule(const IntervalSchedule &) = delete;
	IntervalSchedule &operator=(const IntervalSchedule &) = delete;

	/**
	 * Determine the next run time after @a now.  Never fails.
	 */
	ZonedTime Next(const ZonedTime &now);

	/**
	 * Apply the options to a copy of the configuration and commit
	 * it only if it is valid.
	 *
	 * Throws #ScheduleConfigError (and leaves the schedule
	 * unmodified) if the resulting configuration is invalid.
	 */
	void Set(std::span<const ScheduleOption> options);

	template<std::convertible_to<ScheduleOption>... Options>
	void Set(Options&&... options) {
		const std::array<ScheduleOption, sizeof...(Options)> list{
			ScheduleOption(std::forward<Options>(options))...
		};
		Set(std::span<const ScheduleOption>{list});
	}

	/**
	 * Obtain a copy of the current configuration.
	 */
	ScheduleConfig GetConfig() const;

private:
	void InvokeBeforeHook();
	void InvokeAfterHook(const ZonedTime &next);
};
