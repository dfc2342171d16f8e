// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Error.hxx"

struct ScheduleConfig;

/**
 * Check the configuration for consistency.  The first problem found
 * is returned.
 */
[[gnu::pure]]
ScheduleError
Validate(const ScheduleConfig &config) noexcept;

/**
 * Like Validate(), but throws #ScheduleConfigError.
 */
void
CheckScheduleConfig(const ScheduleConfig &config);
