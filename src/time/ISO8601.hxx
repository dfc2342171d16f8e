// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Zoned.hxx"

#include <string>

/**
 * Format the time in its own offset, e.g.
 * "2024-03-11T09:00:00+01:00" or "2024-03-11T09:00:00Z".  A
 * sub-second part is appended only if it is non-zero.
 */
std::string
FormatISO8601(const ZonedTime &t);

/**
 * Parse "YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)".  The
 * resulting #ZonedTime carries the parsed offset.
 *
 * Throws std::runtime_error on error.
 */
ZonedTime
ParseISO8601(const char *s);
