// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "time/ISO8601.hxx"

#include <ostream>

/* let GoogleTest print ZonedTime values readably */
inline void
PrintTo(const ZonedTime &t, std::ostream *os)
{
	*os << FormatISO8601(t);
}

static inline ZonedTime
ParseTime(const char *s)
{
	return ParseISO8601(s);
}
