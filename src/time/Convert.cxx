// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Convert.hxx"

#include <stdexcept>

#include <time.h>

static time_t
FloorTimeT(std::chrono::system_clock::time_point tp) noexcept
{
	return std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch()).count();
}

struct tm
GmTime(std::chrono::system_clock::time_point tp)
{
	const time_t t = FloorTimeT(tp);
	struct tm buffer, *tm = gmtime_r(&t, &buffer);
	if (tm == nullptr)
		throw std::runtime_error("gmtime_r() failed");

	return *tm;
}

std::chrono::system_clock::time_point
TimeGm(struct tm &tm) noexcept
{
	return std::chrono::system_clock::time_point{std::chrono::seconds{timegm(&tm)}};
}

std::chrono::nanoseconds
SubSecond(std::chrono::system_clock::time_point tp) noexcept
{
	const auto since_epoch = tp.time_since_epoch();
	return std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - std::chrono::floor<std::chrono::seconds>(since_epoch));
}
