// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TimeWindow.hxx"
#include "time/Math.hxx"

#include <cassert>

ZonedTime
TimeWindow::OpensOn(const ZonedTime &day) const
{
	assert(IsDefined());

	return WithTimeOfDay(day, *start);
}

ZonedTime
TimeWindow::ClosesOn(const ZonedTime &day) const
{
	assert(IsDefined());

	return WithTimeOfDay(day, GetEnd());
}

bool
TimeWindow::Contains(const ZonedTime &t) const
{
	if (!IsDefined())
		return true;

	return t >= OpensOn(t) && t <= ClosesOn(t);
}
