// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "Logger.hxx"
#include "schedule/File.hxx"
#include "schedule/Schedule.hxx"
#include "time/ISO8601.hxx"

#include <stdio.h>
#include <stdlib.h>

static ZonedTime
Now() noexcept
{
	return {std::chrono::system_clock::now(), {}};
}

static void
Run(const CommandLine &cmdline)
{
	const Logger logger("interval-schedule");

	const auto file = LoadScheduleFile(cmdline.schedule_path);
	auto schedule = file.MakeSchedule();

	schedule->Set(SetAfterHook([&logger](const ZonedTime &next){
		logger.Fmt(4, "calculated {}", FormatISO8601(next));
	}));

	auto now = cmdline.now ? *cmdline.now : Now();
	logger.Fmt(3, "starting at {}", FormatISO8601(now));

	for (unsigned i = 0; i < cmdline.count; ++i) {
		now = schedule->Next(now);
		printf("%s\n", FormatISO8601(now).c_str());
	}
}

int
main(int argc, char **argv)
try {
	const auto cmdline = ParseCommandLine(argc, argv);

	Run(cmdline);

	return EXIT_SUCCESS;
} catch (...) {
	fprintf(stderr, "%s\n", GetFullMessage(std::current_exception()).c_str());
	return EXIT_FAILURE;
}
