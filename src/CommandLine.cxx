// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "Logger.hxx"
#include "time/ISO8601.hxx"
#include "version.h"

#include <fmt/core.h>

#include <exception>

#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>

static void
usage()
{
	puts("usage: interval-schedule [options] FILE\n\n"
	     "valid options:\n"
	     " -h             help (this text)\n"
	     " --version\n"
	     " -V             show interval-schedule version\n"
	     " --verbose\n"
	     " -v             be more verbose\n"
	     " --quiet\n"
	     " -q             be quiet\n"
	     " --count NUM\n"
	     " -n NUM         print NUM run times (default: 5)\n"
	     " --now TIME\n"
	     " -t TIME        start at this ISO 8601 time instead of now\n"
	     "\n");
}

[[noreturn]]
static void
arg_error(const char *argv0, const char *msg)
{
	if (msg != nullptr)
		fmt::print(stderr, "{}: {}\n", argv0, msg);

	fmt::print(stderr, "Try '{} --help' for more information.\n", argv0);
	exit(EXIT_FAILURE);
}

CommandLine
ParseCommandLine(int argc, char **argv)
{
	static const struct option long_options[] = {
		{"help", 0, 0, 'h'},
		{"version", 0, 0, 'V'},
		{"verbose", 0, 0, 'v'},
		{"quiet", 0, 0, 'q'},
		{"count", 1, 0, 'n'},
		{"now", 1, 0, 't'},
		{0,0,0,0}
	};

	CommandLine cmdline;

	while (true) {
		int option_index = 0;
		int ret = getopt_long(argc, argv, "hVvqn:t:",
				      long_options, &option_index);
		if (ret == -1)
			break;

		switch (ret) {
		case 'h':
			usage();
			exit(EXIT_SUCCESS);

		case 'V':
			printf("interval-schedule v%s\n", VERSION);
			exit(EXIT_SUCCESS);

		case 'v':
			++log_verbose;
			break;

		case 'q':
			log_verbose = 0;
			break;

		case 'n': {
			char *endptr;
			unsigned long value = strtoul(optarg, &endptr, 10);
			if (endptr == optarg || *endptr != 0 || value == 0 ||
			    value > 100000)
				arg_error(argv[0], "invalid count specification");

			cmdline.count = value;
			break;
		}

		case 't':
			try {
				cmdline.now = ParseISO8601(optarg);
			} catch (...) {
				arg_error(argv[0],
					  GetFullMessage(std::current_exception()).c_str());
			}
			break;

		case '?':
			arg_error(argv[0], nullptr);

		default:
			exit(EXIT_FAILURE);
		}
	}

	/* check non-option arguments */

	if (optind >= argc)
		arg_error(argv[0], "schedule file expected");

	cmdline.schedule_path = argv[optind++];

	if (optind < argc)
		arg_error(argv[0], fmt::format("unrecognized argument: {}",
					       argv[optind]).c_str());

	return cmdline;
}
