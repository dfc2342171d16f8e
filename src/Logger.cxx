// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"

#include <stdio.h>

unsigned log_verbose = 2;

static void
AppendMessage(std::string &result, std::exception_ptr ep)
{
	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		result += e.what();

		try {
			std::rethrow_if_nested(e);
		} catch (...) {
			result += ": ";
			AppendMessage(result, std::current_exception());
		}
	} catch (const char *s) {
		result += s;
	} catch (...) {
		result += "Unknown exception";
	}
}

std::string
GetFullMessage(std::exception_ptr ep) noexcept
try {
	std::string result;
	AppendMessage(result, ep);
	return result;
} catch (const std::bad_alloc &) {
	return "Out of memory";
}

void
Logger::Exception(unsigned level, std::string_view msg,
		  std::exception_ptr ep) const noexcept
{
	if (!CheckLevel(level))
		return;

	try {
		Write(fmt::format("{}: {}", msg, GetFullMessage(ep)));
	} catch (const std::bad_alloc &) {
		Write(msg);
	}
}

void
Logger::Write(std::string_view msg) const noexcept
{
	if (!domain.empty())
		fprintf(stderr, "%s: ", domain.c_str());

	fwrite(msg.data(), 1, msg.size(), stderr);
	putc('\n', stderr);
}
