// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <exception>
#include <new>
#include <string>
#include <string_view>

/**
 * Messages with a level above this value are suppressed.  1 means
 * errors only, 2 adds warnings (the default), 3 informational
 * messages, and bigger values debug output.
 */
extern unsigned log_verbose;

/**
 * Format the message of the given exception, including all nested
 * exceptions, separated by ": ".
 */
std::string
GetFullMessage(std::exception_ptr ep) noexcept;

/**
 * A logger with a domain name which is prefixed to each message
 * written to stderr.
 */
class Logger {
	std::string domain;

public:
	explicit Logger(std::string_view _domain)
		:domain(_domain) {}

	static bool CheckLevel(unsigned level) noexcept {
		return level <= log_verbose;
	}

	template<typename... Args>
	void Fmt(unsigned level, fmt::format_string<Args...> format_str,
		 Args&&... args) const noexcept {
		if (!CheckLevel(level))
			return;

		try {
			Write(fmt::format(format_str, std::forward<Args>(args)...));
		} catch (const std::bad_alloc &) {
			Write("Out of memory");
		}
	}

	void operator()(unsigned level, std::string_view msg) const noexcept {
		if (CheckLevel(level))
			Write(msg);
	}

	/**
	 * Log a message followed by the full message of an exception.
	 */
	void Exception(unsigned level, std::string_view msg,
		       std::exception_ptr ep) const noexcept;

private:
	void Write(std::string_view msg) const noexcept;
};
