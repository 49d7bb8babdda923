// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Logger.hxx"

#include <fmt/format.h>

#include <iterator>

#include <stdio.h>

static unsigned log_level = 1;

void
SetLogLevel(unsigned level) noexcept
{
	log_level = level;
}

unsigned
GetLogLevel() noexcept
{
	return log_level;
}

void
LogString(unsigned, std::string_view domain,
	  std::string_view message) noexcept
{
	if (domain.empty())
		fmt::print(stderr, "{}\n", message);
	else
		fmt::print(stderr, "{}: {}\n", domain, message);
}

void
LogVFmt(unsigned level, std::string_view domain,
	fmt::string_view format_str, fmt::format_args args) noexcept
try {
	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	LogString(level, domain, {buffer.data(), buffer.size()});
} catch (const std::exception &) {
	/* malformed format string */
	LogString(level, domain, {format_str.data(), format_str.size()});
}
