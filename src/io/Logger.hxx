// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <fmt/core.h>

#include <string>
#include <string_view>
#include <utility>

/**
 * Set the global log level.  Messages with a level above this are
 * discarded; 0 shows only fatal errors.
 */
void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
unsigned
GetLogLevel() noexcept;

[[gnu::pure]]
static inline bool
CheckLogLevel(unsigned level) noexcept
{
	return level <= GetLogLevel();
}

void
LogString(unsigned level, std::string_view domain,
	  std::string_view message) noexcept;

void
LogVFmt(unsigned level, std::string_view domain,
	fmt::string_view format_str, fmt::format_args args) noexcept;

template<typename S, typename... Args>
void
LogFmt(unsigned level, std::string_view domain,
       const S &format_str, Args&&... args) noexcept
{
	if (!CheckLogLevel(level))
		return;

	LogVFmt(level, domain, format_str,
		fmt::make_format_args(args...));
}

/**
 * A logger bound to a domain name which is prepended to each
 * message.
 */
class Logger {
	const std::string domain;

public:
	explicit Logger(std::string_view _domain) noexcept
		:domain(_domain) {}

	template<typename S, typename... Args>
	void Fmt(unsigned level, const S &format_str,
		 Args&&... args) const noexcept {
		LogFmt(level, domain, format_str,
		       std::forward<Args>(args)...);
	}
};
