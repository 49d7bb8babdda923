// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <fmt/core.h>

#include <system_error>
#include <utility>

#include <errno.h>

/**
 * Returns the error_category to be used to wrap errno values.  The
 * C++ standard does not define this well, so this code is based on
 * observations what C++ standard library implementations actually
 * use.
 */
static inline const std::error_category &
ErrnoCategory() noexcept
{
	return std::system_category();
}

static inline std::system_error
MakeErrno(int code, const char *msg) noexcept
{
	return std::system_error(code, ErrnoCategory(), msg);
}

static inline std::system_error
MakeErrno(const char *msg) noexcept
{
	return MakeErrno(errno, msg);
}

template<typename S, typename... Args>
static inline std::system_error
FmtErrno(int code, const S &format_str, Args&&... args) noexcept
{
	return MakeErrno(code,
			 fmt::vformat(format_str,
				      fmt::make_format_args(args...)).c_str());
}

template<typename S, typename... Args>
static inline std::system_error
FmtErrno(const S &format_str, Args&&... args) noexcept
{
	const int code = errno;
	return FmtErrno(code, format_str, std::forward<Args>(args)...);
}
