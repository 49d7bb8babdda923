// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace JailSpawn {

struct Profile;

/**
 * Translate a #Profile into launcher options.  The order is fixed:
 * "--quiet", switches, capabilities, scalar options, modes, and
 * finally the lists.  Values are passed verbatim, without quoting.
 */
std::vector<std::string>
EmitFlags(const Profile &profile);

/**
 * Like EmitFlags(), but append the separator "--", the target
 * executable and its arguments.  The result is the complete argument
 * vector of the launcher (without argv[0]).
 */
std::vector<std::string>
MakeLauncherArgs(const Profile &profile, std::string_view executable,
		 std::span<const std::string> args);

} // namespace JailSpawn
