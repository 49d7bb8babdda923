// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

/*
 * Parse command line options.
 */

#pragma once

#include <span>
#include <vector>

struct JailSpawnCmdLine {
	/**
	 * Profile configuration files, loaded in this order.
	 */
	std::vector<const char *> profile_files;

	const char *launcher = nullptr;

	const char *chdir = nullptr;

	/**
	 * Print the launcher command line instead of running it.
	 */
	bool dry_run = false;

	/**
	 * Do not pass "--quiet" to the launcher.
	 */
	bool jail_verbose = false;

	const char *program = nullptr;

	std::span<char *const> args;
};

void
ParseCommandLine(JailSpawnCmdLine &cmdline, int argc, char **argv);
