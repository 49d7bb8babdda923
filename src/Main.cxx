// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "CommandLine.hxx"
#include "jail/Command.hxx"
#include "jail/ProfileConfig.hxx"
#include "io/Logger.hxx"
#include "util/Exception.hxx"

#include <fmt/core.h>

#include <stdlib.h>
#include <sys/wait.h>

static int
ExitStatus(int status) noexcept
{
	if (WIFEXITED(status))
		return WEXITSTATUS(status);

	if (WIFSIGNALED(status))
		return 128 + WTERMSIG(status);

	return EXIT_FAILURE;
}

int
main(int argc, char **argv)
try {
	JailSpawnCmdLine cmdline;
	ParseCommandLine(cmdline, argc, argv);

	JailSpawn::Command command{cmdline.program};

	if (cmdline.launcher != nullptr)
		command.Launcher(cmdline.launcher);

	for (const char *path : cmdline.profile_files)
		JailSpawn::LoadProfileFile(command, path);

	if (cmdline.jail_verbose)
		command.Verbose();

	if (cmdline.chdir != nullptr)
		command.CurrentDir(cmdline.chdir);

	command.Args(cmdline.args);

	if (cmdline.dry_run) {
		fmt::print("{}\n", command.GetLauncher());
		for (const auto &i : command.MakeArgs())
			fmt::print("{}\n", i);
		return EXIT_SUCCESS;
	}

	auto child = command.Spawn();
	LogFmt(3, "main", "launched pid {}", child.GetPid());

	const int status = child.Wait();
	LogFmt(3, "main", "pid {} exited with status {:#x}",
	       child.GetPid(), status);

	return ExitStatus(status);
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
