// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <sys/types.h>

struct PreparedChildProcess;

/**
 * Start a child process with fork() and execve().  A failure in the
 * child before or during execve() (e.g. a bad working directory) is
 * reported back through a close-on-exec pipe and thrown here.
 *
 * Throws std::system_error on error.
 *
 * @return the process id of the new child process
 */
[[nodiscard]]
pid_t
SpawnChildProcess(PreparedChildProcess &&params);
