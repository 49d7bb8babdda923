// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "io/UniqueFileDescriptor.hxx"

#include <optional>
#include <utility>

#include <sys/types.h>

/**
 * A handle to a running child process and the parent ends of its
 * piped standard streams.  The destructor does not wait for the
 * process; call Wait() to reap it.
 */
class ChildProcess {
	pid_t pid;

	/**
	 * The exit status once the process has been reaped.
	 */
	std::optional<int> status;

	UniqueFileDescriptor stdin_pipe, stdout_pipe, stderr_pipe;

public:
	ChildProcess(pid_t _pid,
		     UniqueFileDescriptor &&_stdin_pipe,
		     UniqueFileDescriptor &&_stdout_pipe,
		     UniqueFileDescriptor &&_stderr_pipe) noexcept
		:pid(_pid),
		 stdin_pipe(std::move(_stdin_pipe)),
		 stdout_pipe(std::move(_stdout_pipe)),
		 stderr_pipe(std::move(_stderr_pipe)) {}

	ChildProcess(ChildProcess &&src) noexcept
		:pid(std::exchange(src.pid, -1)),
		 status(src.status),
		 stdin_pipe(std::move(src.stdin_pipe)),
		 stdout_pipe(std::move(src.stdout_pipe)),
		 stderr_pipe(std::move(src.stderr_pipe)) {}

	ChildProcess &operator=(ChildProcess &&) = delete;

	pid_t GetPid() const noexcept {
		return pid;
	}

	/**
	 * The writing end of the child's stdin pipe.  Undefined
	 * unless Stdio::Piped() was used.  Close it to signal end of
	 * input.
	 */
	UniqueFileDescriptor &GetStdin() noexcept {
		return stdin_pipe;
	}

	/**
	 * The reading end of the child's stdout pipe.
	 */
	UniqueFileDescriptor &GetStdout() noexcept {
		return stdout_pipe;
	}

	/**
	 * The reading end of the child's stderr pipe.
	 */
	UniqueFileDescriptor &GetStderr() noexcept {
		return stderr_pipe;
	}

	/**
	 * Wait for the process to exit.  May be called again after it
	 * has returned.
	 *
	 * Throws std::system_error on error, std::logic_error if this
	 * handle has been moved from.
	 *
	 * @return the status as returned by waitpid()
	 */
	int Wait();

	/**
	 * Like Wait(), but does not block.
	 *
	 * @return the status or std::nullopt if the process is still
	 * running
	 */
	std::optional<int> TryWait();

	/**
	 * Send a signal to the process.  Does nothing if it has
	 * already been reaped or if this handle has been moved from.
	 *
	 * Throws std::system_error on error.
	 */
	void Kill(int signo);
};
