// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "ChildProcess.hxx"
#include "system/Error.hxx"

#include <stdexcept>

#include <errno.h>
#include <signal.h>
#include <sys/wait.h>

static void
CheckMoved(pid_t pid)
{
	if (pid < 0)
		throw std::logic_error("Process handle has been moved");
}

int
ChildProcess::Wait()
{
	if (status)
		return *status;

	CheckMoved(pid);

	int s;
	while (waitpid(pid, &s, 0) < 0) {
		if (errno != EINTR)
			throw FmtErrno("waitpid({}) failed", pid);
	}

	status = s;
	return s;
}

std::optional<int>
ChildProcess::TryWait()
{
	if (status)
		return status;

	CheckMoved(pid);

	int s;
	pid_t result;
	do {
		result = waitpid(pid, &s, WNOHANG);
	} while (result < 0 && errno == EINTR);

	if (result < 0)
		throw FmtErrno("waitpid({}) failed", pid);

	if (result == 0)
		return std::nullopt;

	status = s;
	return status;
}

void
ChildProcess::Kill(int signo)
{
	if (status || pid < 0)
		return;

	if (kill(pid, signo) < 0)
		throw FmtErrno("Failed to send signal {} to process {}",
			       signo, pid);
}
