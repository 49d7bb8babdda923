// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Direct.hxx"
#include "Prepared.hxx"
#include "io/Logger.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "system/Error.hxx"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <stdexcept>
#include <string>
#include <string_view>

#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

static const Logger spawn_logger("spawn");

static constexpr const char *default_path = "/usr/local/bin:/usr/bin:/bin";

/**
 * Is this a regular file which we may execute?  Directories pass
 * the access() check, but execve() rejects them.
 */
[[gnu::pure]]
static bool
IsExecutable(const char *path) noexcept
{
	struct stat st;
	return stat(path, &st) == 0 && S_ISREG(st.st_mode) &&
		access(path, X_OK) == 0;
}

/**
 * Find an executable in a colon-separated directory list.
 */
static std::string
SearchPath(std::string_view name, std::string_view path)
{
	while (true) {
		const auto colon = path.find(':');
		auto directory = path.substr(0, colon);

		/* an empty entry means the current directory */
		if (directory.empty())
			directory = ".";

		std::string candidate{directory};
		candidate.push_back('/');
		candidate.append(name);

		if (IsExecutable(candidate.c_str()))
			return candidate;

		if (colon == path.npos)
			break;

		path = path.substr(colon + 1);
	}

	throw FmtErrno(ENOENT, "Executable not found: {}", name);
}

/**
 * Resolve a program name without a slash the way execvp() would,
 * preferring the child's $PATH.
 */
static std::string
ResolveExecutable(const PreparedChildProcess &p, const char *name)
{
	if (strchr(name, '/') != nullptr)
		return name;

	const char *path = p.GetEnv("PATH");
	if (path == nullptr)
		path = getenv("PATH");
	if (path == nullptr)
		path = default_path;

	return SearchPath(name, path);
}

/**
 * Send errno to the parent and exit.
 */
[[noreturn]]
static void
ChildFailed(FileDescriptor error_pipe) noexcept
{
	const int e = errno;
	[[maybe_unused]] auto nbytes = error_pipe.Write(&e, sizeof(e));
	_exit(EXIT_FAILURE);
}

[[noreturn]]
static void
Exec(const char *path, const PreparedChildProcess &p,
     FileDescriptor error_pipe) noexcept
{
	if ((p.stdin_fd.IsDefined() &&
	     !p.stdin_fd.CheckDuplicate(FileDescriptor(STDIN_FILENO))) ||
	    (p.stdout_fd.IsDefined() &&
	     !p.stdout_fd.CheckDuplicate(FileDescriptor(STDOUT_FILENO))) ||
	    (p.stderr_fd.IsDefined() &&
	     !p.stderr_fd.CheckDuplicate(FileDescriptor(STDERR_FILENO))))
		ChildFailed(error_pipe);

	if (p.chdir != nullptr && ::chdir(p.chdir) < 0)
		ChildFailed(error_pipe);

	execve(path, const_cast<char *const*>(p.args.data()),
	       const_cast<char *const*>(p.env.data()));
	ChildFailed(error_pipe);
}

pid_t
SpawnChildProcess(PreparedChildProcess &&p)
{
	const char *name = p.Finish();
	if (name == nullptr)
		throw std::invalid_argument("No executable");

	const auto path = ResolveExecutable(p, name);

	if (CheckLogLevel(4))
		spawn_logger.Fmt(4, "exec {} [{}]", path,
				 fmt::join(p.args, " "));

	p.args.push_back(nullptr);
	p.env.push_back(nullptr);

	UniqueFileDescriptor error_r, error_w;
	if (!UniqueFileDescriptor::CreatePipe(error_r, error_w))
		throw MakeErrno("pipe() failed");

	const pid_t pid = fork();
	if (pid < 0)
		throw MakeErrno("fork() failed");

	if (pid == 0)
		Exec(path.c_str(), p, error_w.ToFileDescriptor());

	error_w.Close();

	int e;
	ssize_t nbytes;
	do {
		nbytes = error_r.Read(&e, sizeof(e));
	} while (nbytes < 0 && errno == EINTR);

	if (nbytes == 0)
		/* the pipe was closed by execve() */
		return pid;

	if (nbytes < 0)
		e = errno;
	else if (nbytes != sizeof(e))
		e = EIO;

	/* reap the failed child */
	int status;
	while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

	throw FmtErrno(e, "Failed to execute {}", path);
}
