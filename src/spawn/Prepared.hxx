// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "io/FileDescriptor.hxx"

#include <forward_list>
#include <string>
#include <string_view>
#include <vector>

/**
 * Everything needed to start a child process.  The pointers are not
 * owned by this object (except for the #strings allocated by
 * SetEnv()); they must remain valid until SpawnChildProcess()
 * returns.
 */
struct PreparedChildProcess {
	/**
	 * This program will be executed.  If it does not contain a
	 * slash, it is looked up in $PATH.  If this is nullptr, then
	 * args.front() will be used.
	 */
	const char *exec_path = nullptr;

	std::vector<const char *> args;
	std::vector<const char *> env;

	/**
	 * Descriptors to be installed as the child's standard
	 * streams.  Undefined means the child inherits ours.
	 */
	FileDescriptor stdin_fd = FileDescriptor::Undefined();
	FileDescriptor stdout_fd = FileDescriptor::Undefined();
	FileDescriptor stderr_fd = FileDescriptor::Undefined();

	/**
	 * Change the working directory.
	 */
	const char *chdir = nullptr;

	/**
	 * String allocations for SetEnv().
	 */
	std::forward_list<std::string> strings;

	PreparedChildProcess() noexcept = default;

	PreparedChildProcess(const PreparedChildProcess &) = delete;
	PreparedChildProcess &operator=(const PreparedChildProcess &) = delete;

	void Append(const char *arg) noexcept {
		args.push_back(arg);
	}

	void PutEnv(const char *p) noexcept {
		env.push_back(p);
	}

	void PutEnv(std::string &&s) noexcept {
		strings.emplace_front(std::move(s));
		PutEnv(strings.front().c_str());
	}

	void SetEnv(std::string_view name, std::string_view value) noexcept;

	/**
	 * Look up a variable in #env.  Returns nullptr if it is not
	 * set.
	 */
	[[gnu::pure]]
	const char *GetEnv(std::string_view name) const noexcept;

	/**
	 * Finish this object and return the executable path.
	 */
	const char *Finish() noexcept;
};
