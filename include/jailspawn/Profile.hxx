// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Settings.hxx"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace JailSpawn {

/**
 * A bind mount inside the sandbox ("--bind=SOURCE,TARGET").
 */
struct BindMount {
	std::filesystem::path source, target;
};

/**
 * Everything the launcher is asked to do.  A default-constructed
 * instance requests nothing.
 */
struct Profile {
	/**
	 * Do not pass "--quiet" to the launcher.
	 */
	bool verbose = false;

	bool caps = false;
	bool allusers = false;
	bool apparmor = false;
	bool appimage = false;
	bool deterministic_exit_code = false;
	bool disable_mnt = false;
	bool allow_debuggers = false;
	bool ipc_namespace = false;
	bool keep_dev_shm = false;
	bool keep_var_tmp = false;
	bool machine_id = false;
	bool memory_deny_write_execute = false;
	bool no3d = false;
	bool noautopulse = false;
	bool nodvd = false;
	bool nogroups = false;
	bool nonewprivs = false;
	bool noprofile = false;
	bool noroot = false;
	bool nosound = false;
	bool notv = false;
	bool nou2f = false;
	bool novideo = false;
	bool private_cache = false;
	bool private_dev = false;
	bool private_tmp = false;
	bool seccomp_block_secondary = false;
	bool tracelog = false;
	bool writable_etc = false;
	bool writable_run_user = false;
	bool writable_var = false;
	bool writable_var_log = false;

	/**
	 * Only emitted if #caps is enabled.
	 */
	CapsDrop caps_drop;

	std::optional<std::filesystem::path> cgroup;
	std::optional<std::string> hostname;
	std::optional<std::filesystem::path> hosts_file;
	std::optional<std::string> name;
	std::optional<std::filesystem::path> profile;
	std::optional<std::filesystem::path> chroot;
	std::optional<std::string> netns;
	std::optional<std::string> defaultgw;
	std::optional<std::filesystem::path> netfilter6;
	std::optional<int> nice;
	std::optional<std::chrono::seconds> timeout;

	std::optional<uint_least64_t> rlimit_as;
	std::optional<uint_least64_t> rlimit_cpu;
	std::optional<uint_least64_t> rlimit_fsize;
	std::optional<uint_least64_t> rlimit_nofile;
	std::optional<uint_least64_t> rlimit_nproc;
	std::optional<uint_least64_t> rlimit_sigpending;

	std::optional<std::filesystem::path> output;
	std::optional<std::filesystem::path> output_stderr;

	Net net;
	NetFilter netfilter;
	Join join;
	Overlay overlay;
	Private private_home;
	PrivateList private_list;
	Seccomp seccomp;
	Shell shell;
	X11 x11 = X11::NOT_SPECIFIED;

	std::vector<unsigned> cpus;
	std::vector<BindMount> binds;
	std::vector<std::string> dns;
	std::vector<std::filesystem::path> blacklists;
	std::vector<std::string> ignores;
	std::vector<std::filesystem::path> noblacklists;
	std::vector<std::filesystem::path> whitelists;
	std::vector<std::filesystem::path> nowhitelists;
	std::vector<std::filesystem::path> read_only;
	std::vector<std::filesystem::path> read_write;
	std::vector<std::filesystem::path> noexec;
	std::vector<std::filesystem::path> tmpfs;

	/**
	 * Environment variables set inside the sandbox
	 * ("--env=NAME=VALUE").
	 */
	std::vector<std::pair<std::string, std::string>> env;

	/**
	 * Environment variables removed inside the sandbox
	 * ("--rmenv=NAME").
	 */
	std::vector<std::string> rmenv;

	std::vector<std::string> protocols;
};

} // namespace JailSpawn
