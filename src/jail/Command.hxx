// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "jailspawn/Profile.hxx"
#include "spawn/ChildProcess.hxx"
#include "spawn/Environment.hxx"
#include "spawn/Stdio.hxx"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace JailSpawn {

/**
 * Describes how a program is launched inside a firejail sandbox.
 * Each method edits the #Profile (or the invocation) and returns a
 * reference to this object, so calls can be chained.  Nothing is
 * validated until Spawn().
 */
class Command {
	Profile profile;

	/**
	 * The launcher program; looked up in $PATH unless it contains
	 * a slash.
	 */
	std::string launcher = "firejail";

	std::string executable;
	std::vector<std::string> args;

	std::optional<std::filesystem::path> current_dir;
	Environment env;
	Stdio stdin_stdio, stdout_stdio, stderr_stdio;

public:
	explicit Command(std::string_view _executable) noexcept
		:executable(_executable) {}

	Command(Command &&) noexcept = default;
	Command &operator=(Command &&) noexcept = default;

	const Profile &GetProfile() const noexcept {
		return profile;
	}

	const std::string &GetExecutable() const noexcept {
		return executable;
	}

	const std::string &GetLauncher() const noexcept {
		return launcher;
	}

	Command &Launcher(std::string_view _launcher) noexcept {
		launcher = _launcher;
		return *this;
	}

	Command &Verbose() noexcept {
		profile.verbose = true;
		return *this;
	}

	Command &Caps() noexcept {
		profile.caps = true;
		return *this;
	}

	Command &AllUsers() noexcept {
		profile.allusers = true;
		return *this;
	}

	Command &AppArmor() noexcept {
		profile.apparmor = true;
		return *this;
	}

	Command &AppImage() noexcept {
		profile.appimage = true;
		return *this;
	}

	Command &DeterministicExitCode() noexcept {
		profile.deterministic_exit_code = true;
		return *this;
	}

	Command &DisableMnt() noexcept {
		profile.disable_mnt = true;
		return *this;
	}

	Command &AllowDebuggers() noexcept {
		profile.allow_debuggers = true;
		return *this;
	}

	Command &IpcNamespace() noexcept {
		profile.ipc_namespace = true;
		return *this;
	}

	Command &KeepDevShm() noexcept {
		profile.keep_dev_shm = true;
		return *this;
	}

	Command &KeepVarTmp() noexcept {
		profile.keep_var_tmp = true;
		return *this;
	}

	Command &MachineId() noexcept {
		profile.machine_id = true;
		return *this;
	}

	Command &MemoryDenyWriteExecute() noexcept {
		profile.memory_deny_write_execute = true;
		return *this;
	}

	Command &No3d() noexcept {
		profile.no3d = true;
		return *this;
	}

	Command &NoAutoPulse() noexcept {
		profile.noautopulse = true;
		return *this;
	}

	Command &NoDvd() noexcept {
		profile.nodvd = true;
		return *this;
	}

	Command &NoGroups() noexcept {
		profile.nogroups = true;
		return *this;
	}

	Command &NoNewPrivs() noexcept {
		profile.nonewprivs = true;
		return *this;
	}

	Command &NoProfile() noexcept {
		profile.noprofile = true;
		return *this;
	}

	Command &NoRoot() noexcept {
		profile.noroot = true;
		return *this;
	}

	Command &NoSound() noexcept {
		profile.nosound = true;
		return *this;
	}

	Command &NoTv() noexcept {
		profile.notv = true;
		return *this;
	}

	Command &NoU2f() noexcept {
		profile.nou2f = true;
		return *this;
	}

	Command &NoVideo() noexcept {
		profile.novideo = true;
		return *this;
	}

	Command &PrivateCache() noexcept {
		profile.private_cache = true;
		return *this;
	}

	Command &PrivateDev() noexcept {
		profile.private_dev = true;
		return *this;
	}

	Command &PrivateTmp() noexcept {
		profile.private_tmp = true;
		return *this;
	}

	Command &SeccompBlockSecondary() noexcept {
		profile.seccomp_block_secondary = true;
		return *this;
	}

	Command &TraceLog() noexcept {
		profile.tracelog = true;
		return *this;
	}

	Command &WritableEtc() noexcept {
		profile.writable_etc = true;
		return *this;
	}

	Command &WritableRunUser() noexcept {
		profile.writable_run_user = true;
		return *this;
	}

	Command &WritableVar() noexcept {
		profile.writable_var = true;
		return *this;
	}

	Command &WritableVarLog() noexcept {
		profile.writable_var_log = true;
		return *this;
	}

	/* scalar options; the last call wins */

	Command &Cgroup(const std::filesystem::path &path) noexcept {
		profile.cgroup = path;
		return *this;
	}

	Command &Hostname(std::string_view hostname) noexcept {
		profile.hostname = hostname;
		return *this;
	}

	Command &HostsFile(const std::filesystem::path &path) noexcept {
		profile.hosts_file = path;
		return *this;
	}

	Command &Name(std::string_view name) noexcept {
		profile.name = name;
		return *this;
	}

	/**
	 * Load a firejail profile ("--profile=").
	 */
	Command &ProfileFile(const std::filesystem::path &path) noexcept {
		profile.profile = path;
		return *this;
	}

	Command &Chroot(const std::filesystem::path &path) noexcept {
		profile.chroot = path;
		return *this;
	}

	Command &Netns(std::string_view netns) noexcept {
		profile.netns = netns;
		return *this;
	}

	Command &DefaultGw(std::string_view address) noexcept {
		profile.defaultgw = address;
		return *this;
	}

	Command &NetFilter6(const std::filesystem::path &path) noexcept {
		profile.netfilter6 = path;
		return *this;
	}

	Command &Nice(int nice) noexcept {
		profile.nice = nice;
		return *this;
	}

	Command &Timeout(std::chrono::seconds timeout) noexcept {
		profile.timeout = timeout;
		return *this;
	}

	Command &RlimitAs(uint_least64_t value) noexcept {
		profile.rlimit_as = value;
		return *this;
	}

	Command &RlimitCpu(uint_least64_t value) noexcept {
		profile.rlimit_cpu = value;
		return *this;
	}

	Command &RlimitFsize(uint_least64_t value) noexcept {
		profile.rlimit_fsize = value;
		return *this;
	}

	Command &RlimitNofile(uint_least64_t value) noexcept {
		profile.rlimit_nofile = value;
		return *this;
	}

	Command &RlimitNproc(uint_least64_t value) noexcept {
		profile.rlimit_nproc = value;
		return *this;
	}

	Command &RlimitSigpending(uint_least64_t value) noexcept {
		profile.rlimit_sigpending = value;
		return *this;
	}

	Command &Output(const std::filesystem::path &path) noexcept {
		profile.output = path;
		return *this;
	}

	Command &OutputStderr(const std::filesystem::path &path) noexcept {
		profile.output_stderr = path;
		return *this;
	}

	/* modes; each call replaces the previous setting */

	/**
	 * Only effective together with Caps().
	 */
	Command &SetCapsDrop(CapsDrop &&caps_drop) noexcept {
		profile.caps_drop = std::move(caps_drop);
		return *this;
	}

	Command &SetNet(Net &&net) noexcept {
		profile.net = std::move(net);
		return *this;
	}

	Command &SetNetFilter(JailSpawn::NetFilter &&netfilter) noexcept {
		profile.netfilter = std::move(netfilter);
		return *this;
	}

	Command &SetJoin(Join &&join) noexcept {
		profile.join = std::move(join);
		return *this;
	}

	Command &SetOverlay(Overlay &&overlay) noexcept {
		profile.overlay = std::move(overlay);
		return *this;
	}

	Command &SetPrivate(Private &&private_home) noexcept {
		profile.private_home = std::move(private_home);
		return *this;
	}

	Command &SetPrivateList(PrivateList &&private_list) noexcept {
		profile.private_list = std::move(private_list);
		return *this;
	}

	Command &SetSeccomp(Seccomp &&seccomp) noexcept {
		profile.seccomp = std::move(seccomp);
		return *this;
	}

	Command &SetShell(Shell &&shell) noexcept {
		profile.shell = std::move(shell);
		return *this;
	}

	Command &SetX11(X11 x11) noexcept {
		profile.x11 = x11;
		return *this;
	}

	/**
	 * Add a network interface ("--net=DEVICE").  The following
	 * per-interface methods apply to the most recently added one;
	 * they are ignored if there is none.
	 */
	Command &NetInterface(std::string_view device) noexcept;

	Command &Ip(IpConfig &&ip) noexcept;
	Command &Ip6(std::string_view address) noexcept;
	Command &Mac(std::string_view address) noexcept;
	Command &Mtu(unsigned mtu) noexcept;
	Command &Netmask(std::string_view netmask) noexcept;
	Command &VethName(std::string_view name) noexcept;

	/* lists; append order is preserved */

	Command &Cpu(unsigned cpu) noexcept {
		profile.cpus.push_back(cpu);
		return *this;
	}

	template<typename R>
	Command &Cpus(const R &cpus) noexcept {
		for (const auto &i : cpus)
			Cpu(i);
		return *this;
	}

	Command &Bind(const std::filesystem::path &source,
		      const std::filesystem::path &target) noexcept {
		profile.binds.push_back({source, target});
		return *this;
	}

	/**
	 * @param binds a range of (source, target) pairs
	 */
	template<typename R>
	Command &Binds(const R &binds) noexcept {
		for (const auto &[source, target] : binds)
			Bind(source, target);
		return *this;
	}

	Command &Dns(std::string_view address) noexcept {
		profile.dns.emplace_back(address);
		return *this;
	}

	template<typename R>
	Command &DnsServers(const R &addresses) noexcept {
		for (const auto &i : addresses)
			Dns(i);
		return *this;
	}

	Command &Blacklist(const std::filesystem::path &path) noexcept {
		profile.blacklists.push_back(path);
		return *this;
	}

	template<typename R>
	Command &Blacklists(const R &paths) noexcept {
		for (const auto &i : paths)
			Blacklist(i);
		return *this;
	}

	Command &Ignore(std::string_view command) noexcept {
		profile.ignores.emplace_back(command);
		return *this;
	}

	template<typename R>
	Command &Ignores(const R &commands) noexcept {
		for (const auto &i : commands)
			Ignore(i);
		return *this;
	}

	Command &Noblacklist(const std::filesystem::path &path) noexcept {
		profile.noblacklists.push_back(path);
		return *this;
	}

	template<typename R>
	Command &Noblacklists(const R &paths) noexcept {
		for (const auto &i : paths)
			Noblacklist(i);
		return *this;
	}

	Command &Whitelist(const std::filesystem::path &path) noexcept {
		profile.whitelists.push_back(path);
		return *this;
	}

	template<typename R>
	Command &Whitelists(const R &paths) noexcept {
		for (const auto &i : paths)
			Whitelist(i);
		return *this;
	}

	Command &Nowhitelist(const std::filesystem::path &path) noexcept {
		profile.nowhitelists.push_back(path);
		return *this;
	}

	template<typename R>
	Command &Nowhitelists(const R &paths) noexcept {
		for (const auto &i : paths)
			Nowhitelist(i);
		return *this;
	}

	Command &ReadOnly(const std::filesystem::path &path) noexcept {
		profile.read_only.push_back(path);
		return *this;
	}

	template<typename R>
	Command &ReadOnlyPaths(const R &paths) noexcept {
		for (const auto &i : paths)
			ReadOnly(i);
		return *this;
	}

	Command &ReadWrite(const std::filesystem::path &path) noexcept {
		profile.read_write.push_back(path);
		return *this;
	}

	template<typename R>
	Command &ReadWritePaths(const R &paths) noexcept {
		for (const auto &i : paths)
			ReadWrite(i);
		return *this;
	}

	Command &Noexec(const std::filesystem::path &path) noexcept {
		profile.noexec.push_back(path);
		return *this;
	}

	template<typename R>
	Command &NoexecPaths(const R &paths) noexcept {
		for (const auto &i : paths)
			Noexec(i);
		return *this;
	}

	Command &Tmpfs(const std::filesystem::path &path) noexcept {
		profile.tmpfs.push_back(path);
		return *this;
	}

	template<typename R>
	Command &TmpfsPaths(const R &paths) noexcept {
		for (const auto &i : paths)
			Tmpfs(i);
		return *this;
	}

	/**
	 * Set an environment variable inside the sandbox
	 * ("--env=NAME=VALUE").  See Env() for the launcher's own
	 * environment.
	 */
	Command &JailEnv(std::string_view name, std::string_view value) noexcept {
		profile.env.emplace_back(name, value);
		return *this;
	}

	template<typename R>
	Command &JailEnvs(const R &vars) noexcept {
		for (const auto &[name, value] : vars)
			JailEnv(name, value);
		return *this;
	}

	Command &RmEnv(std::string_view name) noexcept {
		profile.rmenv.emplace_back(name);
		return *this;
	}

	template<typename R>
	Command &RmEnvs(const R &names) noexcept {
		for (const auto &i : names)
			RmEnv(i);
		return *this;
	}

	Command &Protocol(std::string_view protocol) noexcept {
		profile.protocols.emplace_back(protocol);
		return *this;
	}

	template<typename R>
	Command &Protocols(const R &protocols) noexcept {
		for (const auto &i : protocols)
			Protocol(i);
		return *this;
	}

	/* the target invocation */

	Command &Arg(std::string_view arg) noexcept {
		args.emplace_back(arg);
		return *this;
	}

	template<typename R>
	Command &Args(const R &_args) noexcept {
		for (const auto &i : _args)
			Arg(i);
		return *this;
	}

	/* the launcher process */

	Command &CurrentDir(const std::filesystem::path &path) noexcept {
		current_dir = path;
		return *this;
	}

	Command &EnvClear() noexcept {
		env.Clear();
		return *this;
	}

	Command &EnvRemove(std::string_view name) noexcept {
		env.Remove(name);
		return *this;
	}

	Command &Env(std::string_view name, std::string_view value) noexcept {
		env.Set(name, value);
		return *this;
	}

	template<typename R>
	Command &Envs(const R &vars) noexcept {
		for (const auto &[name, value] : vars)
			Env(name, value);
		return *this;
	}

	Command &Stdin(Stdio &&stdio) noexcept {
		stdin_stdio = std::move(stdio);
		return *this;
	}

	Command &Stdout(Stdio &&stdio) noexcept {
		stdout_stdio = std::move(stdio);
		return *this;
	}

	Command &Stderr(Stdio &&stdio) noexcept {
		stderr_stdio = std::move(stdio);
		return *this;
	}

	/**
	 * Returns the launcher's argument vector (without argv[0])
	 * without starting anything.
	 */
	std::vector<std::string> MakeArgs() const;

	/**
	 * Start the launcher.  This object may be used again
	 * afterwards.
	 *
	 * Throws std::system_error on error.
	 */
	ChildProcess Spawn() const;
};

} // namespace JailSpawn
