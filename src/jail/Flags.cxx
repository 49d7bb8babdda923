// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Flags.hxx"
#include "jailspawn/Profile.hxx"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace JailSpawn {

namespace {

/**
 * Appends launcher options to a std::vector.
 */
class FlagList {
	std::vector<std::string> &v;

public:
	explicit FlagList(std::vector<std::string> &_v) noexcept
		:v(_v) {}

	void Add(std::string_view flag) {
		v.emplace_back(flag);
	}

	void Add(std::string_view prefix, std::string_view value) {
		std::string s;
		s.reserve(prefix.size() + value.size());
		s.append(prefix);
		s.append(value);
		v.emplace_back(std::move(s));
	}

	void AddPath(std::string_view prefix,
		     const std::filesystem::path &path) {
		Add(prefix, path.native());
	}

	template<typename T>
	void AddNumber(std::string_view prefix, T value) {
		v.emplace_back(fmt::format("{}{}", prefix, value));
	}

	template<typename L>
	void AddJoined(std::string_view prefix, const L &list) {
		v.emplace_back(fmt::format("{}{}", prefix,
					   fmt::join(list, ",")));
	}

	void AddOptional(std::string_view prefix,
			 const std::optional<std::string> &value) {
		if (value)
			Add(prefix, *value);
	}

	void AddOptional(std::string_view prefix,
			 const std::optional<std::filesystem::path> &value) {
		if (value)
			AddPath(prefix, *value);
	}

	template<typename T>
	void AddOptionalNumber(std::string_view prefix,
			       const std::optional<T> &value) {
		if (value)
			AddNumber(prefix, *value);
	}

	void AddEach(std::string_view prefix,
		     const std::vector<std::string> &list) {
		for (const auto &i : list)
			Add(prefix, i);
	}

	void AddEach(std::string_view prefix,
		     const std::vector<std::filesystem::path> &list) {
		for (const auto &i : list)
			AddPath(prefix, i);
	}
};

} // anonymous namespace

static constexpr struct {
	const char *flag;
	bool Profile::*field;
} switch_flags[] = {
	{ "--caps", &Profile::caps },
	{ "--allusers", &Profile::allusers },
	{ "--apparmor", &Profile::apparmor },
	{ "--appimage", &Profile::appimage },
	{ "--deterministic-exit-code", &Profile::deterministic_exit_code },
	{ "--disable-mnt", &Profile::disable_mnt },
	{ "--allow-debuggers", &Profile::allow_debuggers },
	{ "--ipc-namespace", &Profile::ipc_namespace },
	{ "--keep-dev-shm", &Profile::keep_dev_shm },
	{ "--keep-var-tmp", &Profile::keep_var_tmp },
	{ "--machine-id", &Profile::machine_id },
	{ "--memory-deny-write-execute", &Profile::memory_deny_write_execute },
	{ "--no3d", &Profile::no3d },
	{ "--noautopulse", &Profile::noautopulse },
	{ "--nodvd", &Profile::nodvd },
	{ "--nogroups", &Profile::nogroups },
	{ "--nonewprivs", &Profile::nonewprivs },
	{ "--noprofile", &Profile::noprofile },
	{ "--noroot", &Profile::noroot },
	{ "--nosound", &Profile::nosound },
	{ "--notv", &Profile::notv },
	{ "--nou2f", &Profile::nou2f },
	{ "--novideo", &Profile::novideo },
	{ "--private-cache", &Profile::private_cache },
	{ "--private-dev", &Profile::private_dev },
	{ "--private-tmp", &Profile::private_tmp },
	{ "--seccomp.block-secondary", &Profile::seccomp_block_secondary },
	{ "--tracelog", &Profile::tracelog },
	{ "--writable-etc", &Profile::writable_etc },
	{ "--writable-run-user", &Profile::writable_run_user },
	{ "--writable-var", &Profile::writable_var },
	{ "--writable-var-log", &Profile::writable_var_log },
};

static constexpr struct {
	PrivateList::Kind kind;
	const char *prefix;
} private_list_flags[] = {
	{ PrivateList::Kind::HOME, "--private-home=" },
	{ PrivateList::Kind::BIN, "--private-bin=" },
	{ PrivateList::Kind::ETC, "--private-etc=" },
	{ PrivateList::Kind::LIB, "--private-lib=" },
	{ PrivateList::Kind::OPT, "--private-opt=" },
	{ PrivateList::Kind::SRV, "--private-srv=" },
};

static void
EmitCapsDrop(FlagList &flags, const CapsDrop &caps_drop)
{
	struct Helper {
		FlagList &flags;

		void operator()(std::monostate) const noexcept {}

		void operator()(CapsDrop::DropAll) const {
			flags.Add("--caps.drop=all");
		}

		void operator()(const CapsDrop::Settings &settings) const {
			if (!settings.GetKeep().empty())
				flags.AddJoined("--caps.keep=", settings.GetKeep());
			if (!settings.GetDrop().empty())
				flags.AddJoined("--caps.drop=", settings.GetDrop());
		}
	};

	std::visit(Helper{flags}, caps_drop.value);
}

static void
EmitTimeout(FlagList &flags, std::chrono::seconds timeout)
{
	const auto t = std::max<std::chrono::seconds::rep>(timeout.count(), 0);
	flags.Add(fmt::format("--timeout={:02}:{:02}:{:02}",
			      t / 3600, t / 60 % 60, t % 60));
}

static void
EmitIpConfig(FlagList &flags, const IpConfig &ip)
{
	struct Helper {
		FlagList &flags;

		void operator()(std::monostate) const noexcept {}

		void operator()(IpConfig::None) const {
			flags.Add("--ip=none");
		}

		void operator()(IpConfig::Dhcp) const {
			flags.Add("--ip=dhcp");
		}

		void operator()(const IpConfig::Address &address) const {
			flags.Add("--ip=", address.address);
		}

		void operator()(const IpConfig::Range &range) const {
			flags.Add(fmt::format("--iprange={},{}",
					      range.first, range.last));
		}
	};

	std::visit(Helper{flags}, ip.value);
}

static void
EmitNetInterface(FlagList &flags, const NetInterface &interface)
{
	flags.Add("--net=", interface.device);
	EmitIpConfig(flags, interface.ip);
	flags.AddOptional("--ip6=", interface.ip6);
	flags.AddOptional("--mac=", interface.mac);
	flags.AddOptionalNumber("--mtu=", interface.mtu);
	flags.AddOptional("--netmask=", interface.netmask);
	flags.AddOptional("--veth-name=", interface.veth_name);
}

static void
EmitNet(FlagList &flags, const Net &net)
{
	struct Helper {
		FlagList &flags;

		void operator()(std::monostate) const noexcept {}

		void operator()(Net::None) const {
			flags.Add("--net=none");
		}

		void operator()(const Net::Interfaces &interfaces) const {
			for (const auto &i : interfaces)
				EmitNetInterface(flags, i);
		}
	};

	std::visit(Helper{flags}, net.value);
}

static void
EmitNetFilter(FlagList &flags, const NetFilter &netfilter)
{
	struct Helper {
		FlagList &flags;

		void operator()(std::monostate) const noexcept {}

		void operator()(NetFilter::Default) const {
			flags.Add("--netfilter");
		}

		void operator()(const NetFilter::File &file) const {
			flags.AddPath("--netfilter=", file.path);
		}
	};

	std::visit(Helper{flags}, netfilter.value);
}

static void
EmitJoin(FlagList &flags, const Join &join)
{
	struct Helper {
		FlagList &flags;

		void operator()(std::monostate) const noexcept {}

		void operator()(const Join::Any &any) const {
			flags.Add("--join=", any.target);
		}

		void operator()(const Join::Network &network) const {
			flags.Add("--join-network=", network.target);
		}

		void operator()(const Join::Filesystem &filesystem) const {
			flags.Add("--join-filesystem=", filesystem.target);
		}

		void operator()(const Join::OrStart &or_start) const {
			flags.Add("--join-or-start=", or_start.name);
		}
	};

	std::visit(Helper{flags}, join.value);
}

static void
EmitOverlay(FlagList &flags, const Overlay &overlay)
{
	struct Helper {
		FlagList &flags;

		void operator()(std::monostate) const noexcept {}

		void operator()(Overlay::Default) const {
			flags.Add("--overlay");
		}

		void operator()(Overlay::Tmpfs) const {
			flags.Add("--overlay-tmpfs");
		}

		void operator()(const Overlay::Named &named) const {
			flags.Add("--overlay-named=", named.name);
		}
	};

	std::visit(Helper{flags}, overlay.value);
}

static void
EmitPrivate(FlagList &flags, const Private &private_home)
{
	struct Helper {
		FlagList &flags;

		void operator()(std::monostate) const noexcept {}

		void operator()(Private::Temporary) const {
			flags.Add("--private");
		}

		void operator()(const Private::Directory &directory) const {
			flags.AddPath("--private=", directory.path);
		}
	};

	std::visit(Helper{flags}, private_home.value);
}

static void
EmitPrivateList(FlagList &flags, const PrivateList &private_list)
{
	const auto *settings = std::get_if<PrivateList::Settings>(&private_list.value);
	if (settings == nullptr)
		return;

	for (const auto &i : private_list_flags) {
		const auto &list = settings->Get(i.kind);
		if (!list.empty())
			flags.AddJoined(i.prefix, list);
	}
}

static void
EmitSeccomp(FlagList &flags, const Seccomp &seccomp)
{
	struct Helper {
		FlagList &flags;

		void operator()(std::monostate) const noexcept {}

		void operator()(Seccomp::Default) const {
			flags.Add("--seccomp");
		}

		void operator()(const Seccomp::Syscalls &syscalls) const {
			if (syscalls.syscalls.empty())
				flags.Add("--seccomp");
			else
				flags.AddJoined("--seccomp=", syscalls.syscalls);
		}

		void operator()(const Seccomp::Drop &drop) const {
			if (!drop.syscalls.empty())
				flags.AddJoined("--seccomp.drop=", drop.syscalls);
		}

		void operator()(const Seccomp::Keep &keep) const {
			if (!keep.syscalls.empty())
				flags.AddJoined("--seccomp.keep=", keep.syscalls);
		}
	};

	std::visit(Helper{flags}, seccomp.value);
}

static void
EmitShell(FlagList &flags, const Shell &shell)
{
	struct Helper {
		FlagList &flags;

		void operator()(std::monostate) const noexcept {}

		void operator()(Shell::None) const {
			flags.Add("--shell=none");
		}

		void operator()(const Shell::Program &program) const {
			flags.AddPath("--shell=", program.path);
		}
	};

	std::visit(Helper{flags}, shell.value);
}

static void
EmitX11(FlagList &flags, X11 x11)
{
	switch (x11) {
	case X11::NOT_SPECIFIED:
		break;

	case X11::AUTO:
		flags.Add("--x11");
		break;

	case X11::NONE:
		flags.Add("--x11=none");
		break;

	case X11::XEPHYR:
		flags.Add("--x11=xephyr");
		break;

	case X11::XORG:
		flags.Add("--x11=xorg");
		break;

	case X11::XPRA:
		flags.Add("--x11=xpra");
		break;

	case X11::XVFB:
		flags.Add("--x11=xvfb");
		break;
	}
}

std::vector<std::string>
EmitFlags(const Profile &profile)
{
	std::vector<std::string> result;
	FlagList flags{result};

	if (!profile.verbose)
		flags.Add("--quiet");

	for (const auto &i : switch_flags)
		if (profile.*i.field)
			flags.Add(i.flag);

	/* capability lists are meaningless without "--caps" */
	if (profile.caps)
		EmitCapsDrop(flags, profile.caps_drop);

	flags.AddOptional("--cgroup=", profile.cgroup);
	flags.AddOptional("--hostname=", profile.hostname);
	flags.AddOptional("--hosts-file=", profile.hosts_file);
	flags.AddOptional("--name=", profile.name);
	flags.AddOptional("--profile=", profile.profile);
	flags.AddOptional("--chroot=", profile.chroot);
	flags.AddOptional("--netns=", profile.netns);
	flags.AddOptional("--defaultgw=", profile.defaultgw);
	flags.AddOptional("--netfilter6=", profile.netfilter6);
	flags.AddOptionalNumber("--nice=", profile.nice);

	if (profile.timeout)
		EmitTimeout(flags, *profile.timeout);

	flags.AddOptionalNumber("--rlimit-as=", profile.rlimit_as);
	flags.AddOptionalNumber("--rlimit-cpu=", profile.rlimit_cpu);
	flags.AddOptionalNumber("--rlimit-fsize=", profile.rlimit_fsize);
	flags.AddOptionalNumber("--rlimit-nofile=", profile.rlimit_nofile);
	flags.AddOptionalNumber("--rlimit-nproc=", profile.rlimit_nproc);
	flags.AddOptionalNumber("--rlimit-sigpending=", profile.rlimit_sigpending);
	flags.AddOptional("--output=", profile.output);
	flags.AddOptional("--output-stderr=", profile.output_stderr);

	EmitNet(flags, profile.net);
	EmitNetFilter(flags, profile.netfilter);
	EmitJoin(flags, profile.join);
	EmitOverlay(flags, profile.overlay);
	EmitPrivate(flags, profile.private_home);
	EmitPrivateList(flags, profile.private_list);
	EmitSeccomp(flags, profile.seccomp);
	EmitShell(flags, profile.shell);
	EmitX11(flags, profile.x11);

	if (!profile.cpus.empty())
		flags.AddJoined("--cpu=", profile.cpus);

	for (const auto &i : profile.binds)
		flags.Add(fmt::format("--bind={},{}",
				      i.source.native(), i.target.native()));

	flags.AddEach("--dns=", profile.dns);
	flags.AddEach("--blacklist=", profile.blacklists);
	flags.AddEach("--ignore=", profile.ignores);
	flags.AddEach("--noblacklist=", profile.noblacklists);
	flags.AddEach("--whitelist=", profile.whitelists);
	flags.AddEach("--nowhitelist=", profile.nowhitelists);
	flags.AddEach("--read-only=", profile.read_only);
	flags.AddEach("--read-write=", profile.read_write);
	flags.AddEach("--noexec=", profile.noexec);
	flags.AddEach("--tmpfs=", profile.tmpfs);

	for (const auto &[name, value] : profile.env)
		flags.Add(fmt::format("--env={}={}", name, value));

	flags.AddEach("--rmenv=", profile.rmenv);

	if (!profile.protocols.empty())
		flags.AddJoined("--protocol=", profile.protocols);

	return result;
}

std::vector<std::string>
MakeLauncherArgs(const Profile &profile, std::string_view executable,
		 std::span<const std::string> args)
{
	auto result = EmitFlags(profile);
	result.reserve(result.size() + 2 + args.size());
	result.emplace_back("--");
	result.emplace_back(executable);
	result.insert(result.end(), args.begin(), args.end());
	return result;
}

} // namespace JailSpawn
