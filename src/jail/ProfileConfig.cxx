// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "ProfileConfig.hxx"
#include "Command.hxx"
#include "io/LineParser.hxx"
#include "io/Logger.hxx"
#include "util/StringAPI.hxx"

#include <climits>
#include <string>
#include <vector>

namespace JailSpawn {

namespace fs = std::filesystem;

using SwitchMethod = Command &(Command::*)() noexcept;
using StringMethod = Command &(Command::*)(std::string_view) noexcept;
using PathMethod = Command &(Command::*)(const fs::path &) noexcept;
using NumberMethod = Command &(Command::*)(uint_least64_t) noexcept;

static constexpr struct {
	const char *name;
	SwitchMethod method;
} switch_options[] = {
	{ "verbose", &Command::Verbose },
	{ "caps", &Command::Caps },
	{ "allusers", &Command::AllUsers },
	{ "apparmor", &Command::AppArmor },
	{ "appimage", &Command::AppImage },
	{ "deterministic-exit-code", &Command::DeterministicExitCode },
	{ "disable-mnt", &Command::DisableMnt },
	{ "allow-debuggers", &Command::AllowDebuggers },
	{ "ipc-namespace", &Command::IpcNamespace },
	{ "keep-dev-shm", &Command::KeepDevShm },
	{ "keep-var-tmp", &Command::KeepVarTmp },
	{ "machine-id", &Command::MachineId },
	{ "memory-deny-write-execute", &Command::MemoryDenyWriteExecute },
	{ "no3d", &Command::No3d },
	{ "noautopulse", &Command::NoAutoPulse },
	{ "nodvd", &Command::NoDvd },
	{ "nogroups", &Command::NoGroups },
	{ "nonewprivs", &Command::NoNewPrivs },
	{ "noprofile", &Command::NoProfile },
	{ "noroot", &Command::NoRoot },
	{ "nosound", &Command::NoSound },
	{ "notv", &Command::NoTv },
	{ "nou2f", &Command::NoU2f },
	{ "novideo", &Command::NoVideo },
	{ "private-cache", &Command::PrivateCache },
	{ "private-dev", &Command::PrivateDev },
	{ "private-tmp", &Command::PrivateTmp },
	{ "seccomp.block-secondary", &Command::SeccompBlockSecondary },
	{ "tracelog", &Command::TraceLog },
	{ "writable-etc", &Command::WritableEtc },
	{ "writable-run-user", &Command::WritableRunUser },
	{ "writable-var", &Command::WritableVar },
	{ "writable-var-log", &Command::WritableVarLog },
};

/**
 * Options with exactly one string value.
 */
static constexpr struct {
	const char *name;
	StringMethod method;
} string_options[] = {
	{ "hostname", &Command::Hostname },
	{ "name", &Command::Name },
	{ "netns", &Command::Netns },
	{ "defaultgw", &Command::DefaultGw },
};

/**
 * Options with exactly one path value.
 */
static constexpr struct {
	const char *name;
	PathMethod method;
} path_options[] = {
	{ "cgroup", &Command::Cgroup },
	{ "hosts-file", &Command::HostsFile },
	{ "profile", &Command::ProfileFile },
	{ "chroot", &Command::Chroot },
	{ "netfilter6", &Command::NetFilter6 },
	{ "output", &Command::Output },
	{ "output-stderr", &Command::OutputStderr },
};

static constexpr struct {
	const char *name;
	NumberMethod method;
} number_options[] = {
	{ "rlimit-as", &Command::RlimitAs },
	{ "rlimit-cpu", &Command::RlimitCpu },
	{ "rlimit-fsize", &Command::RlimitFsize },
	{ "rlimit-nofile", &Command::RlimitNofile },
	{ "rlimit-nproc", &Command::RlimitNproc },
	{ "rlimit-sigpending", &Command::RlimitSigpending },
};

/**
 * List options with one or more string values.
 */
static constexpr struct {
	const char *name;
	StringMethod method;
} string_list_options[] = {
	{ "dns", &Command::Dns },
	{ "ignore", &Command::Ignore },
	{ "rmenv", &Command::RmEnv },
	{ "protocol", &Command::Protocol },
};

/**
 * List options with one or more path values.
 */
static constexpr struct {
	const char *name;
	PathMethod method;
} path_list_options[] = {
	{ "blacklist", &Command::Blacklist },
	{ "noblacklist", &Command::Noblacklist },
	{ "whitelist", &Command::Whitelist },
	{ "nowhitelist", &Command::Nowhitelist },
	{ "read-only", &Command::ReadOnly },
	{ "read-write", &Command::ReadWrite },
	{ "noexec", &Command::Noexec },
	{ "tmpfs", &Command::Tmpfs },
};

static constexpr struct {
	const char *name;
	PrivateList::Kind kind;
} private_list_options[] = {
	{ "private-home", PrivateList::Kind::HOME },
	{ "private-bin", PrivateList::Kind::BIN },
	{ "private-etc", PrivateList::Kind::ETC },
	{ "private-lib", PrivateList::Kind::LIB },
	{ "private-opt", PrivateList::Kind::OPT },
	{ "private-srv", PrivateList::Kind::SRV },
};

/**
 * Parse one or more values up to the end of the line.
 */
static std::vector<std::string>
ExpectValues(LineParser &line)
{
	std::vector<std::string> values;

	do {
		values.emplace_back(line.ExpectValue());
	} while (!line.IsEnd());

	return values;
}

/**
 * Parse zero or more values up to the end of the line.
 */
static std::vector<std::string>
NextValues(LineParser &line)
{
	if (line.IsEnd())
		return {};

	return ExpectValues(line);
}

static unsigned
ExpectUnsignedInt(LineParser &line)
{
	const auto value = line.ExpectUnsigned();
	if (value > UINT_MAX)
		throw LineParser::Error("Number is too large");

	return unsigned(value);
}

[[gnu::pure]]
static bool
HasNetInterface(const Profile &profile) noexcept
{
	const auto *interfaces = std::get_if<Net::Interfaces>(&profile.net.value);
	return interfaces != nullptr && !interfaces->empty();
}

static X11
ParseX11(const char *s)
{
	if (StringIsEqual(s, "none"))
		return X11::NONE;
	else if (StringIsEqual(s, "xephyr"))
		return X11::XEPHYR;
	else if (StringIsEqual(s, "xorg"))
		return X11::XORG;
	else if (StringIsEqual(s, "xpra"))
		return X11::XPRA;
	else if (StringIsEqual(s, "xvfb"))
		return X11::XVFB;
	else
		throw LineParser::Error("Unknown X11 server");
}

inline bool
ProfileConfigParser::ParseTableOption(const char *word, LineParser &line)
{
	for (const auto &i : switch_options) {
		if (StringIsEqual(word, i.name)) {
			line.ExpectEnd();
			(command.*i.method)();
			return true;
		}
	}

	for (const auto &i : string_options) {
		if (StringIsEqual(word, i.name)) {
			(command.*i.method)(line.ExpectValueAndEnd());
			return true;
		}
	}

	for (const auto &i : path_options) {
		if (StringIsEqual(word, i.name)) {
			(command.*i.method)(line.ExpectValueAndEnd());
			return true;
		}
	}

	for (const auto &i : number_options) {
		if (StringIsEqual(word, i.name)) {
			const auto value = line.ExpectUnsigned();
			line.ExpectEnd();
			(command.*i.method)(value);
			return true;
		}
	}

	for (const auto &i : string_list_options) {
		if (StringIsEqual(word, i.name)) {
			for (const auto &value : ExpectValues(line))
				(command.*i.method)(value);
			return true;
		}
	}

	for (const auto &i : path_list_options) {
		if (StringIsEqual(word, i.name)) {
			for (const auto &value : ExpectValues(line))
				(command.*i.method)(value);
			return true;
		}
	}

	for (const auto &i : private_list_options) {
		if (StringIsEqual(word, i.name)) {
			private_list.AddAll(i.kind, ExpectValues(line));
			command.SetPrivateList(private_list.Build());
			return true;
		}
	}

	return false;
}

/**
 * Parse an option which edits the most recently declared network
 * interface.
 */
inline void
ProfileConfigParser::ParseNetOption(const char *word, LineParser &line)
{
	if (!HasNetInterface(command.GetProfile()))
		throw LineParser::Error(std::string{"'"} + word +
					"' without a preceding 'net' interface");

	if (StringIsEqual(word, "ip")) {
		const char *value = line.ExpectValueAndEnd();
		if (StringIsEqual(value, "none"))
			command.Ip(IpConfig::None{});
		else if (StringIsEqual(value, "dhcp"))
			command.Ip(IpConfig::Dhcp{});
		else
			command.Ip(IpConfig::MakeAddress(value));
	} else if (StringIsEqual(word, "iprange")) {
		const std::string first = line.ExpectValue();
		const char *last = line.ExpectValueAndEnd();
		command.Ip(IpConfig::MakeRange(first, last));
	} else if (StringIsEqual(word, "ip6")) {
		command.Ip6(line.ExpectValueAndEnd());
	} else if (StringIsEqual(word, "mac")) {
		command.Mac(line.ExpectValueAndEnd());
	} else if (StringIsEqual(word, "mtu")) {
		const unsigned mtu = ExpectUnsignedInt(line);
		line.ExpectEnd();
		command.Mtu(mtu);
	} else if (StringIsEqual(word, "netmask")) {
		command.Netmask(line.ExpectValueAndEnd());
	} else {
		command.VethName(line.ExpectValueAndEnd());
	}
}

inline bool
ProfileConfigParser::ParseModeOption(const char *word, LineParser &line)
{
	if (StringIsEqual(word, "caps.drop")) {
		if (line.SkipWord("all")) {
			line.ExpectEnd();
			command.SetCapsDrop(CapsDrop::MakeDropAll());
		} else {
			caps_drop.Drops(ExpectValues(line));
			command.SetCapsDrop(caps_drop.Build());
		}
	} else if (StringIsEqual(word, "caps.keep")) {
		caps_drop.Keeps(ExpectValues(line));
		command.SetCapsDrop(caps_drop.Build());
	} else if (StringIsEqual(word, "net")) {
		const char *value = line.ExpectValueAndEnd();
		if (StringIsEqual(value, "none"))
			command.SetNet(Net::None{});
		else
			command.NetInterface(value);
	} else if (StringIsEqual(word, "ip") ||
		   StringIsEqual(word, "iprange") ||
		   StringIsEqual(word, "ip6") ||
		   StringIsEqual(word, "mac") ||
		   StringIsEqual(word, "mtu") ||
		   StringIsEqual(word, "netmask") ||
		   StringIsEqual(word, "veth-name")) {
		ParseNetOption(word, line);
	} else if (StringIsEqual(word, "netfilter")) {
		if (line.IsEnd())
			command.SetNetFilter(NetFilter::Default{});
		else
			command.SetNetFilter(NetFilter::File{line.ExpectValueAndEnd()});
	} else if (StringIsEqual(word, "join")) {
		command.SetJoin(Join::Any{line.ExpectValueAndEnd()});
	} else if (StringIsEqual(word, "join-network")) {
		command.SetJoin(Join::Network{line.ExpectValueAndEnd()});
	} else if (StringIsEqual(word, "join-filesystem")) {
		command.SetJoin(Join::Filesystem{line.ExpectValueAndEnd()});
	} else if (StringIsEqual(word, "join-or-start")) {
		command.SetJoin(Join::OrStart{line.ExpectValueAndEnd()});
	} else if (StringIsEqual(word, "overlay")) {
		if (line.IsEnd())
			command.SetOverlay(Overlay::Default{});
		else if (line.SkipWord("tmpfs")) {
			line.ExpectEnd();
			command.SetOverlay(Overlay::Tmpfs{});
		} else
			throw LineParser::Error("'tmpfs' or end of line expected");
	} else if (StringIsEqual(word, "overlay-tmpfs")) {
		line.ExpectEnd();
		command.SetOverlay(Overlay::Tmpfs{});
	} else if (StringIsEqual(word, "overlay-named")) {
		command.SetOverlay(Overlay::Named{line.ExpectValueAndEnd()});
	} else if (StringIsEqual(word, "private")) {
		if (line.IsEnd())
			command.SetPrivate(Private::Temporary{});
		else
			command.SetPrivate(Private::Directory{line.ExpectValueAndEnd()});
	} else if (StringIsEqual(word, "seccomp")) {
		auto syscalls = NextValues(line);
		if (syscalls.empty())
			command.SetSeccomp(Seccomp::Default{});
		else
			command.SetSeccomp(Seccomp::Syscalls{std::move(syscalls)});
	} else if (StringIsEqual(word, "seccomp.drop")) {
		command.SetSeccomp(Seccomp::Drop{ExpectValues(line)});
	} else if (StringIsEqual(word, "seccomp.keep")) {
		command.SetSeccomp(Seccomp::Keep{ExpectValues(line)});
	} else if (StringIsEqual(word, "shell")) {
		const char *value = line.ExpectValueAndEnd();
		if (StringIsEqual(value, "none"))
			command.SetShell(Shell::None{});
		else
			command.SetShell(Shell::Program{value});
	} else if (StringIsEqual(word, "x11")) {
		if (line.IsEnd())
			command.SetX11(X11::AUTO);
		else
			command.SetX11(ParseX11(line.ExpectValueAndEnd()));
	} else
		return false;

	return true;
}

void
ProfileConfigParser::ParseLine(LineParser &line)
{
	const char *word = line.NextKeyword();
	if (word == nullptr)
		throw LineParser::Error("Option name expected");

	if (ParseTableOption(word, line) || ParseModeOption(word, line))
		return;

	if (StringIsEqual(word, "nice")) {
		const auto value = line.ExpectSigned();
		line.ExpectEnd();
		if (value < INT_MIN || value > INT_MAX)
			throw LineParser::Error("Number is out of range");

		command.Nice(int(value));
	} else if (StringIsEqual(word, "timeout")) {
		const auto value = line.ExpectUnsigned();
		line.ExpectEnd();
		if (value > (unsigned long long)std::chrono::seconds::max().count())
			throw LineParser::Error("Number is too large");

		command.Timeout(std::chrono::seconds(value));
	} else if (StringIsEqual(word, "cpu")) {
		do {
			command.Cpu(ExpectUnsignedInt(line));
		} while (!line.IsEnd());
	} else if (StringIsEqual(word, "bind")) {
		const std::string source = line.ExpectValue();
		const char *target = line.ExpectValueAndEnd();
		command.Bind(source, target);
	} else if (StringIsEqual(word, "env")) {
		const std::string name = line.ExpectValue();
		const char *value = line.ExpectValueAndEnd();
		command.JailEnv(name, value);
	} else
		throw LineParser::Error(std::string{"Unknown option: "} + word);
}

void
LoadProfileFile(Command &command, const fs::path &path)
{
	LogFmt(3, "config", "loading {}", path.native());

	ProfileConfigParser parser(command);
	VariableConfigParser v_parser(parser);
	CommentConfigParser parser2(v_parser);
	IncludeConfigParser parser3(fs::path{path}, parser2);

	ParseConfigFile(path, parser3);
}

} // namespace JailSpawn
