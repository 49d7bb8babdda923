// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Command.hxx"
#include "Flags.hxx"
#include "spawn/Direct.hxx"
#include "spawn/Prepared.hxx"

#include <unistd.h>

namespace JailSpawn {

Command &
Command::NetInterface(std::string_view device) noexcept
{
	profile.net.AddInterface(device);
	return *this;
}

Command &
Command::Ip(IpConfig &&ip) noexcept
{
	if (auto *i = profile.net.GetLastInterface())
		i->ip = std::move(ip);
	return *this;
}

Command &
Command::Ip6(std::string_view address) noexcept
{
	if (auto *i = profile.net.GetLastInterface())
		i->ip6 = address;
	return *this;
}

Command &
Command::Mac(std::string_view address) noexcept
{
	if (auto *i = profile.net.GetLastInterface())
		i->mac = address;
	return *this;
}

Command &
Command::Mtu(unsigned mtu) noexcept
{
	if (auto *i = profile.net.GetLastInterface())
		i->mtu = mtu;
	return *this;
}

Command &
Command::Netmask(std::string_view netmask) noexcept
{
	if (auto *i = profile.net.GetLastInterface())
		i->netmask = netmask;
	return *this;
}

Command &
Command::VethName(std::string_view name) noexcept
{
	if (auto *i = profile.net.GetLastInterface())
		i->veth_name = name;
	return *this;
}

std::vector<std::string>
Command::MakeArgs() const
{
	return MakeLauncherArgs(profile, executable, args);
}

ChildProcess
Command::Spawn() const
{
	const auto launcher_args = MakeArgs();

	PreparedChildProcess p;
	p.Append(launcher.c_str());
	for (const auto &i : launcher_args)
		p.Append(i.c_str());

	env.Apply(p, environ);

	if (current_dir)
		p.chdir = current_dir->c_str();

	/* these own the child's ends until it has been spawned */
	UniqueFileDescriptor stdin_child, stdout_child, stderr_child;

	auto stdin_pipe = stdin_stdio.Prepare(p.stdin_fd, stdin_child, true);
	auto stdout_pipe = stdout_stdio.Prepare(p.stdout_fd, stdout_child, false);
	auto stderr_pipe = stderr_stdio.Prepare(p.stderr_fd, stderr_child, false);

	const pid_t pid = SpawnChildProcess(std::move(p));

	return ChildProcess{pid, std::move(stdin_pipe),
			    std::move(stdout_pipe), std::move(stderr_pipe)};
}

} // namespace JailSpawn
