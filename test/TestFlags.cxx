// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "jail/Flags.hxx"
#include "jail/CapsDropBuilder.hxx"
#include "jail/PrivateListBuilder.hxx"
#include "jailspawn/Profile.hxx"

#include <gtest/gtest.h>

using namespace JailSpawn;
using Strings = std::vector<std::string>;

TEST(Flags, Empty)
{
	const Profile profile;
	EXPECT_EQ(EmitFlags(profile), Strings{"--quiet"});
}

TEST(Flags, Verbose)
{
	Profile profile;
	profile.verbose = true;
	EXPECT_TRUE(EmitFlags(profile).empty());

	profile.apparmor = true;
	EXPECT_EQ(EmitFlags(profile), Strings{"--apparmor"});
}

TEST(Flags, LauncherArgs)
{
	Profile profile;
	profile.caps = true;
	profile.apparmor = true;

	EXPECT_EQ(MakeLauncherArgs(profile, "env", {}),
		  (Strings{"--quiet", "--caps", "--apparmor", "--", "env"}));

	const Strings args{"-i", "FOO=bar baz"};
	EXPECT_EQ(MakeLauncherArgs(profile, "env", args),
		  (Strings{"--quiet", "--caps", "--apparmor", "--", "env",
			   "-i", "FOO=bar baz"}));
}

TEST(Flags, SwitchOrder)
{
	Profile profile;
	profile.writable_var_log = true;
	profile.seccomp_block_secondary = true;
	profile.nonewprivs = true;
	profile.allusers = true;
	profile.caps = true;

	EXPECT_EQ(EmitFlags(profile),
		  (Strings{"--quiet", "--caps", "--allusers", "--nonewprivs",
			   "--seccomp.block-secondary", "--writable-var-log"}));
}

TEST(Flags, CapsDropAll)
{
	Profile profile;
	profile.caps = true;
	profile.caps_drop = CapsDrop::MakeDropAll();

	EXPECT_EQ(EmitFlags(profile),
		  (Strings{"--quiet", "--caps", "--caps.drop=all"}));
}

TEST(Flags, CapsKeepDrop)
{
	Profile profile;
	profile.caps = true;
	profile.caps_drop = CapsDropBuilder{}.Keep("fowner").Drop("chown").Build();

	EXPECT_EQ(EmitFlags(profile),
		  (Strings{"--quiet", "--caps", "--caps.keep=fowner",
			   "--caps.drop=chown"}));

	profile.caps_drop = CapsDropBuilder{}.Drop("chown").Drop("kill").Build();
	EXPECT_EQ(EmitFlags(profile),
		  (Strings{"--quiet", "--caps", "--caps.drop=chown,kill"}));

	profile.caps_drop = CapsDropBuilder{}.Build();
	EXPECT_EQ(EmitFlags(profile), (Strings{"--quiet", "--caps"}));
}

TEST(Flags, CapsDropWithoutCaps)
{
	Profile profile;
	profile.caps_drop = CapsDropBuilder{}.Keep("fowner").Drop("chown").Build();
	EXPECT_EQ(EmitFlags(profile), Strings{"--quiet"});

	profile.caps_drop = CapsDrop::MakeDropAll();
	EXPECT_EQ(EmitFlags(profile), Strings{"--quiet"});

	profile.caps = true;
	profile.caps = false;
	EXPECT_EQ(EmitFlags(profile), Strings{"--quiet"});
}

TEST(Flags, Scalars)
{
	Profile profile;
	profile.verbose = true;
	profile.output_stderr = "/tmp/err";
	profile.output = "/tmp/out";
	profile.rlimit_sigpending = 5;
	profile.rlimit_as = 1048576;
	profile.timeout = std::chrono::seconds(3723);
	profile.nice = -5;
	profile.netfilter6 = "/etc/nf6";
	profile.defaultgw = "10.0.0.1";
	profile.netns = "ns0";
	profile.chroot = "/srv/root";
	profile.profile = "/etc/firejail/x.profile";
	profile.name = "box";
	profile.hosts_file = "/etc/hosts.jail";
	profile.hostname = "jail";
	profile.cgroup = "/sys/fs/cgroup/g/tasks";

	EXPECT_EQ(EmitFlags(profile),
		  (Strings{
			  "--cgroup=/sys/fs/cgroup/g/tasks",
			  "--hostname=jail",
			  "--hosts-file=/etc/hosts.jail",
			  "--name=box",
			  "--profile=/etc/firejail/x.profile",
			  "--chroot=/srv/root",
			  "--netns=ns0",
			  "--defaultgw=10.0.0.1",
			  "--netfilter6=/etc/nf6",
			  "--nice=-5",
			  "--timeout=01:02:03",
			  "--rlimit-as=1048576",
			  "--rlimit-sigpending=5",
			  "--output=/tmp/out",
			  "--output-stderr=/tmp/err",
		  }));
}

TEST(Flags, Timeout)
{
	Profile profile;
	profile.verbose = true;

	profile.timeout = std::chrono::seconds(0);
	EXPECT_EQ(EmitFlags(profile), Strings{"--timeout=00:00:00"});

	profile.timeout = std::chrono::hours(100) + std::chrono::seconds(59);
	EXPECT_EQ(EmitFlags(profile), Strings{"--timeout=100:00:59"});
}

TEST(Flags, ValuesAreVerbatim)
{
	Profile profile;
	profile.verbose = true;
	profile.hostname = "a b,c";
	profile.blacklists.emplace_back("/home/user/My Documents");

	EXPECT_EQ(EmitFlags(profile),
		  (Strings{"--hostname=a b,c",
			   "--blacklist=/home/user/My Documents"}));
}

TEST(Flags, Net)
{
	Profile profile;
	profile.verbose = true;

	profile.net = Net::None{};
	EXPECT_EQ(EmitFlags(profile), Strings{"--net=none"});

	profile.net = {};
	auto &eth0 = profile.net.AddInterface("eth0");
	eth0.ip = IpConfig::MakeAddress("10.10.20.5");
	eth0.mtu = 1400;
	eth0.veth_name = "veth-x";

	auto &br0 = profile.net.AddInterface("br0");
	br0.ip = IpConfig::MakeRange("10.0.0.100", "10.0.0.200");
	br0.ip6 = "2001:db8::5";
	br0.mac = "00:11:22:33:44:55";
	br0.netmask = "255.255.255.0";

	EXPECT_EQ(EmitFlags(profile),
		  (Strings{
			  "--net=eth0", "--ip=10.10.20.5", "--mtu=1400",
			  "--veth-name=veth-x",
			  "--net=br0", "--iprange=10.0.0.100,10.0.0.200",
			  "--ip6=2001:db8::5", "--mac=00:11:22:33:44:55",
			  "--netmask=255.255.255.0",
		  }));
}

TEST(Flags, IpConfig)
{
	Profile profile;
	profile.verbose = true;

	profile.net.AddInterface("eth0").ip = IpConfig::None{};
	profile.net.AddInterface("eth1").ip = IpConfig::Dhcp{};
	profile.net.AddInterface("eth2");

	EXPECT_EQ(EmitFlags(profile),
		  (Strings{"--net=eth0", "--ip=none",
			   "--net=eth1", "--ip=dhcp",
			   "--net=eth2"}));
}

TEST(Flags, Modes)
{
	Profile profile;
	profile.verbose = true;
	profile.x11 = X11::XPRA;
	profile.shell = Shell::None{};
	profile.seccomp = Seccomp::Drop{{"mount", "umount2"}};
	profile.private_list = PrivateListBuilder{}.Bin("bash").Bin("ls").Etc("hosts").Build();
	profile.private_home = Private::Temporary{};
	profile.overlay = Overlay::Tmpfs{};
	profile.join = Join::OrStart{"box"};
	profile.netfilter = NetFilter::Default{};
	profile.net = Net::None{};

	EXPECT_EQ(EmitFlags(profile),
		  (Strings{
			  "--net=none",
			  "--netfilter",
			  "--join-or-start=box",
			  "--overlay-tmpfs",
			  "--private",
			  "--private-bin=bash,ls",
			  "--private-etc=hosts",
			  "--seccomp.drop=mount,umount2",
			  "--shell=none",
			  "--x11=xpra",
		  }));
}

TEST(Flags, ModeVariants)
{
	Profile profile;
	profile.verbose = true;

	profile.netfilter = NetFilter::File{"/etc/firejail/nolocal.net"};
	profile.join = Join::Any{"1234"};
	profile.overlay = Overlay::Named{"ov"};
	profile.private_home = Private::Directory{"/home/user/jail"};
	profile.seccomp = Seccomp::Syscalls{{"ptrace"}};
	profile.shell = Shell::Program{"/bin/dash"};
	profile.x11 = X11::AUTO;

	EXPECT_EQ(EmitFlags(profile),
		  (Strings{
			  "--netfilter=/etc/firejail/nolocal.net",
			  "--join=1234",
			  "--overlay-named=ov",
			  "--private=/home/user/jail",
			  "--seccomp=ptrace",
			  "--shell=/bin/dash",
			  "--x11",
		  }));

	profile.netfilter = {};
	profile.join = Join::Network{"box"};
	profile.overlay = Overlay::Default{};
	profile.private_home = {};
	profile.seccomp = Seccomp::Keep{{"read", "write"}};
	profile.shell = {};
	profile.x11 = X11::NONE;

	EXPECT_EQ(EmitFlags(profile),
		  (Strings{
			  "--join-network=box",
			  "--overlay",
			  "--seccomp.keep=read,write",
			  "--x11=none",
		  }));

	profile.join = Join::Filesystem{"box"};
	profile.overlay = {};
	profile.seccomp = Seccomp::Default{};
	profile.x11 = X11::XVFB;

	EXPECT_EQ(EmitFlags(profile),
		  (Strings{
			  "--join-filesystem=box",
			  "--seccomp",
			  "--x11=xvfb",
		  }));
}

TEST(Flags, SeccompEmptyLists)
{
	Profile profile;
	profile.verbose = true;

	profile.seccomp = Seccomp::Syscalls{};
	EXPECT_EQ(EmitFlags(profile), Strings{"--seccomp"});

	profile.seccomp = Seccomp::Drop{};
	EXPECT_TRUE(EmitFlags(profile).empty());

	profile.seccomp = Seccomp::Keep{};
	EXPECT_TRUE(EmitFlags(profile).empty());
}

TEST(Flags, X11Servers)
{
	Profile profile;
	profile.verbose = true;

	profile.x11 = X11::XEPHYR;
	EXPECT_EQ(EmitFlags(profile), Strings{"--x11=xephyr"});

	profile.x11 = X11::XORG;
	EXPECT_EQ(EmitFlags(profile), Strings{"--x11=xorg"});
}

TEST(Flags, Binds)
{
	Profile profile;
	profile.binds.push_back({"/a", "/b"});
	profile.binds.push_back({"/c", "/d"});

	EXPECT_EQ(EmitFlags(profile),
		  (Strings{"--quiet", "--bind=/a,/b", "--bind=/c,/d"}));
}

TEST(Flags, ListsKeepDuplicates)
{
	Profile profile;
	profile.verbose = true;
	profile.blacklists.emplace_back("/x");
	profile.blacklists.emplace_back("/x");
	profile.dns.emplace_back("1.1.1.1");
	profile.dns.emplace_back("1.1.1.1");
	profile.cpus = {2, 0, 2};

	EXPECT_EQ(EmitFlags(profile),
		  (Strings{"--cpu=2,0,2",
			   "--dns=1.1.1.1", "--dns=1.1.1.1",
			   "--blacklist=/x", "--blacklist=/x"}));
}

TEST(Flags, ListOrder)
{
	Profile profile;
	profile.verbose = true;
	profile.protocols = {"unix", "inet"};
	profile.rmenv = {"DISPLAY"};
	profile.env = {{"A", "1"}, {"B", "x=y"}};
	profile.tmpfs = {"/tmp"};
	profile.noexec = {"/home"};
	profile.read_write = {"/var/lib/x"};
	profile.read_only = {"/etc"};
	profile.nowhitelists = {"/home/u/.ssh"};
	profile.whitelists = {"/home/u/Downloads"};
	profile.noblacklists = {"/usr/share"};
	profile.ignores = {"seccomp"};
	profile.blacklists = {"/mnt"};
	profile.dns = {"9.9.9.9"};
	profile.binds.push_back({"/src", "/dst"});
	profile.cpus = {1};

	EXPECT_EQ(EmitFlags(profile),
		  (Strings{
			  "--cpu=1",
			  "--bind=/src,/dst",
			  "--dns=9.9.9.9",
			  "--blacklist=/mnt",
			  "--ignore=seccomp",
			  "--noblacklist=/usr/share",
			  "--whitelist=/home/u/Downloads",
			  "--nowhitelist=/home/u/.ssh",
			  "--read-only=/etc",
			  "--read-write=/var/lib/x",
			  "--noexec=/home",
			  "--tmpfs=/tmp",
			  "--env=A=1",
			  "--env=B=x=y",
			  "--rmenv=DISPLAY",
			  "--protocol=unix,inet",
		  }));
}

TEST(Flags, Deterministic)
{
	Profile a;
	a.caps = true;
	a.nice = 3;
	a.dns = {"8.8.8.8"};

	Profile b;
	b.dns.emplace_back("8.8.8.8");
	b.nice = 10;
	b.nice = 3;
	b.caps = true;

	EXPECT_EQ(EmitFlags(a), EmitFlags(b));
	EXPECT_EQ(EmitFlags(a), EmitFlags(a));
}
