// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "jail/ProfileConfig.hxx"
#include "jail/Command.hxx"
#include "io/LineParser.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <system_error>

#include <stdlib.h>

using namespace JailSpawn;
using Strings = std::vector<std::string>;

namespace fs = std::filesystem;

class ProfileConfigTest : public ::testing::Test {
protected:
	fs::path directory;

	void SetUp() override {
		std::string pattern = (fs::temp_directory_path() / "jailspawn-XXXXXX").native();
		ASSERT_NE(mkdtemp(pattern.data()), nullptr);
		directory = pattern;
	}

	void TearDown() override {
		std::error_code ec;
		fs::remove_all(directory, ec);
	}

	fs::path Write(const char *name, const char *contents) const {
		const auto path = directory / name;
		std::ofstream{path} << contents;
		return path;
	}

	Strings Load(const char *contents) const {
		Command command{"app"};
		LoadProfileFile(command, Write("test.conf", contents));
		return command.MakeArgs();
	}
};

TEST_F(ProfileConfigTest, Switches)
{
	EXPECT_EQ(Load("# comment\n"
		       "\n"
		       "apparmor\n"
		       "caps\n"
		       "private-dev\n"
		       "seccomp.block-secondary\n"
		       "verbose\n"),
		  (Strings{"--caps", "--apparmor", "--private-dev",
			   "--seccomp.block-secondary", "--", "app"}));
}

TEST_F(ProfileConfigTest, Caps)
{
	EXPECT_EQ(Load("caps\n"
		       "caps.keep fowner\n"
		       "caps.drop \"chown\" 'kill'\n"),
		  (Strings{"--quiet", "--caps", "--caps.keep=fowner",
			   "--caps.drop=chown,kill", "--", "app"}));

	EXPECT_EQ(Load("caps\n"
		       "caps.drop chown\n"
		       "caps.drop all\n"),
		  (Strings{"--quiet", "--caps", "--caps.drop=all", "--", "app"}));
}

TEST_F(ProfileConfigTest, Scalars)
{
	EXPECT_EQ(Load("hostname \"box\"\n"
		       "name box\n"
		       "nice -5\n"
		       "timeout 61\n"
		       "rlimit-nofile 100\n"
		       "output /tmp/out.log\n"),
		  (Strings{"--quiet", "--hostname=box", "--name=box",
			   "--nice=-5", "--timeout=00:01:01",
			   "--rlimit-nofile=100", "--output=/tmp/out.log",
			   "--", "app"}));
}

TEST_F(ProfileConfigTest, Lists)
{
	EXPECT_EQ(Load("cpu 0 2\n"
		       "bind /a /b\n"
		       "bind \"/c\" \"/d\"\n"
		       "dns 1.1.1.1\n"
		       "blacklist /mnt /media\n"
		       "whitelist ${HOME}/Downloads\n"
		       "env LANG \"C.UTF-8\"\n"
		       "rmenv DISPLAY\n"
		       "protocol unix inet\n"),
		  (Strings{"--quiet", "--cpu=0,2",
			   "--bind=/a,/b", "--bind=/c,/d",
			   "--dns=1.1.1.1",
			   "--blacklist=/mnt", "--blacklist=/media",
			   "--whitelist=${HOME}/Downloads",
			   "--env=LANG=C.UTF-8",
			   "--rmenv=DISPLAY",
			   "--protocol=unix,inet",
			   "--", "app"}));
}

TEST_F(ProfileConfigTest, Net)
{
	EXPECT_EQ(Load("net eth0\n"
		       "ip dhcp\n"
		       "net br0\n"
		       "iprange 10.0.0.2 10.0.0.9\n"
		       "mtu 1400\n"
		       "veth-name v0\n"),
		  (Strings{"--quiet",
			   "--net=eth0", "--ip=dhcp",
			   "--net=br0", "--iprange=10.0.0.2,10.0.0.9",
			   "--mtu=1400", "--veth-name=v0",
			   "--", "app"}));

	EXPECT_EQ(Load("net none\n"),
		  (Strings{"--quiet", "--net=none", "--", "app"}));
}

TEST_F(ProfileConfigTest, Modes)
{
	EXPECT_EQ(Load("x11 xvfb\n"
		       "shell none\n"
		       "seccomp ptrace mount\n"
		       "private-bin bash ls\n"
		       "private-etc hosts\n"
		       "private-bin cat\n"
		       "private\n"
		       "overlay tmpfs\n"
		       "join-or-start box\n"
		       "netfilter\n"),
		  (Strings{"--quiet", "--netfilter", "--join-or-start=box",
			   "--overlay-tmpfs", "--private",
			   "--private-bin=bash,ls,cat", "--private-etc=hosts",
			   "--seccomp=ptrace,mount", "--shell=none",
			   "--x11=xvfb", "--", "app"}));

	EXPECT_EQ(Load("x11\n"
		       "seccomp\n"
		       "private \"/home/user/jail\"\n"
		       "overlay-named ov\n"
		       "netfilter /etc/firejail/nolocal.net\n"),
		  (Strings{"--quiet", "--netfilter=/etc/firejail/nolocal.net",
			   "--overlay-named=ov", "--private=/home/user/jail",
			   "--seccomp", "--x11", "--", "app"}));
}

TEST_F(ProfileConfigTest, Variables)
{
	EXPECT_EQ(Load("@set dir=\"/srv/data dir\"\n"
		       "read-only ${dir}\n"
		       "read-write \"${dir}/cache\"\n"),
		  (Strings{"--quiet", "--read-only=/srv/data dir",
			   "--read-write=/srv/data dir/cache",
			   "--", "app"}));
}

TEST_F(ProfileConfigTest, VariableConcatenation)
{
	EXPECT_EQ(Load("@set dir=\"/home/u\"\n"
		       "whitelist ${dir}/Downloads\n"
		       "read-only ${dir}/a ${dir}/b\n"),
		  (Strings{"--quiet", "--whitelist=/home/u/Downloads",
			   "--read-only=/home/u/a", "--read-only=/home/u/b",
			   "--", "app"}));

	/* a value which needs quotes cannot be glued to other text */
	EXPECT_THROW(Load("@set dir=\"/srv/data dir\"\n"
			  "whitelist ${dir}/cache\n"),
		     LineParser::Error);
	EXPECT_THROW(Load("whitelist \"/a\"/b\n"), LineParser::Error);
}

TEST_F(ProfileConfigTest, TimeoutRange)
{
	EXPECT_EQ(Load("timeout 360000\n"),
		  (Strings{"--quiet", "--timeout=100:00:00", "--", "app"}));

	EXPECT_THROW(Load("timeout 9223372036854775808\n"), LineParser::Error);
	EXPECT_THROW(Load("timeout 18446744073709551615\n"), LineParser::Error);
}

TEST_F(ProfileConfigTest, LineTooLong)
{
	const std::string contents = "hostname " + std::string(5000, 'x') + "\n";
	EXPECT_THROW(Load(contents.c_str()), LineParser::Error);
}

TEST_F(ProfileConfigTest, Include)
{
	Write("common.inc", "nonewprivs\nnoroot\n");
	fs::create_directory(directory / "conf.d");
	Write("conf.d/b.conf", "dns 2.2.2.2\n");
	Write("conf.d/a.conf", "dns 1.1.1.1\n");

	EXPECT_EQ(Load("@include \"common.inc\"\n"
		       "@include \"conf.d/*.conf\"\n"
		       "@include_optional \"missing.conf\"\n"
		       "caps\n"),
		  (Strings{"--quiet", "--caps", "--nonewprivs", "--noroot",
			   "--dns=1.1.1.1", "--dns=2.2.2.2", "--", "app"}));
}

TEST_F(ProfileConfigTest, MissingInclude)
{
	EXPECT_THROW(Load("@include \"missing.conf\"\n"), std::exception);
}

TEST_F(ProfileConfigTest, MissingFile)
{
	Command command{"app"};

	try {
		LoadProfileFile(command, directory / "nonexistent.conf");
		FAIL();
	} catch (const std::system_error &e) {
		EXPECT_EQ(e.code().value(), ENOENT);
	}
}

TEST_F(ProfileConfigTest, Errors)
{
	EXPECT_THROW(Load("no-such-option\n"), LineParser::Error);
	EXPECT_THROW(Load("caps yes\n"), LineParser::Error);
	EXPECT_THROW(Load("hostname\n"), LineParser::Error);
	EXPECT_THROW(Load("nice x\n"), LineParser::Error);
	EXPECT_THROW(Load("ip dhcp\n"), LineParser::Error);
	EXPECT_THROW(Load("x11 wayland\n"), LineParser::Error);
	EXPECT_THROW(Load("overlay named\n"), LineParser::Error);
	EXPECT_THROW(Load("bind /a\n"), LineParser::Error);
}

TEST_F(ProfileConfigTest, ErrorLocation)
{
	Command command{"app"};
	const auto path = Write("bad.conf", "caps\n\nfoo\n");

	try {
		LoadProfileFile(command, path);
		FAIL();
	} catch (...) {
		const auto msg = GetFullMessage(std::current_exception());
		EXPECT_NE(msg.find(path.native() + ":3"), std::string::npos);
		EXPECT_NE(msg.find("Unknown option: foo"), std::string::npos);
	}
}
