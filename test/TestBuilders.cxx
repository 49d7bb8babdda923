// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "jail/CapsDropBuilder.hxx"
#include "jail/PrivateListBuilder.hxx"

#include <gtest/gtest.h>

#include <array>
#include <list>

using namespace JailSpawn;
using Strings = std::vector<std::string>;

static const CapsDrop::Settings &
GetSettings(const CapsDrop &caps_drop)
{
	return std::get<CapsDrop::Settings>(caps_drop.value);
}

TEST(CapsDropBuilder, Default)
{
	const CapsDrop caps_drop;
	EXPECT_FALSE(caps_drop.IsDefined());

	EXPECT_TRUE(std::holds_alternative<CapsDrop::DropAll>(CapsDrop::MakeDropAll().value));
}

TEST(CapsDropBuilder, Lists)
{
	const std::array<const char *, 2> keep{"fowner", "setuid"};
	const std::list<std::string> drop{"chown", "kill"};

	const auto caps_drop = CapsDropBuilder{}
		.Keeps(keep)
		.Keep("setgid")
		.Drop("net_raw")
		.Drops(drop)
		.Build();

	ASSERT_TRUE(caps_drop.IsDefined());
	EXPECT_EQ(GetSettings(caps_drop).GetKeep(),
		  (Strings{"fowner", "setuid", "setgid"}));
	EXPECT_EQ(GetSettings(caps_drop).GetDrop(),
		  (Strings{"net_raw", "chown", "kill"}));
}

TEST(CapsDropBuilder, Snapshot)
{
	CapsDropBuilder builder;
	builder.Drop("chown");

	const auto first = builder.Build();

	builder.Drop("kill").Keep("fowner");
	const auto second = builder.Build();

	EXPECT_EQ(GetSettings(first).GetDrop(), Strings{"chown"});
	EXPECT_TRUE(GetSettings(first).GetKeep().empty());

	EXPECT_EQ(GetSettings(second).GetDrop(), (Strings{"chown", "kill"}));
	EXPECT_EQ(GetSettings(second).GetKeep(), Strings{"fowner"});
}

TEST(CapsDropBuilder, Duplicates)
{
	const auto caps_drop = CapsDropBuilder{}.Drop("chown").Drop("chown").Build();
	EXPECT_EQ(GetSettings(caps_drop).GetDrop(), (Strings{"chown", "chown"}));
}

TEST(PrivateListBuilder, Lists)
{
	const Strings libs{"libc.so.6", "libm.so.6"};

	PrivateListBuilder builder;
	builder.Home(".bashrc")
		.Bins(Strings{"bash", "ls"})
		.Bin("cat")
		.Etc("hosts")
		.Libs(libs)
		.Opt("app")
		.Srv("www");

	const auto private_list = builder.Build();
	ASSERT_TRUE(private_list.IsDefined());

	const auto &settings = std::get<PrivateList::Settings>(private_list.value);
	EXPECT_EQ(settings.Get(PrivateList::Kind::HOME), Strings{".bashrc"});
	EXPECT_EQ(settings.Get(PrivateList::Kind::BIN),
		  (Strings{"bash", "ls", "cat"}));
	EXPECT_EQ(settings.Get(PrivateList::Kind::ETC), Strings{"hosts"});
	EXPECT_EQ(settings.Get(PrivateList::Kind::LIB), libs);
	EXPECT_EQ(settings.Get(PrivateList::Kind::OPT), Strings{"app"});
	EXPECT_EQ(settings.Get(PrivateList::Kind::SRV), Strings{"www"});

	/* later edits do not affect earlier snapshots */
	builder.Etc("passwd");
	EXPECT_EQ(settings.Get(PrivateList::Kind::ETC), Strings{"hosts"});
	EXPECT_EQ(std::get<PrivateList::Settings>(builder.Build().value)
		  .Get(PrivateList::Kind::ETC),
		  (Strings{"hosts", "passwd"}));
}
