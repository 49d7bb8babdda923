// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "spawn/Environment.hxx"
#include "spawn/Prepared.hxx"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using Strings = std::vector<std::string>;

static constexpr const char *parent_env[] = {
	"PATH=/usr/bin:/bin",
	"HOME=/home/user",
	"LANG=de_DE.UTF-8",
	nullptr
};

static Strings
ToStrings(const PreparedChildProcess &p)
{
	return {p.env.begin(), p.env.end()};
}

TEST(Environment, Inherit)
{
	const Environment env;

	PreparedChildProcess p;
	env.Apply(p, parent_env);

	EXPECT_EQ(ToStrings(p),
		  (Strings{"PATH=/usr/bin:/bin", "HOME=/home/user",
			   "LANG=de_DE.UTF-8"}));
	EXPECT_STREQ(p.GetEnv("HOME"), "/home/user");
	EXPECT_EQ(p.GetEnv("HOM"), nullptr);
	EXPECT_EQ(p.GetEnv("USER"), nullptr);
}

TEST(Environment, SetAndRemove)
{
	Environment env;
	env.Set("LANG", "C");
	env.Remove("HOME");
	env.Set("FOO", "bar");

	PreparedChildProcess p;
	env.Apply(p, parent_env);

	EXPECT_EQ(ToStrings(p),
		  (Strings{"PATH=/usr/bin:/bin", "FOO=bar", "LANG=C"}));
	EXPECT_EQ(p.GetEnv("HOME"), nullptr);
	EXPECT_STREQ(p.GetEnv("LANG"), "C");
}

TEST(Environment, LaterEditWins)
{
	Environment env;
	env.Remove("FOO");
	env.Set("FOO", "1");
	env.Set("BAR", "1");
	env.Remove("BAR");
	env.Set("FOO", "2");

	PreparedChildProcess p;
	env.Apply(p, nullptr);

	EXPECT_EQ(ToStrings(p), Strings{"FOO=2"});
}

TEST(Environment, Clear)
{
	Environment env;
	env.Set("BEFORE", "x");
	env.Clear();
	env.Set("AFTER", "y");

	EXPECT_TRUE(env.IsCleared());

	PreparedChildProcess p;
	env.Apply(p, parent_env);

	EXPECT_EQ(ToStrings(p), Strings{"AFTER=y"});
}
