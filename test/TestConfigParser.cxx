// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "io/ConfigParser.hxx"
#include "io/LineParser.hxx"

#include <gtest/gtest.h>

#include <string>
#include <vector>

class MyConfigParser final
	: public ConfigParser, public std::vector<std::string> {
public:
	void ParseLine(LineParser &line) override {
		const char *value = line.NextUnescape();
		if (value == nullptr)
			throw LineParser::Error("Quoted value expected");
		line.ExpectEnd();
		emplace_back(value);
	}
};

static void
ParseLines(ConfigParser &parser, const char *const*lines)
{
	while (*lines != nullptr) {
		std::string buffer{*lines++};

		LineParser line_parser(buffer.data());
		if (!parser.PreParseLine(line_parser))
			parser.ParseLine(line_parser);
	}

	parser.Finish();
}

static const char *const v_data[] = {
	"@set foo='bar'",
	"@set bar=\"${foo}\"",
	"${foo} ",
	"'${foo}'",
	"\"${foo}\"",
	"\"${bar}\"",
	" \"a${foo}b\" ",
	"@set foo=\"with space\"",
	"\"${foo}\"",
	"  ${foo}  ",
	nullptr
};

static const char *const v_output[] = {
	"bar",
	"${foo}",
	"bar",
	"bar",
	"abarb",
	"with space",
	"with space",
	nullptr
};

TEST(ConfigParserTest, VariableConfigParser)
{
	MyConfigParser p;
	VariableConfigParser v(p);

	ParseLines(v, v_data);

	for (size_t i = 0; v_output[i] != nullptr; ++i) {
		ASSERT_LT(i, p.size());
		ASSERT_STREQ(v_output[i], p[i].c_str());
	}

	EXPECT_EQ(p.size(), 7u);
}

TEST(ConfigParserTest, UnknownVariableIsKept)
{
	static const char *const data[] = {
		"${HOME}/Downloads",
		"\"${HOME}/a $b\"",
		nullptr
	};

	MyConfigParser p;
	VariableConfigParser v(p);

	ParseLines(v, data);

	ASSERT_EQ(p.size(), 2u);
	EXPECT_EQ(p[0], "${HOME}/Downloads");
	EXPECT_EQ(p[1], "${HOME}/a $b");
}

TEST(ConfigParserTest, VariableWithQuotes)
{
	static const char *const data[] = {
		"@set a=\"it's\"",
		"@set b='say \"hi\"'",
		"${a}",
		"\"${b}!\"",
		"x${a}",
		nullptr
	};

	MyConfigParser p;
	VariableConfigParser v(p);

	EXPECT_THROW(ParseLines(v, data), LineParser::Error);

	ASSERT_EQ(p.size(), 2u);
	EXPECT_EQ(p[0], "it's");
	EXPECT_EQ(p[1], "say \"hi\"!");
}

TEST(ConfigParserTest, GluedQuote)
{
	static const char *const data[] = {
		"\"a\"b",
		nullptr
	};

	MyConfigParser p;
	EXPECT_THROW(ParseLines(p, data), LineParser::Error);
}

TEST(ConfigParserTest, MalformedVariable)
{
	static const char *const data[] = {
		"${foo",
		nullptr
	};

	MyConfigParser p;
	VariableConfigParser v(p);

	EXPECT_THROW(ParseLines(v, data), LineParser::Error);
}

TEST(ConfigParserTest, CommentConfigParser)
{
	static const char *const data[] = {
		"# comment",
		"",
		"   ",
		"  # indented comment",
		"'value'",
		nullptr
	};

	MyConfigParser p;
	CommentConfigParser c(p);

	ParseLines(c, data);

	ASSERT_EQ(p.size(), 1u);
	EXPECT_EQ(p.front(), "value");
}
