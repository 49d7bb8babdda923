// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "ConfigParser.hxx"
#include "LineParser.hxx"
#include "system/Error.hxx"

#include <algorithm>
#include <cassert>
#include <memory>
#include <vector>

#include <errno.h>
#include <fnmatch.h>
#include <stdio.h>
#include <string.h>

namespace fs = std::filesystem;

bool
ConfigParser::PreParseLine([[maybe_unused]] LineParser &line)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(LineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return ConfigParser::PreParseLine(line);
}

void
CommentConfigParser::ParseLine(LineParser &line)
{
	child.ParseLine(line);
}

void
CommentConfigParser::Finish()
{
	child.Finish();
	ConfigParser::Finish();
}

bool
VariableConfigParser::PreParseLine(LineParser &line)
{
	return child.PreParseLine(line);
}

void
VariableConfigParser::ParseLine(LineParser &line)
{
	Expand(line);

	if (line.SkipWord("@set")) {
		const char *name = line.ExpectWordAndSymbol('=',
							    "Variable name expected",
							    "'=' expected");
		const char *value = line.NextUnescape();
		if (value == nullptr)
			throw LineParser::Error("Quoted value expected after '='");

		line.ExpectEnd();

		variables.insert_or_assign(std::string{name}, value);
	} else {
		child.ParseLine(line);
	}
}

void
VariableConfigParser::Finish()
{
	child.Finish();
	ConfigParser::Finish();
}

void
VariableConfigParser::ExpandOne(std::string &dest,
				const char *&src, const char *end,
				bool quote) const
{
	assert(src + 2 <= end);
	assert(*src == '$');
	assert(src[1] == '{');

	src += 2;

	if (src >= end || !LineParser::IsWordChar(*src))
		throw LineParser::Error("Variable name expected after '${'");

	const char *name_begin = src++;

	while (true) {
		if (src >= end)
			throw LineParser::Error("Missing '}' after variable name");

		if (!LineParser::IsWordChar(*src))
			break;

		++src;
	}

	if (*src != '}')
		throw LineParser::Error("Missing '}' after variable name");

	const std::string_view name(name_begin, src - name_begin);
	++src;

	auto i = variables.find(name);
	if (i == variables.end()) {
		/* not ours: leave it to the launcher, which expands
		   its own macros such as ${HOME} */
		dest += "${";
		dest += name;
		dest += '}';
		return;
	}

	const std::string_view value = i->second;

	if (!quote) {
		/* inside double quotes */
		for (const char ch : value) {
			if (ch == '\\' || ch == '"')
				dest.push_back('\\');
			dest.push_back(ch);
		}

		return;
	}

	if (std::all_of(value.begin(), value.end(), LineParser::IsUnquotedChar)) {
		/* can be pasted as-is, even if glued to other text */
		dest += value;
		return;
	}

	/* a quoted value glued to other text is rejected by
	   LineParser */

	dest.push_back('\'');
	for (const char ch : value) {
		if (ch == '\\' || ch == '\'')
			dest.push_back('\\');
		dest.push_back(ch);
	}
	dest.push_back('\'');
}

void
VariableConfigParser::ExpandQuoted(std::string &dest,
				   const char *src, const char *end) const
{
	while (true) {
		const char *dollar = (const char *)memchr(src, '$', end - src);
		if (dollar == nullptr)
			break;

		if (dollar + 1 >= end || dollar[1] != '{') {
			dest.append(src, dollar + 1);
			src = dollar + 1;
			continue;
		}

		dest.append(src, dollar);

		src = dollar;
		ExpandOne(dest, src, end, false);
	}

	dest.append(src, end);
}

void
VariableConfigParser::Expand(std::string &dest, const char *src) const
{
	while (true) {
		const char ch = *src;
		if (ch == 0)
			break;

		if (ch == '\'') {
			const char *end = strchr(src + 1, '\'');
			if (end == nullptr)
				break;

			++end;
			dest.append(src, end);
			src = end;
		} else if (ch == '"') {
			const char *end = strchr(src + 1, '"');
			if (end == nullptr)
				break;

			dest.push_back(ch);
			ExpandQuoted(dest, src + 1, end);
			dest.push_back(ch);
			src = end + 1;
		} else if (ch == '$' && src[1] == '{') {
			ExpandOne(dest, src, src + strlen(src), true);
		} else {
			dest.push_back(ch);
			++src;
		}
	}

	dest += src;
}

char *
VariableConfigParser::Expand(const char *src) const
{
	if (strstr(src, "${") == nullptr)
		return nullptr;

	buffer.clear();
	Expand(buffer, src);
	return buffer.data();
}

void
VariableConfigParser::Expand(LineParser &line) const
{
	char *p = Expand(line.Rest());
	if (p != nullptr)
		line.Replace(p);
}

bool
IncludeConfigParser::PreParseLine(LineParser &line)
{
	return child.PreParseLine(line);
}

void
IncludeConfigParser::ParseLine(LineParser &line)
{
	if (line.SkipWord("@include")) {
		const char *p = line.NextUnescape();
		if (p == nullptr)
			throw LineParser::Error("Quoted path expected");

		line.ExpectEnd();

		IncludePath(p);
	} else if (line.SkipWord("@include_optional")) {
		const char *p = line.NextUnescape();
		if (p == nullptr)
			throw LineParser::Error("Quoted path expected");

		line.ExpectEnd();

		IncludeOptionalPath(p);
	} else
		child.ParseLine(line);
}

void
IncludeConfigParser::Finish()
{
	child.Finish();
}

static fs::path
ApplyPath(const fs::path &base, fs::path &&p)
{
	if (p.is_absolute())
		/* is already absolute */
		return std::move(p);

	return base.parent_path() / p;
}

struct FileCloser {
	void operator()(FILE *file) const noexcept {
		fclose(file);
	}
};

using UniqueFile = std::unique_ptr<FILE, FileCloser>;

static bool
IsEndOfFile(FILE *file) noexcept
{
	const int ch = getc(file);
	if (ch == EOF)
		return true;

	ungetc(ch, file);
	return false;
}

static void
ParseConfigFile(const fs::path &path, FILE *file, ConfigParser &parser)
{
	char buffer[4096], *line;
	unsigned i = 1;
	while ((line = fgets(buffer, sizeof(buffer), file)) != nullptr) {
		if (strchr(line, '\n') == nullptr && !IsEndOfFile(file))
			throw LineParser::Error(path.native() + ':' +
						std::to_string(i) +
						": Line too long");

		LineParser line_parser(line);

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (...) {
			std::throw_with_nested(LineParser::Error(path.native() + ':' + std::to_string(i)));
		}

		++i;
	}
}

/**
 * Parse an included file without calling the (shared) child's
 * Finish() method; that is done once by the outermost file.
 */
static void
ParseIncludedFile(const fs::path &path, FILE *file, ConfigParser &child)
{
	IncludeConfigParser sub(fs::path{path}, child);
	ParseConfigFile(path, file, sub);
}

inline void
IncludeConfigParser::IncludePath(fs::path &&p)
{
	p = ApplyPath(path, std::move(p));

	auto directory = p.parent_path();
	if (directory.empty())
		directory = ".";

	const auto pattern = p.filename();

	std::vector<fs::path> files;

	if (pattern.native().find('*') != std::string::npos ||
	    pattern.native().find('?') != std::string::npos) {
		for (const auto &i : fs::directory_iterator(directory))
			if (fnmatch(pattern.c_str(), i.path().filename().c_str(), 0) == 0)
				files.emplace_back(i.path());

		std::sort(files.begin(), files.end());
	} else
		files.emplace_back(std::move(p));

	for (const auto &i : files) {
		UniqueFile file{fopen(i.c_str(), "r")};
		if (!file)
			throw FmtErrno("Failed to open {}", i.native());

		ParseIncludedFile(i, file.get(), child);
	}
}

inline void
IncludeConfigParser::IncludeOptionalPath(fs::path &&p)
{
	p = ApplyPath(path, std::move(p));

	UniqueFile file{fopen(p.c_str(), "r")};
	if (!file) {
		const int e = errno;
		switch (e) {
		case ENOENT:
		case ENOTDIR:
			/* silently ignore this error */
			return;

		default:
			throw FmtErrno(e, "Failed to open {}", p.native());
		}
	}

	ParseIncludedFile(p, file.get(), child);
}

void
ParseConfigFile(const fs::path &path, ConfigParser &parser)
{
	UniqueFile file{fopen(path.c_str(), "r")};
	if (!file)
		throw FmtErrno("Failed to open {}", path.native());

	ParseConfigFile(path, file.get(), parser);
	parser.Finish();
}
