// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "LineParser.hxx"

#include <cerrno>

#include <stdlib.h>
#include <string.h>

bool
LineParser::SkipWord(const char *word) noexcept
{
	char *q = p;

	do {
		if (*q++ != *word)
			return false;
	} while (*++word != 0);

	if (*q == 0) {
		p = q;
		return true;
	} else if (IsWhitespaceFast(*q)) {
		p = StripLeft(q + 1);
		return true;
	} else
		return false;
}

const char *
LineParser::NextKeyword() noexcept
{
	if (!IsWordChar(front()))
		return nullptr;

	const char *result = p;
	do {
		++p;
	} while (IsKeywordChar(front()));

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd())
		return nullptr;

	return result;
}

inline char *
LineParser::NextUnquotedValue() noexcept
{
	if (!IsUnquotedChar(front()))
		return nullptr;

	char *result = p;
	do {
		++p;
	} while (IsUnquotedChar(front()));

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd())
		return nullptr;

	return result;
}

inline bool
LineParser::EndQuotedValue() noexcept
{
	if (!IsEnd() && !IsWhitespaceNotNull(front()))
		return false;

	Strip();
	return true;
}

inline char *
LineParser::NextQuotedValue(const char stop) noexcept
{
	char *const value = p;
	char *q = strchr(p, stop);
	if (q == nullptr)
		return nullptr;

	*q++ = 0;
	p = q;
	if (!EndQuotedValue())
		return nullptr;

	return value;
}

char *
LineParser::NextValue() noexcept
{
	const char ch = front();
	if (IsQuote(ch)) {
		++p;
		return NextQuotedValue(ch);
	} else
		return NextUnquotedValue();
}

char *
LineParser::NextUnescape() noexcept
{
	const char stop = front();
	if (!IsQuote(stop))
		return NextUnquotedValue();

	char *dest = ++p;
	char *const value = dest;

	while (true) {
		char ch = *p++;

		if (ch == 0)
			return nullptr;
		else if (ch == stop) {
			*dest = 0;
			if (!EndQuotedValue())
				return nullptr;

			return value;
		} else if (ch == '\\') {
			ch = *p++;

			switch (ch) {
			case 'r':
				*dest++ = '\r';
				break;

			case 'n':
				*dest++ = '\n';
				break;

			case '\\':
			case '\'':
			case '\"':
				*dest++ = ch;
				break;

			default:
				return nullptr;
			}
		} else
			*dest++ = ch;
	}
}

const char *
LineParser::ExpectWordAndSymbol(char symbol,
				const char *error1, const char *error2)
{
	const char *name = p;
	if (!IsWordChar(front()))
		throw Error(error1);

	do {
		++p;
	} while (IsWordChar(front()));

	if (front() != symbol)
		throw Error(error2);

	*p++ = 0;
	Strip();
	return name;
}

char *
LineParser::ExpectValue()
{
	char *value = NextUnescape();
	if (value == nullptr || *value == 0)
		throw Error("Value expected");

	return value;
}

char *
LineParser::ExpectValueAndEnd()
{
	char *value = ExpectValue();
	ExpectEnd();
	return value;
}

unsigned long long
LineParser::ExpectUnsigned()
{
	const char *string = NextValue();
	if (string == nullptr || !IsDigitASCII(*string))
		throw Error("Number expected");

	char *endptr;
	errno = 0;
	const auto value = strtoull(string, &endptr, 10);
	if (*endptr != 0)
		throw Error(std::string("Not a valid number: ") + string);

	if (errno == ERANGE)
		throw Error(std::string("Number is too large: ") + string);

	return value;
}

long long
LineParser::ExpectSigned()
{
	const char *string = NextValue();
	if (string == nullptr)
		throw Error("Number expected");

	char *endptr;
	errno = 0;
	const auto value = strtoll(string, &endptr, 10);
	if (endptr == string || *endptr != 0)
		throw Error(std::string("Not a valid number: ") + string);

	if (errno == ERANGE)
		throw Error(std::string("Number is out of range: ") + string);

	return value;
}
