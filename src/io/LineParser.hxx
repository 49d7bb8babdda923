// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "util/StringStrip.hxx"
#include "util/CharUtil.hxx"

#include <stdexcept>
#include <string>

class LineParser {
	char *p;

public:
	using Error = std::runtime_error;

	explicit LineParser(char *_p) noexcept
		:p(StripLeft(_p)) {
		StripRight(p);
	}

	LineParser(const LineParser &) = delete;
	LineParser &operator=(const LineParser &) = delete;

	void Replace(char *_p) noexcept {
		p = _p;
	}

	char *Rest() noexcept {
		return p;
	}

	void Strip() noexcept {
		p = StripLeft(p);
	}

	char front() const noexcept {
		return *p;
	}

	bool IsEnd() const noexcept {
		return front() == 0;
	}

	void ExpectEnd() {
		if (!IsEnd())
			throw Error(std::string("Unexpected tokens at end of line: ") + p);
	}

	/**
	 * If the next word matches the given parameter, then skip it and
	 * return true.  If not, the method returns false, leaving the
	 * object unmodified.
	 */
	bool SkipWord(const char *word) noexcept;

	/**
	 * Returns the next keyword.  Keywords may contain dashes and
	 * dots in addition to word characters (e.g. "caps.drop",
	 * "private-dev").
	 */
	const char *NextKeyword() noexcept;

	char *NextValue() noexcept;

	/**
	 * Like NextValue(), but resolves backslash escapes inside
	 * quotes.  A closing quote must be followed by whitespace or
	 * the end of the line.
	 */
	char *NextUnescape() noexcept;

	const char *ExpectWordAndSymbol(char symbol,
					const char *error1,
					const char *error2);

	/**
	 * Expect a non-empty value.
	 */
	char *ExpectValue();

	/**
	 * Expect a non-empty value and end-of-line.
	 */
	char *ExpectValueAndEnd();

	/**
	 * Expect an unsigned decimal integer.
	 */
	unsigned long long ExpectUnsigned();

	/**
	 * Expect a signed decimal integer.
	 */
	long long ExpectSigned();

	static constexpr bool IsWordChar(char ch) noexcept {
		return IsAlphaNumericASCII(ch) || ch == '_';
	}

	/**
	 * May this character appear in a value without quotes?
	 */
	static constexpr bool IsUnquotedChar(char ch) noexcept {
		return IsWordChar(ch) || ch == '.' || ch == '-' || ch == ':' ||
			ch == '/' || ch == '+' || ch == ',' || ch == '=' ||
			ch == '@' || ch == '%' || ch == '~' || ch == '*' ||
			ch == '$' || ch == '{' || ch == '}';
	}

private:
	char *NextUnquotedValue() noexcept;
	char *NextQuotedValue(char stop) noexcept;

	/**
	 * Skip whitespace after a closing quote.  Returns false if
	 * the quote is followed by something else.
	 */
	bool EndQuotedValue() noexcept;

	static constexpr bool IsKeywordChar(char ch) noexcept {
		return IsWordChar(ch) || ch == '-' || ch == '.';
	}

	static constexpr bool IsQuote(char ch) noexcept {
		return ch == '"' || ch == '\'';
	}
};
