// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Exception.hxx"

#include <stdexcept>

#include <stdio.h>

static void
AppendNested(std::string &result, const std::exception &e,
	     const char *fallback, const char *separator) noexcept
{
	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception &nested) {
		result += separator;
		result += nested.what();
		AppendNested(result, nested, fallback, separator);
	} catch (...) {
		result += separator;
		result += fallback;
	}
}

std::string
GetFullMessage(std::exception_ptr ep,
	       const char *fallback, const char *separator) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		std::string result = e.what();
		AppendNested(result, e, fallback, separator);
		return result;
	} catch (const char *s) {
		return s;
	} catch (...) {
		return fallback;
	}
}

void
PrintException(std::exception_ptr ep) noexcept
{
	fprintf(stderr, "%s\n", GetFullMessage(ep).c_str());
}
