// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Prepared.hxx"

#include <string.h>

void
PreparedChildProcess::SetEnv(std::string_view name,
			     std::string_view value) noexcept
{
	std::string s;
	s.reserve(name.size() + 1 + value.size());
	s.append(name);
	s.push_back('=');
	s.append(value);
	PutEnv(std::move(s));
}

const char *
PreparedChildProcess::GetEnv(std::string_view name) const noexcept
{
	for (const char *i : env) {
		if (strncmp(i, name.data(), name.size()) == 0 &&
		    i[name.size()] == '=')
			return i + name.size() + 1;
	}

	return nullptr;
}

const char *
PreparedChildProcess::Finish() noexcept
{
	if (exec_path == nullptr && !args.empty())
		exec_path = args.front();

	return exec_path;
}
