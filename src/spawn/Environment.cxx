// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Environment.hxx"
#include "Prepared.hxx"

#include <string.h>

void
Environment::Apply(PreparedChildProcess &p,
		   const char *const*parent) const noexcept
{
	if (!clear && parent != nullptr) {
		for (; *parent != nullptr; ++parent) {
			const char *s = *parent;
			const char *eq = strchr(s, '=');
			if (eq == nullptr)
				continue;

			const std::string_view name(s, eq - s);
			if (edits.find(name) != edits.end())
				/* overridden or removed */
				continue;

			p.PutEnv(s);
		}
	}

	for (const auto &[name, value] : edits)
		if (value)
			p.SetEnv(name, *value);
}
