// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

struct PreparedChildProcess;

/**
 * A list of edits to the environment a child process inherits from
 * this process.  Later edits of the same variable override earlier
 * ones.
 */
class Environment {
	/**
	 * Start with an empty environment instead of ours?
	 */
	bool clear = false;

	/**
	 * Variable name to new value; std::nullopt means the variable
	 * is removed.
	 */
	std::map<std::string, std::optional<std::string>, std::less<>> edits;

public:
	/**
	 * Do not inherit any variable.  This also discards all edits
	 * made so far.
	 */
	void Clear() noexcept {
		clear = true;
		edits.clear();
	}

	void Remove(std::string_view name) noexcept {
		edits.insert_or_assign(std::string{name}, std::nullopt);
	}

	void Set(std::string_view name, std::string_view value) noexcept {
		edits.insert_or_assign(std::string{name}, std::string{value});
	}

	bool IsCleared() const noexcept {
		return clear;
	}

	/**
	 * Fill PreparedChildProcess::env from the given parent
	 * environment (a nullptr-terminated array of "NAME=VALUE"
	 * strings, usually "environ") with all edits applied.  The
	 * parent strings are referenced, not copied.
	 */
	void Apply(PreparedChildProcess &p,
		   const char *const*parent) const noexcept;
};
