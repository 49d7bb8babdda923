// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "jailspawn/Settings.hxx"

#include <string>
#include <string_view>
#include <vector>

namespace JailSpawn {

/**
 * Collects capability names to keep and to drop.  Build() creates an
 * immutable snapshot; the builder may be modified and built again
 * afterwards without affecting earlier snapshots.
 */
class CapsDropBuilder {
	std::vector<std::string> keep, drop;

public:
	CapsDropBuilder &Keep(std::string_view capability) noexcept {
		keep.emplace_back(capability);
		return *this;
	}

	template<typename R>
	CapsDropBuilder &Keeps(const R &capabilities) noexcept {
		for (const auto &i : capabilities)
			Keep(i);
		return *this;
	}

	CapsDropBuilder &Drop(std::string_view capability) noexcept {
		drop.emplace_back(capability);
		return *this;
	}

	template<typename R>
	CapsDropBuilder &Drops(const R &capabilities) noexcept {
		for (const auto &i : capabilities)
			Drop(i);
		return *this;
	}

	CapsDrop Build() const noexcept;
};

} // namespace JailSpawn
