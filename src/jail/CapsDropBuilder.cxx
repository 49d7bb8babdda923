// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "CapsDropBuilder.hxx"

namespace JailSpawn {

CapsDrop
CapsDropBuilder::Build() const noexcept
{
	return CapsDrop::Settings{keep, drop};
}

} // namespace JailSpawn
