// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "PrivateListBuilder.hxx"

namespace JailSpawn {

PrivateList
PrivateListBuilder::Build() const noexcept
{
	return PrivateList::Settings{PrivateList::Settings::Lists{lists}};
}

} // namespace JailSpawn
