// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "jailspawn/Settings.hxx"

#include <string_view>

namespace JailSpawn {

/**
 * Collects the file lists of the "--private-*" options.  Like
 * #CapsDropBuilder, Build() takes a snapshot.
 */
class PrivateListBuilder {
	PrivateList::Settings::Lists lists;

public:
	PrivateListBuilder &Add(PrivateList::Kind kind,
				std::string_view file) noexcept {
		lists[std::size_t(kind)].emplace_back(file);
		return *this;
	}

	template<typename R>
	PrivateListBuilder &AddAll(PrivateList::Kind kind,
				   const R &files) noexcept {
		for (const auto &i : files)
			Add(kind, i);
		return *this;
	}

	PrivateListBuilder &Home(std::string_view file) noexcept {
		return Add(PrivateList::Kind::HOME, file);
	}

	template<typename R>
	PrivateListBuilder &Homes(const R &files) noexcept {
		return AddAll(PrivateList::Kind::HOME, files);
	}

	PrivateListBuilder &Bin(std::string_view file) noexcept {
		return Add(PrivateList::Kind::BIN, file);
	}

	template<typename R>
	PrivateListBuilder &Bins(const R &files) noexcept {
		return AddAll(PrivateList::Kind::BIN, files);
	}

	PrivateListBuilder &Etc(std::string_view file) noexcept {
		return Add(PrivateList::Kind::ETC, file);
	}

	template<typename R>
	PrivateListBuilder &Etcs(const R &files) noexcept {
		return AddAll(PrivateList::Kind::ETC, files);
	}

	PrivateListBuilder &Lib(std::string_view file) noexcept {
		return Add(PrivateList::Kind::LIB, file);
	}

	template<typename R>
	PrivateListBuilder &Libs(const R &files) noexcept {
		return AddAll(PrivateList::Kind::LIB, files);
	}

	PrivateListBuilder &Opt(std::string_view file) noexcept {
		return Add(PrivateList::Kind::OPT, file);
	}

	template<typename R>
	PrivateListBuilder &Opts(const R &files) noexcept {
		return AddAll(PrivateList::Kind::OPT, files);
	}

	PrivateListBuilder &Srv(std::string_view file) noexcept {
		return Add(PrivateList::Kind::SRV, file);
	}

	template<typename R>
	PrivateListBuilder &Srvs(const R &files) noexcept {
		return AddAll(PrivateList::Kind::SRV, files);
	}

	PrivateList Build() const noexcept;
};

} // namespace JailSpawn
