// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

/*
 * Mutually exclusive settings of the firejail launcher.
 *
 * Each type wraps a std::variant whose first alternative
 * (std::monostate) means "not specified" and is never emitted; every
 * other alternative corresponds to exactly one launcher flag.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace JailSpawn {

struct CapsDrop {
	/**
	 * Drop all capabilities ("--caps.drop=all").
	 */
	struct DropAll {};

	/**
	 * An immutable snapshot of explicit keep/drop lists, created
	 * by CapsDropBuilder::Build().
	 */
	class Settings {
		std::vector<std::string> keep, drop;

	public:
		Settings(std::vector<std::string> _keep,
			 std::vector<std::string> _drop) noexcept
			:keep(std::move(_keep)), drop(std::move(_drop)) {}

		/**
		 * Capabilities to keep ("--caps.keep=").
		 */
		const std::vector<std::string> &GetKeep() const noexcept {
			return keep;
		}

		/**
		 * Capabilities to drop ("--caps.drop=").
		 */
		const std::vector<std::string> &GetDrop() const noexcept {
			return drop;
		}
	};

	std::variant<std::monostate, DropAll, Settings> value;

	CapsDrop() = default;

	CapsDrop(DropAll) noexcept
		:value(DropAll{}) {}

	CapsDrop(Settings &&settings) noexcept
		:value(std::move(settings)) {}

	static CapsDrop MakeDropAll() noexcept {
		return DropAll{};
	}

	bool IsDefined() const noexcept {
		return !std::holds_alternative<std::monostate>(value);
	}
};

/**
 * Address configuration of one network interface.
 */
struct IpConfig {
	/**
	 * No IP address ("--ip=none").
	 */
	struct None {};

	/**
	 * Obtain an address via DHCP ("--ip=dhcp").
	 */
	struct Dhcp {};

	/**
	 * A fixed address ("--ip=ADDRESS").
	 */
	struct Address {
		std::string address;
	};

	/**
	 * Pick an address from a range ("--iprange=FIRST,LAST").
	 */
	struct Range {
		std::string first, last;
	};

	std::variant<std::monostate, None, Dhcp, Address, Range> value;

	IpConfig() = default;

	IpConfig(None) noexcept
		:value(None{}) {}

	IpConfig(Dhcp) noexcept
		:value(Dhcp{}) {}

	IpConfig(Address &&address) noexcept
		:value(std::move(address)) {}

	IpConfig(Range &&range) noexcept
		:value(std::move(range)) {}

	static IpConfig MakeAddress(std::string_view address) noexcept {
		return Address{std::string{address}};
	}

	static IpConfig MakeRange(std::string_view first,
				  std::string_view last) noexcept {
		return Range{std::string{first}, std::string{last}};
	}

	bool IsDefined() const noexcept {
		return !std::holds_alternative<std::monostate>(value);
	}
};

/**
 * Parameters of one network namespace interface ("--net=DEVICE" and
 * the per-interface options following it).
 */
struct NetInterface {
	std::string device;

	IpConfig ip;

	std::optional<std::string> ip6;
	std::optional<std::string> mac;
	std::optional<unsigned> mtu;
	std::optional<std::string> netmask;
	std::optional<std::string> veth_name;

	explicit NetInterface(std::string_view _device) noexcept
		:device(_device) {}
};

struct Net {
	/**
	 * No network at all ("--net=none").
	 */
	struct None {};

	/**
	 * One or more interfaces, emitted in this order.
	 */
	using Interfaces = std::vector<NetInterface>;

	std::variant<std::monostate, None, Interfaces> value;

	Net() = default;

	Net(None) noexcept
		:value(None{}) {}

	Net(Interfaces &&interfaces) noexcept
		:value(std::move(interfaces)) {}

	bool IsDefined() const noexcept {
		return !std::holds_alternative<std::monostate>(value);
	}

	/**
	 * Append an interface, replacing any other alternative.
	 */
	NetInterface &AddInterface(std::string_view device) noexcept {
		auto *interfaces = std::get_if<Interfaces>(&value);
		if (interfaces == nullptr)
			interfaces = &value.emplace<Interfaces>();

		return interfaces->emplace_back(device);
	}

	/**
	 * Returns the most recently added interface or nullptr if
	 * there is none.
	 */
	NetInterface *GetLastInterface() noexcept {
		auto *interfaces = std::get_if<Interfaces>(&value);
		if (interfaces == nullptr || interfaces->empty())
			return nullptr;

		return &interfaces->back();
	}
};

struct NetFilter {
	/**
	 * The launcher's default client filter ("--netfilter").
	 */
	struct Default {};

	/**
	 * A filter file ("--netfilter=FILE").
	 */
	struct File {
		std::filesystem::path path;
	};

	std::variant<std::monostate, Default, File> value;

	NetFilter() = default;

	NetFilter(Default) noexcept
		:value(Default{}) {}

	NetFilter(File &&file) noexcept
		:value(std::move(file)) {}

	bool IsDefined() const noexcept {
		return !std::holds_alternative<std::monostate>(value);
	}
};

/**
 * Join an existing sandbox, identified by name or PID.
 */
struct Join {
	/**
	 * "--join=TARGET"
	 */
	struct Any {
		std::string target;
	};

	/**
	 * "--join-network=TARGET"
	 */
	struct Network {
		std::string target;
	};

	/**
	 * "--join-filesystem=TARGET"
	 */
	struct Filesystem {
		std::string target;
	};

	/**
	 * Join the sandbox with this name or start a new one
	 * ("--join-or-start=NAME").
	 */
	struct OrStart {
		std::string name;
	};

	std::variant<std::monostate, Any, Network, Filesystem, OrStart> value;

	Join() = default;

	Join(Any &&any) noexcept
		:value(std::move(any)) {}

	Join(Network &&network) noexcept
		:value(std::move(network)) {}

	Join(Filesystem &&filesystem) noexcept
		:value(std::move(filesystem)) {}

	Join(OrStart &&or_start) noexcept
		:value(std::move(or_start)) {}

	bool IsDefined() const noexcept {
		return !std::holds_alternative<std::monostate>(value);
	}
};

struct Overlay {
	/**
	 * "--overlay"
	 */
	struct Default {};

	/**
	 * Discard all changes on exit ("--overlay-tmpfs").
	 */
	struct Tmpfs {};

	/**
	 * A persistent overlay ("--overlay-named=NAME").
	 */
	struct Named {
		std::string name;
	};

	std::variant<std::monostate, Default, Tmpfs, Named> value;

	Overlay() = default;

	Overlay(Default) noexcept
		:value(Default{}) {}

	Overlay(Tmpfs) noexcept
		:value(Tmpfs{}) {}

	Overlay(Named &&named) noexcept
		:value(std::move(named)) {}

	bool IsDefined() const noexcept {
		return !std::holds_alternative<std::monostate>(value);
	}
};

/**
 * A private home directory.
 */
struct Private {
	/**
	 * A temporary home directory, discarded on exit ("--private").
	 */
	struct Temporary {};

	/**
	 * Use this directory as home ("--private=DIRECTORY").
	 */
	struct Directory {
		std::filesystem::path path;
	};

	std::variant<std::monostate, Temporary, Directory> value;

	Private() = default;

	Private(Temporary) noexcept
		:value(Temporary{}) {}

	Private(Directory &&directory) noexcept
		:value(std::move(directory)) {}

	bool IsDefined() const noexcept {
		return !std::holds_alternative<std::monostate>(value);
	}
};

/**
 * Lists of files to copy into private directories
 * ("--private-home=", "--private-bin=", ...).
 */
struct PrivateList {
	enum class Kind : uint_least8_t {
		HOME,
		BIN,
		ETC,
		LIB,
		OPT,
		SRV,

		MAX
	};

	/**
	 * An immutable snapshot created by PrivateListBuilder::Build().
	 */
	class Settings {
	public:
		using Lists = std::array<std::vector<std::string>,
					 std::size_t(Kind::MAX)>;

	private:
		Lists lists;

	public:
		explicit Settings(Lists &&_lists) noexcept
			:lists(std::move(_lists)) {}

		const std::vector<std::string> &Get(Kind kind) const noexcept {
			return lists[std::size_t(kind)];
		}
	};

	std::variant<std::monostate, Settings> value;

	PrivateList() = default;

	PrivateList(Settings &&settings) noexcept
		:value(std::move(settings)) {}

	bool IsDefined() const noexcept {
		return !std::holds_alternative<std::monostate>(value);
	}
};

/**
 * The seccomp-bpf system call filter.
 */
struct Seccomp {
	/**
	 * The default blacklist ("--seccomp").
	 */
	struct Default {};

	/**
	 * The default blacklist plus these system calls
	 * ("--seccomp=A,B").
	 */
	struct Syscalls {
		std::vector<std::string> syscalls;
	};

	/**
	 * Only these system calls are blocked ("--seccomp.drop=A,B").
	 */
	struct Drop {
		std::vector<std::string> syscalls;
	};

	/**
	 * Only these system calls are allowed ("--seccomp.keep=A,B").
	 */
	struct Keep {
		std::vector<std::string> syscalls;
	};

	std::variant<std::monostate, Default, Syscalls, Drop, Keep> value;

	Seccomp() = default;

	Seccomp(Default) noexcept
		:value(Default{}) {}

	Seccomp(Syscalls &&syscalls) noexcept
		:value(std::move(syscalls)) {}

	Seccomp(Drop &&drop) noexcept
		:value(std::move(drop)) {}

	Seccomp(Keep &&keep) noexcept
		:value(std::move(keep)) {}

	bool IsDefined() const noexcept {
		return !std::holds_alternative<std::monostate>(value);
	}
};

/**
 * Override the user's login shell.
 */
struct Shell {
	/**
	 * Run the program directly, without a shell ("--shell=none").
	 */
	struct None {};

	/**
	 * "--shell=PROGRAM"
	 */
	struct Program {
		std::filesystem::path path;
	};

	std::variant<std::monostate, None, Program> value;

	Shell() = default;

	Shell(None) noexcept
		:value(None{}) {}

	Shell(Program &&program) noexcept
		:value(std::move(program)) {}

	bool IsDefined() const noexcept {
		return !std::holds_alternative<std::monostate>(value);
	}
};

/**
 * X11 server isolation.
 */
enum class X11 : uint_least8_t {
	NOT_SPECIFIED,

	/**
	 * Let the launcher pick a server ("--x11").
	 */
	AUTO,

	/**
	 * Block access to the X11 server ("--x11=none").
	 */
	NONE,

	XEPHYR,
	XORG,
	XPRA,
	XVFB,
};

} // namespace JailSpawn
