// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "io/UniqueFileDescriptor.hxx"

#include <cstdint>

/**
 * Describes what a standard stream of a child process is connected
 * to.
 */
class Stdio {
public:
	enum class Mode : uint_least8_t {
		/**
		 * Use the stream of this process.
		 */
		INHERIT,

		/**
		 * Create a pipe; the other end is available from
		 * #ChildProcess.
		 */
		PIPE,

		/**
		 * Connect to /dev/null.
		 */
		NUL,

		/**
		 * Use a descriptor supplied by the caller.
		 */
		FD,
	};

private:
	Mode mode = Mode::INHERIT;

	UniqueFileDescriptor fd;

	explicit Stdio(Mode _mode) noexcept
		:mode(_mode) {}

	explicit Stdio(UniqueFileDescriptor &&_fd) noexcept
		:mode(Mode::FD), fd(std::move(_fd)) {}

public:
	Stdio() noexcept = default;

	Stdio(Stdio &&) noexcept = default;
	Stdio &operator=(Stdio &&) noexcept = default;

	static Stdio Inherit() noexcept {
		return Stdio{Mode::INHERIT};
	}

	static Stdio Piped() noexcept {
		return Stdio{Mode::PIPE};
	}

	static Stdio Null() noexcept {
		return Stdio{Mode::NUL};
	}

	static Stdio From(UniqueFileDescriptor &&fd) noexcept {
		return Stdio{std::move(fd)};
	}

	/**
	 * Set up the descriptor for a new child process.  The
	 * descriptor supplied to From() is borrowed, so this object
	 * may be used for more than one child.
	 *
	 * Throws std::system_error on error.
	 *
	 * @param child_fd receives the descriptor to be installed in
	 * the child (undefined to inherit)
	 * @param child_end receives descriptors opened by this method
	 * which must stay open until the child has been spawned
	 * @param input true if this is the child's stdin (selects the
	 * direction of the pipe)
	 * @return the parent's end of the pipe if #mode is PIPE,
	 * otherwise an undefined object
	 */
	UniqueFileDescriptor Prepare(FileDescriptor &child_fd,
				     UniqueFileDescriptor &child_end,
				     bool input) const;
};
