// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <cstddef>
#include <utility>

#include <sys/types.h>
#include <unistd.h>

/**
 * An OO wrapper for a UNIX file descriptor.
 *
 * This class is unmanaged and trivial; for a managed version, see
 * #UniqueFileDescriptor.
 */
class FileDescriptor {
protected:
	int fd;

public:
	FileDescriptor() = default;
	explicit constexpr FileDescriptor(int _fd) noexcept:fd(_fd) {}

	constexpr bool operator==(FileDescriptor other) const noexcept {
		return fd == other.fd;
	}

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	/**
	 * Returns the file descriptor.  This may only be called if
	 * IsDefined() returns true.
	 */
	constexpr int Get() const noexcept {
		return fd;
	}

	int Steal() noexcept {
		return std::exchange(fd, -1);
	}

	void SetUndefined() noexcept {
		fd = -1;
	}

	static constexpr FileDescriptor Undefined() noexcept {
		return FileDescriptor(-1);
	}

	bool Open(const char *pathname, int flags, mode_t mode=0666) noexcept;

	/**
	 * Create a pipe with O_CLOEXEC on both ends.
	 */
	[[nodiscard]]
	static bool CreatePipe(FileDescriptor &r, FileDescriptor &w) noexcept;

	void DisableCloseOnExec() const noexcept;

	/**
	 * Duplicate this file descriptor onto the given one.  If both
	 * are equal, the close-on-exec flag is cleared instead, so
	 * the descriptor survives execve().
	 */
	bool CheckDuplicate(FileDescriptor new_fd) const noexcept;

	/**
	 * Close the file descriptor.  It should not be called on an
	 * "undefined" object.  After this call, IsDefined() is
	 * guaranteed to return false, and this object may be reused.
	 */
	bool Close() noexcept {
		return ::close(Steal()) == 0;
	}

	ssize_t Read(void *buffer, std::size_t length) const noexcept {
		return ::read(fd, buffer, length);
	}

	ssize_t Write(const void *buffer, std::size_t length) const noexcept {
		return ::write(fd, buffer, length);
	}
};
