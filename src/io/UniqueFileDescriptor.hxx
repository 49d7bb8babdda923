// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "FileDescriptor.hxx"

#include <utility>

/**
 * An OO wrapper for a UNIX file descriptor which closes it
 * automatically in the destructor.
 */
class UniqueFileDescriptor : protected FileDescriptor {
public:
	UniqueFileDescriptor() noexcept
		:FileDescriptor(FileDescriptor::Undefined()) {}

	UniqueFileDescriptor(UniqueFileDescriptor &&other) noexcept
		:FileDescriptor(other.Steal()) {}

	~UniqueFileDescriptor() noexcept {
		if (IsDefined())
			Close();
	}

	UniqueFileDescriptor &operator=(UniqueFileDescriptor &&other) noexcept {
		using std::swap;
		swap(fd, other.fd);
		return *this;
	}

	FileDescriptor ToFileDescriptor() const noexcept {
		return *this;
	}

	using FileDescriptor::IsDefined;
	using FileDescriptor::Open;
	using FileDescriptor::Close;
	using FileDescriptor::Read;
	using FileDescriptor::Write;

	[[nodiscard]]
	static bool CreatePipe(UniqueFileDescriptor &r,
			       UniqueFileDescriptor &w) noexcept {
		return FileDescriptor::CreatePipe(r, w);
	}
};
