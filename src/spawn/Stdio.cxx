// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Stdio.hxx"
#include "system/Error.hxx"

#include <fcntl.h>

UniqueFileDescriptor
Stdio::Prepare(FileDescriptor &child_fd, UniqueFileDescriptor &child_end,
	       bool input) const
{
	child_fd.SetUndefined();

	switch (mode) {
	case Mode::INHERIT:
		break;

	case Mode::PIPE:
		{
			UniqueFileDescriptor r, w;
			if (!UniqueFileDescriptor::CreatePipe(r, w))
				throw MakeErrno("pipe() failed");

			if (input) {
				child_end = std::move(r);
				child_fd = child_end.ToFileDescriptor();
				return w;
			} else {
				child_end = std::move(w);
				child_fd = child_end.ToFileDescriptor();
				return r;
			}
		}

	case Mode::NUL:
		if (!child_end.Open("/dev/null", O_RDWR))
			throw MakeErrno("Failed to open /dev/null");

		child_fd = child_end.ToFileDescriptor();
		break;

	case Mode::FD:
		child_fd = fd.ToFileDescriptor();
		break;
	}

	return {};
}
