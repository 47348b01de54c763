// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <utility>

#include <unistd.h>

/**
 * A file descriptor which is closed automatically.
 */
class OwnedFd {
	int fd = -1;

public:
	OwnedFd() = default;
	explicit OwnedFd(int _fd) noexcept:fd(_fd) {}

	OwnedFd(OwnedFd &&src) noexcept
		:fd(std::exchange(src.fd, -1)) {}

	~OwnedFd() noexcept {
		Close();
	}

	OwnedFd &operator=(OwnedFd &&src) noexcept {
		using std::swap;
		swap(fd, src.fd);
		return *this;
	}

	bool IsDefined() const noexcept {
		return fd >= 0;
	}

	int Get() const noexcept {
		return fd;
	}

	int Release() noexcept {
		return std::exchange(fd, -1);
	}

	void Close() noexcept {
		if (fd >= 0)
			::close(std::exchange(fd, -1));
	}
};
