#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

/**
 * A temporary directory which is deleted recursively by the
 * destructor.
 */
class TempDirectory {
	std::string path;

public:
	TempDirectory() {
		char buffer[] = "/tmp/batch-test-XXXXXX";
		if (mkdtemp(buffer) == nullptr)
			throw std::runtime_error("mkdtemp() failed");

		path = buffer;
	}

	~TempDirectory() noexcept {
		nftw(path.c_str(), [](const char *p, const struct stat *,
				      int, struct FTW *){
			return remove(p);
		}, 16, FTW_DEPTH|FTW_PHYS);
	}

	TempDirectory(const TempDirectory &) = delete;
	TempDirectory &operator=(const TempDirectory &) = delete;

	const std::string &GetPath() const noexcept {
		return path;
	}

	std::string Make(std::string_view name) const {
		return path + "/" + std::string{name};
	}

	/**
	 * Create a file with the given contents and mode.
	 *
	 * @return the absolute path
	 */
	std::string WriteFile(std::string_view name, std::string_view contents,
			      mode_t mode=0644) const {
		const auto p = Make(name);
		int fd = open(p.c_str(), O_WRONLY|O_CREAT|O_TRUNC|O_CLOEXEC,
			      mode);
		if (fd < 0)
			throw std::runtime_error("open() failed");

		if (write(fd, contents.data(), contents.size()) != (ssize_t)contents.size()) {
			close(fd);
			throw std::runtime_error("write() failed");
		}

		fchmod(fd, mode);
		close(fd);
		return p;
	}

	std::string WriteScript(std::string_view name,
				std::string_view body) const {
		return WriteFile(name, std::string{"#!/bin/sh\n"} + std::string{body},
				 0755);
	}

	std::string ReadFile(std::string_view name) const {
		const auto p = Make(name);
		FILE *file = fopen(p.c_str(), "r");
		if (file == nullptr)
			return {};

		std::string result;
		char buffer[1024];
		size_t nbytes;
		while ((nbytes = fread(buffer, 1, sizeof(buffer), file)) > 0)
			result.append(buffer, nbytes);

		fclose(file);
		return result;
	}
};
