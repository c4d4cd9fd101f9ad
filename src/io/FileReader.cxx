// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "FileReader.hxx"
#include "system/Error.hxx"

#include <fmt/format.h>

#include <fcntl.h>
#include <unistd.h>

FileReader::FileReader(const char *path)
	:fd(open(path, O_RDONLY|O_CLOEXEC))
{
	if (fd < 0) {
		const int e = errno;
		throw MakeErrno(e, fmt::format("Failed to open {}", path).c_str());
	}
}

FileReader::~FileReader() noexcept
{
	close(fd);
}

std::size_t
FileReader::Read(std::span<std::byte> dest)
{
	ssize_t nbytes;
	do {
		nbytes = read(fd, dest.data(), dest.size());
	} while (nbytes < 0 && errno == EINTR);

	if (nbytes < 0)
		throw MakeErrno("Failed to read from file");

	return nbytes;
}
