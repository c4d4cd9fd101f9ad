// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Reader.hxx"

/**
 * A #Reader for a regular file.
 */
class FileReader final : public Reader {
	int fd;

public:
	/**
	 * Throws std::system_error on error.
	 */
	explicit FileReader(const char *path);

	~FileReader() noexcept;

	FileReader(const FileReader &) = delete;
	FileReader &operator=(const FileReader &) = delete;

	/* virtual methods from class Reader */
	std::size_t Read(std::span<std::byte> dest) override;
};
