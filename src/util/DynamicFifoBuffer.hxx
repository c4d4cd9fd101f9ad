// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <memory>
#include <span>

/**
 * A first-in-first-out buffer: you can append data at the end, and
 * read data from the beginning.  The buffer is shifted and grown
 * automatically as needed.  It is not thread safe.
 */
template<typename T>
class DynamicFifoBuffer {
public:
	using size_type = std::size_t;
	using Range = std::span<T>;

private:
	std::unique_ptr<T[]> data;
	size_type capacity;
	size_type head = 0, tail = 0;

public:
	/**
	 * Allocate a buffer with the given initial capacity.
	 */
	explicit DynamicFifoBuffer(size_type _capacity) noexcept
		:data(new T[_capacity]), capacity(_capacity) {}

	DynamicFifoBuffer(const DynamicFifoBuffer &) = delete;
	DynamicFifoBuffer &operator=(const DynamicFifoBuffer &) = delete;

	constexpr size_type GetCapacity() const noexcept {
		return capacity;
	}

	constexpr void Clear() noexcept {
		head = tail = 0;
	}

	constexpr bool empty() const noexcept {
		return head == tail;
	}

	constexpr size_type GetAvailable() const noexcept {
		return tail - head;
	}

	/**
	 * Return a buffer range which may be read.  The buffer pointer is
	 * writable, to allow modifications while parsing.
	 */
	Range Read() const noexcept {
		return {data.get() + head, tail - head};
	}

	/**
	 * Marks a chunk as consumed.
	 */
	void Consume(size_type n) noexcept {
		assert(head + n <= tail);

		head += n;
		if (head == tail)
			Clear();
	}

	/**
	 * Prepares writing.  Returns a buffer range which may be
	 * written; it is empty if the buffer is full.  When you are
	 * finished, call Append().
	 */
	Range Write() noexcept {
		if (tail == capacity)
			Shift();

		return {data.get() + tail, capacity - tail};
	}

	/**
	 * Like Write(), but ensure that at least #n items can be
	 * written, growing the buffer if necessary.
	 */
	Range Write(size_type n) noexcept {
		if (tail + n > capacity) {
			Shift();

			if (tail + n > capacity) {
				size_type new_capacity = capacity;
				do {
					new_capacity <<= 1;
				} while (new_capacity < tail + n);

				Grow(new_capacity);
			}
		}

		return {data.get() + tail, capacity - tail};
	}

	/**
	 * Expands the tail of the buffer, after data has been written to
	 * the buffer returned by Write().
	 */
	void Append(size_type n) noexcept {
		assert(tail + n <= capacity);

		tail += n;
	}

	/**
	 * Copy data to the end of the buffer, growing it as needed.
	 */
	void Append(std::span<const T> src) noexcept {
		auto w = Write(src.size());
		std::copy(src.begin(), src.end(), w.begin());
		Append(src.size());
	}

	void Grow(size_type new_capacity) noexcept {
		assert(new_capacity > capacity);

		std::unique_ptr<T[]> new_data(new T[new_capacity]);
		const auto r = Read();
		std::move(r.begin(), r.end(), new_data.get());

		data = std::move(new_data);
		capacity = new_capacity;
		tail -= head;
		head = 0;
	}

private:
	void Shift() noexcept {
		if (head == 0)
			return;

		const auto r = Read();
		std::move(r.begin(), r.end(), data.get());

		tail -= head;
		head = 0;
	}
};
