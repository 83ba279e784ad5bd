/* -*- C++ -*-
 * (c) 2010 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1
 * Refer to the file "COPYING" for details.
 */

#include <iomux/detail/fd-key-table.h>

namespace iomux {
namespace detail {

/**
	\class fd_key_table
	\brief Registry of selector keys indexed by descriptor
	\headerfile iomux/detail/fd-key-table.h <iomux/detail/fd-key-table.h>

	Authoritative mapping from file descriptor to the \ref selector_key
	registered for it. The table is a vector indexed directly by
	descriptor value and grows on demand; descriptors handed out by the
	operating system are small and dense, so lookup is a single index
	operation.

	The table holds at most one key per descriptor. Callers must check
	\ref find before calling \ref insert, and must only call \ref
	replace and \ref remove for descriptors that are present.

	Iteration through \ref for_each visits keys in ascending descriptor
	order, up to \ref limit.
*/

fd_key_table::~fd_key_table() noexcept
{
}

/* may throw std::bad_alloc */
fd_key_table::fd_key_table(std::size_t initial)
	: size_(0), limit_(0)
{
	entries_.resize(initial);
}

const selector_key *
fd_key_table::find(int fd) const noexcept
{
	if (fd < 0 || static_cast<std::size_t>(fd) >= entries_.size()) {
		return nullptr;
	}
	return entries_[fd].get();
}

/**
	\brief Find key by handle identity

	Linear search, used when a handle does not resolve to a descriptor
	anymore (e.g. the object behind it has been closed already).
*/
const selector_key *
fd_key_table::find_handle(const io_handle & handle) const noexcept
{
	for (int fd = 0; fd < limit_; ++fd) {
		const selector_key * key = entries_[fd].get();
		if (key && key->handle() == handle) {
			return key;
		}
	}
	return nullptr;
}

void
fd_key_table::insert(const selector_key & key)
{
	std::size_t fd = key.fd();
	if (fd >= entries_.size()) {
		std::size_t capacity = entries_.size() ? entries_.size() : 1;
		while (capacity <= fd) {
			capacity *= 2;
		}
		entries_.resize(capacity);
	}

	entries_[fd].reset(new selector_key(key));
	++size_;
	if (key.fd() >= limit_) {
		limit_ = key.fd() + 1;
	}
}

void
fd_key_table::replace(const selector_key & key) noexcept
{
	*entries_[key.fd()] = key;
}

selector_key
fd_key_table::remove(int fd) noexcept
{
	std::unique_ptr<selector_key> entry = std::move(entries_[fd]);
	--size_;

	if (fd == limit_ - 1) {
		for (;;) {
			--limit_;
			if (!limit_ || entries_[limit_ - 1]) {
				break;
			}
		}
	}

	return *entry;
}

void
fd_key_table::clear() noexcept
{
	for (int fd = 0; fd < limit_; ++fd) {
		entries_[fd].reset();
	}
	size_ = 0;
	limit_ = 0;
}

std::vector<selector_key>
fd_key_table::snapshot() const
{
	std::vector<selector_key> keys;
	keys.reserve(size_);
	for_each([&keys](const selector_key & key) { keys.push_back(key); });
	return keys;
}

}
}
