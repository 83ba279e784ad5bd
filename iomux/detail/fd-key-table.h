/* -*- C++ -*-
 * (c) 2010 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1.
 * Refer to the file "COPYING" for details.
 */

#ifndef IOMUX_DETAIL_FD_KEY_TABLE_H
#define IOMUX_DETAIL_FD_KEY_TABLE_H

#include <cstddef>
#include <memory>
#include <vector>

#include <iomux/selector-key.h>

namespace iomux {
namespace detail {

class fd_key_table {
public:
	~fd_key_table() noexcept;

	explicit
	fd_key_table(std::size_t initial = 32);

	const selector_key *
	find(int fd) const noexcept;

	const selector_key *
	find_handle(const io_handle & handle) const noexcept;

	void
	insert(const selector_key & key) /* throw(std::bad_alloc) */;

	void
	replace(const selector_key & key) noexcept;

	selector_key
	remove(int fd) noexcept;

	void
	clear() noexcept;

	std::vector<selector_key>
	snapshot() const;

	inline std::size_t
	size() const noexcept
	{
		return size_;
	}

	/** \brief One past the highest registered descriptor */
	inline int
	limit() const noexcept
	{
		return limit_;
	}

	template<typename Function>
	void
	for_each(Function && function) const
	{
		for (int fd = 0; fd < limit_; ++fd) {
			const selector_key * key = entries_[fd].get();
			if (key) {
				function(*key);
			}
		}
	}

private:
	std::vector<std::unique_ptr<selector_key>> entries_;
	std::size_t size_;
	int limit_;
};

}
}

#endif
