/* -*- C++ -*-
 * (c) 2006 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1.
 * Refer to the file "COPYING" for details.
 */

#ifndef IOMUX_WAKEUP_PIPE_H
#define IOMUX_WAKEUP_PIPE_H

#include <atomic>

namespace iomux {

class wakeup_pipe final {
public:
	~wakeup_pipe() noexcept;

	wakeup_pipe();

	wakeup_pipe(const wakeup_pipe &) = delete;
	wakeup_pipe & operator=(const wakeup_pipe &) = delete;

	void
	set() noexcept;

	void
	clear() noexcept;

	inline bool
	flagged() const noexcept
	{
		return flagged_.load(std::memory_order_relaxed);
	}

	inline int
	readfd() const noexcept
	{
		return readfd_;
	}

	/** \brief Descriptor to register for input, same as \ref readfd */
	inline int
	fileno() const noexcept
	{
		return readfd_;
	}

private:
	int readfd_;
	int writefd_;
	std::atomic<bool> flagged_;
};

}

#endif
