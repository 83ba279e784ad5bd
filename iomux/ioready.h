/* -*- C++ -*-
 * (c) 2006 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1.
 * Refer to the file "COPYING" for details.
 */

#ifndef IOMUX_IOREADY_H
#define IOMUX_IOREADY_H

/** \file ioready.h */

#include <chrono>
#include <memory>
#include <vector>

#include <iomux/detail/fd-key-table.h>
#include <iomux/selector-error.h>
#include <iomux/selector-key.h>

namespace iomux {

enum class selector_backend {
	epoll,
	kqueue,
	poll,
	select
};

const char *
selector_backend_name(selector_backend backend) noexcept;

class ioready_selector {
public:
	virtual ~ioready_selector() noexcept;

	selector_key
	register_handle(const io_handle & handle, ioready_events events, void * data = nullptr);

	selector_key
	unregister(const io_handle & handle);

	virtual selector_key
	modify(const io_handle & handle, ioready_events events, void * data = nullptr);

	std::vector<selector_event>
	select(const std::chrono::steady_clock::duration * timeout = nullptr);

	void
	close() noexcept;

	selector_key
	get_key(const io_handle & handle) const;

	std::vector<selector_key>
	keys() const;

	std::size_t
	size() const noexcept;

	inline bool
	is_closed() const noexcept
	{
		return closed_;
	}

	virtual const char *
	name() const noexcept = 0;

	static std::unique_ptr<ioready_selector>
	create();

	static std::unique_ptr<ioready_selector>
	create(selector_backend backend);

	static std::vector<selector_backend>
	available_backends();

protected:
	struct ready_descriptor {
		int fd;
		ioready_events events;
	};

	ioready_selector();

	ioready_selector(const ioready_selector &) = delete;
	ioready_selector & operator=(const ioready_selector &) = delete;

	virtual void
	add_interest(int fd, ioready_events events) = 0;

	virtual void
	remove_interest(int fd, ioready_events events) = 0;

	virtual void
	update_interest(int fd, ioready_events old_events, ioready_events new_events);

	virtual bool
	wait_ready(
		const std::chrono::steady_clock::duration * timeout,
		std::vector<ready_descriptor> & ready) = 0;

	virtual void
	release() noexcept = 0;

	selector_key
	modify_atomic(const io_handle & handle, ioready_events events, void * data);

	inline const detail::fd_key_table &
	table() const noexcept
	{
		return table_;
	}

private:
	void
	check_open() const;

	void
	discard_interest(const selector_key & key) noexcept;

	const selector_key &
	lookup(const io_handle & handle) const;

	static void
	validate(ioready_events events);

	detail::fd_key_table table_;
	std::vector<ready_descriptor> ready_;
	bool closed_;
};

}

#endif
