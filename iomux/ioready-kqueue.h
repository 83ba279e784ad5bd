/* -*- C++ -*-
 * (c) 2006 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1.
 * Refer to the file "COPYING" for details.
 */

#ifndef IOMUX_IOREADY_KQUEUE_H
#define IOMUX_IOREADY_KQUEUE_H

#include <sys/types.h>
#include <sys/event.h>
#include <sys/time.h>

#include <vector>

#include <iomux/ioready.h>

namespace iomux {

class ioready_selector_kqueue final : public ioready_selector {
public:
	~ioready_selector_kqueue() noexcept override;

	explicit
	ioready_selector_kqueue(std::size_t max_events = 1024);

	selector_key
	modify(const io_handle & handle, ioready_events events, void * data = nullptr) override;

	const char *
	name() const noexcept override;

	int
	fileno() const;

	inline std::size_t
	active_filters() const noexcept
	{
		return active_filters_;
	}

protected:
	void
	add_interest(int fd, ioready_events events) override;

	void
	remove_interest(int fd, ioready_events events) override;

	void
	update_interest(int fd, ioready_events old_events, ioready_events new_events) override;

	bool
	wait_ready(
		const std::chrono::steady_clock::duration * timeout,
		std::vector<ready_descriptor> & ready) override;

	void
	release() noexcept override;

private:
	/* read and write filters are separate kernel entries */
	struct filter_slots {
		bool read = false;
		bool write = false;
	};

	filter_slots
	current(int fd) const noexcept;

	void
	set_filter(int fd, short filter, bool enable);

	void
	apply_mask(int fd, ioready_events events);

	int kqueue_fd_;
	std::size_t max_events_;
	std::size_t active_filters_;
	std::vector<filter_slots> filters_;
	std::vector<struct kevent> events_;
};

}

#endif
