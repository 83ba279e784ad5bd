/* -*- C++ -*-
 * (c) 2006 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1.
 * Refer to the file "COPYING" for details.
 */

#ifndef IOMUX_IOREADY_EPOLL_H
#define IOMUX_IOREADY_EPOLL_H

#include <sys/epoll.h>

#include <vector>

#include <iomux/ioready.h>

namespace iomux {

class ioready_selector_epoll final : public ioready_selector {
public:
	~ioready_selector_epoll() noexcept override;

	explicit
	ioready_selector_epoll(std::size_t max_events = 1024);

	selector_key
	modify(const io_handle & handle, ioready_events events, void * data = nullptr) override;

	const char *
	name() const noexcept override;

	int
	fileno() const;

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
	void
	control(int op, int fd, ioready_events events, const char * operation);

	int epoll_fd_;
	std::size_t max_events_;
	std::vector<epoll_event> events_;
};

}

#endif
