/* -*- C++ -*-
 * (c) 2006 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1.
 * Refer to the file "COPYING" for details.
 */

#ifndef IOMUX_IOREADY_SELECT_H
#define IOMUX_IOREADY_SELECT_H

#include <sys/select.h>

#include <iomux/ioready.h>

namespace iomux {

class ioready_selector_select final : public ioready_selector {
public:
	~ioready_selector_select() noexcept override;

	ioready_selector_select();

	const char *
	name() const noexcept override;

protected:
	void
	add_interest(int fd, ioready_events events) override;

	void
	remove_interest(int fd, ioready_events events) override;

	bool
	wait_ready(
		const std::chrono::steady_clock::duration * timeout,
		std::vector<ready_descriptor> & ready) override;

	void
	release() noexcept override;

private:
	void
	handle_events(
		const fd_set & readfds, const fd_set & writefds, const fd_set & exceptfds,
		int maxfd,
		std::vector<ready_descriptor> & ready) const;
};

}

#endif
