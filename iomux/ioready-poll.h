/* -*- C++ -*-
 * (c) 2006 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1.
 * Refer to the file "COPYING" for details.
 */

#ifndef IOMUX_IOREADY_POLL_H
#define IOMUX_IOREADY_POLL_H

#include <vector>

#include <sys/poll.h>

#include <iomux/ioready.h>

namespace iomux {

class ioready_selector_poll final : public ioready_selector {
public:
	~ioready_selector_poll() noexcept override;

	ioready_selector_poll();

	selector_key
	modify(const io_handle & handle, ioready_events events, void * data = nullptr) override;

	const char *
	name() const noexcept override;

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
	static ioready_events
	translate_os_to_iomux(int ev) noexcept;

	static int
	translate_iomux_to_os(ioready_events ev) noexcept;

	static constexpr std::size_t no_index = static_cast<std::size_t>(-1);

	std::vector<struct pollfd> polltab_;
	/* descriptor -> position in polltab_, no_index if absent */
	std::vector<std::size_t> polltab_index_;
};

}

#endif
