/* -*- C++ -*-
 * (c) 2006 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1
 * Refer to the file "COPYING" for details.
 */

#include <iomux/ioready-select.h>

#include <errno.h>

#include <cstdint>

#include <iomux/detail/timeout.h>

namespace iomux {

/**
	\class ioready_selector_select
	\brief Selector using the \p select system call
	\headerfile iomux/ioready-select.h <iomux/ioready-select.h>

	This class collects the IO readiness state of the registered
	descriptors using the \p select system call.

	\p select is the most portable system call to determine the IO
	readiness state of a set of descriptors, but also by far the
	slowest. It has a hard (compile-time) limitation on the number of
	permissible descriptors (\p FD_SETSIZE), and is O(n) in the number
	of descriptors watched. Registering a descriptor beyond that limit
	fails with \ref backend_error.

	The descriptor sets are rebuilt from the registry on every wait, so
	the backend keeps no state of its own. \ref modify uses the
	generic, non-atomic implementation of \ref ioready_selector.

	Use of this selector should be avoided if possible, choose one of
	the better performing alternatives instead and fall back to \ref
	iomux::ioready_selector_select "ioready_selector_select" only if
	nothing else is available.
*/

ioready_selector_select::~ioready_selector_select() noexcept
{
	close();
}

ioready_selector_select::ioready_selector_select()
{
}

const char *
ioready_selector_select::name() const noexcept
{
	return "select";
}

void
ioready_selector_select::add_interest(int fd, ioready_events)
{
	if (fd >= FD_SETSIZE) {
		throw backend_error(EINVAL, "select: descriptor " + std::to_string(fd) + " exceeds FD_SETSIZE");
	}
}

void
ioready_selector_select::remove_interest(int, ioready_events)
{
}

void
ioready_selector_select::release() noexcept
{
}

void
ioready_selector_select::handle_events(
	const fd_set & readfds, const fd_set & writefds, const fd_set & exceptfds,
	int maxfd,
	std::vector<ready_descriptor> & ready) const
{
	for (int fd = 0; fd < maxfd; ++fd) {
		int r = FD_ISSET(fd, &readfds);
		int w = FD_ISSET(fd, &writefds);
		int e = FD_ISSET(fd, &exceptfds);
		if (r || w || e) {
			ioready_events ev = ioready_none;
			if (r) {
				ev = ioready_input;
			}
			if (w) {
				ev |= ioready_output;
			}
			/* deliver exception events to everyone */
			if (e) {
				ev |= ioready_input | ioready_output;
			}

			ready.push_back(ready_descriptor{fd, ev});
		}
	}
}

bool
ioready_selector_select::wait_ready(
	const std::chrono::steady_clock::duration * timeout,
	std::vector<ready_descriptor> & ready)
{
	fd_set readfds, writefds, exceptfds;
	FD_ZERO(&readfds);
	FD_ZERO(&writefds);
	FD_ZERO(&exceptfds);

	table().for_each([&readfds, &writefds, &exceptfds](const selector_key & key)
		{
			if (key.events() & ioready_input) {
				FD_SET(key.fd(), &readfds);
			}
			if (key.events() & ioready_output) {
				FD_SET(key.fd(), &writefds);
			}
			FD_SET(key.fd(), &exceptfds);
		});
	int maxfd = table().limit();

	struct timeval tv, * select_timeout;
	if (timeout) {
		/* round up to microsecond resolution */
		uint64_t usecs = detail::round_up_timeout<std::chrono::microseconds>(*timeout);
		tv.tv_sec = usecs / 1000000;
		tv.tv_usec = usecs % 1000000;
		select_timeout = &tv;
	} else {
		select_timeout = nullptr;
	}

	int count = ::select(maxfd, &readfds, &writefds, &exceptfds, select_timeout);
	if (count < 0) {
		int error = errno;
		if (error == EINTR) {
			return false;
		}
		throw backend_error(error, "select");
	}

	if (count > 0) {
		handle_events(readfds, writefds, exceptfds, maxfd, ready);
	}

	return true;
}

/** \cond false */
std::unique_ptr<ioready_selector>
create_ioready_selector_select()
{
	return std::unique_ptr<ioready_selector>(new ioready_selector_select());
}
/** \endcond */

}
