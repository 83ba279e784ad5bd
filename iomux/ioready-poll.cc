/* -*- C++ -*-
 * (c) 2006 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1
 * Refer to the file "COPYING" for details.
 */

#include <iomux/ioready-poll.h>

#include <errno.h>
#include <fcntl.h>

#include <limits>

#include <iomux/detail/timeout.h>

namespace iomux {

/**
	\class ioready_selector_poll
	\brief Selector using the \p poll system call
	\headerfile iomux/ioready-poll.h <iomux/ioready-poll.h>

	This class collects the IO readiness state of the registered
	descriptors using the <TT>poll</TT> system call.

	The <TT>poll</TT> system call usually performs considerably
	better than <TT>select</TT> and has no limit on descriptor values,
	though it has the same asymptotic behaviour (and is thus not very
	well-suited for watching large numbers of mostly idle
	descriptors).

	The backend maintains the array passed to <TT>poll</TT> alongside
	the registry, so a wait does not need to rebuild it. Modification
	only rewrites the entry's event mask and is atomic.
*/

constexpr std::size_t ioready_selector_poll::no_index;

ioready_events
ioready_selector_poll::translate_os_to_iomux(int ev) noexcept
{
	ioready_events e = ioready_none;
	if (ev & POLLIN) {
		e |= ioready_input;
	}
	if (ev & POLLOUT) {
		e |= ioready_output;
	}
	/* deliver error, hangup and invalid descriptor to input and
	output handlers, so either operation observes the condition */
	if (ev & (POLLERR | POLLHUP | POLLNVAL)) {
		e |= ioready_input | ioready_output;
	}
	return e;
}

int
ioready_selector_poll::translate_iomux_to_os(ioready_events ev) noexcept
{
	int e = 0;
	if (ev & ioready_input) {
		e |= POLLIN;
	}
	if (ev & ioready_output) {
		e |= POLLOUT;
	}
	return e;
}

ioready_selector_poll::~ioready_selector_poll() noexcept
{
	close();
}

ioready_selector_poll::ioready_selector_poll()
{
}

const char *
ioready_selector_poll::name() const noexcept
{
	return "poll";
}

selector_key
ioready_selector_poll::modify(const io_handle & handle, ioready_events events, void * data)
{
	return modify_atomic(handle, events, data);
}

void
ioready_selector_poll::add_interest(int fd, ioready_events events)
{
	/* poll itself accepts any value; refuse descriptors that are not
	open before sizing the index for them */
	if (::fcntl(fd, F_GETFD) < 0) {
		throw backend_error(errno, "fcntl(F_GETFD)");
	}

	std::size_t index = fd;
	if (index >= polltab_index_.size()) {
		polltab_index_.resize(index + 1, no_index);
	}

	struct pollfd pfd;
	pfd.fd = fd;
	pfd.events = translate_iomux_to_os(events);
	pfd.revents = 0;
	polltab_.push_back(pfd);
	polltab_index_[index] = polltab_.size() - 1;
}

void
ioready_selector_poll::remove_interest(int fd, ioready_events)
{
	std::size_t index = polltab_index_[fd];
	std::size_t other_index = polltab_.size() - 1;
	if (other_index != index) {
		int other_fd = polltab_[other_index].fd;

		polltab_[index] = polltab_[other_index];
		polltab_index_[other_fd] = index;
	}
	polltab_.pop_back();
	polltab_index_[fd] = no_index;
}

void
ioready_selector_poll::update_interest(int fd, ioready_events, ioready_events new_events)
{
	polltab_[polltab_index_[fd]].events = translate_iomux_to_os(new_events);
}

void
ioready_selector_poll::release() noexcept
{
	polltab_.clear();
	polltab_index_.clear();
}

bool
ioready_selector_poll::wait_ready(
	const std::chrono::steady_clock::duration * timeout,
	std::vector<ready_descriptor> & ready)
{
	/* need to round up timeout */
	int poll_timeout;
	if (timeout) {
		poll_timeout = detail::round_up_timeout<std::chrono::milliseconds>(
			*timeout, std::numeric_limits<int>::max());
	} else {
		poll_timeout = -1;
	}

	int count = ::poll(polltab_.data(), polltab_.size(), poll_timeout);
	if (count < 0) {
		int error = errno;
		if (error == EINTR) {
			return false;
		}
		throw backend_error(error, "poll");
	}

	for (std::size_t n = 0; n < polltab_.size() && count > 0; ++n) {
		if (polltab_[n].revents) {
			ready.push_back(ready_descriptor{polltab_[n].fd, translate_os_to_iomux(polltab_[n].revents)});
			--count;
		}
	}

	return true;
}

/** \cond false */

std::unique_ptr<ioready_selector>
create_ioready_selector_poll()
{
	return std::unique_ptr<ioready_selector>(new ioready_selector_poll());
}

/** \endcond */

}
