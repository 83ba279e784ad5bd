/* -*- C++ -*-
 * (c) 2006 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1
 * Refer to the file "COPYING" for details.
 */

#include <iomux/ioready-epoll.h>

#include <errno.h>
#include <unistd.h>
#include <fcntl.h>
#include <sys/epoll.h>

#include <algorithm>
#include <cstdint>
#include <limits>

#include <iomux/config.h>
#include <iomux/detail/timeout.h>

namespace iomux {

/**
	\class ioready_selector_epoll
	\headerfile iomux/ioready-epoll.h <iomux/ioready-epoll.h>
	\brief Selector using the \p epoll_* family of system calls

	This class collects the IO readiness state of the registered
	descriptors using the \p epoll_* family of system calls.

	The \p epoll_* family of system calls provide the fastest possible
	way to observe the state of a set of file descriptors on Linux
	systems. Like \ref iomux::ioready_selector_kqueue
	"ioready_selector_kqueue" interest updates are O(1), and a wait
	only touches the descriptors that are ready.

	Descriptors are registered level-triggered. A single wait returns at
	most \p max_events descriptors (as given to the constructor);
	further ready descriptors are reported by subsequent calls.

	The epoll descriptor itself is exposed through \ref fileno; it
	becomes readable when any registered descriptor is ready, so the
	selector can be nested inside another selector.
*/

namespace {

ioready_events
translate_os_to_iomux(uint32_t ev) noexcept
{
	ioready_events e = ioready_none;
	if ((ev & EPOLLIN) != 0) {
		e |= ioready_input;
	}
	if ((ev & EPOLLOUT) != 0) {
		e |= ioready_output;
	}
	/* deliver hangup and error to input and output handlers as well */
	if ((ev & (EPOLLHUP | EPOLLERR)) != 0) {
		e |= ioready_input | ioready_output;
	}
	return e;
}

uint32_t
translate_iomux_to_os(ioready_events ev) noexcept
{
	uint32_t e = 0;
	if ((ev & ioready_input) != 0) {
		e |= EPOLLIN;
	}
	if ((ev & ioready_output) != 0) {
		e |= EPOLLOUT;
	}
	return e;
}

}

ioready_selector_epoll::~ioready_selector_epoll() noexcept
{
	close();
}

ioready_selector_epoll::ioready_selector_epoll(std::size_t max_events)
	: max_events_(std::max<std::size_t>(max_events, 1))
{
#if defined(HAVE_EPOLL1) && defined(EPOLL_CLOEXEC)
	epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
#else
	epoll_fd_ = ::epoll_create(1024);
	if (epoll_fd_ >= 0) {
		::fcntl(epoll_fd_, F_SETFD, FD_CLOEXEC);
	}
#endif
	if (epoll_fd_ < 0) {
		throw backend_error(errno, "epoll_create");
	}
}

const char *
ioready_selector_epoll::name() const noexcept
{
	return "epoll";
}

/**
	\brief Descriptor of the epoll instance

	Throws \ref closed_error once the selector has been closed.
*/
int
ioready_selector_epoll::fileno() const
{
	if (is_closed()) {
		throw closed_error();
	}
	return epoll_fd_;
}

selector_key
ioready_selector_epoll::modify(const io_handle & handle, ioready_events events, void * data)
{
	return modify_atomic(handle, events, data);
}

void
ioready_selector_epoll::control(int op, int fd, ioready_events events, const char * operation)
{
	epoll_event event;
	event.events = translate_iomux_to_os(events);
	event.data.u64 = 0;
	event.data.fd = fd;

	if (::epoll_ctl(epoll_fd_, op, fd, &event) < 0) {
		throw backend_error(errno, operation);
	}
}

void
ioready_selector_epoll::add_interest(int fd, ioready_events events)
{
	control(EPOLL_CTL_ADD, fd, events, "epoll_ctl(EPOLL_CTL_ADD)");
}

void
ioready_selector_epoll::remove_interest(int fd, ioready_events events)
{
	/* event argument is ignored, but must be non-null on kernels
	before 2.6.9 */
	control(EPOLL_CTL_DEL, fd, events, "epoll_ctl(EPOLL_CTL_DEL)");
}

void
ioready_selector_epoll::update_interest(int fd, ioready_events, ioready_events new_events)
{
	control(EPOLL_CTL_MOD, fd, new_events, "epoll_ctl(EPOLL_CTL_MOD)");
}

void
ioready_selector_epoll::release() noexcept
{
	::close(epoll_fd_);
	epoll_fd_ = -1;
	events_.clear();
}

bool
ioready_selector_epoll::wait_ready(
	const std::chrono::steady_clock::duration * timeout,
	std::vector<ready_descriptor> & ready)
{
	int poll_timeout;
	/* need to round up timeout */
	if (timeout) {
		poll_timeout = detail::round_up_timeout<std::chrono::milliseconds>(
			*timeout, std::numeric_limits<int>::max());
	} else {
		poll_timeout = -1;
	}

	std::size_t limit = std::min(std::max<std::size_t>(table().size(), 1), max_events_);
	events_.resize(limit);

	int nevents = ::epoll_wait(epoll_fd_, events_.data(), limit, poll_timeout);
	if (nevents < 0) {
		int error = errno;
		if (error == EINTR) {
			return false;
		}
		throw backend_error(error, "epoll_wait");
	}

	for (int n = 0; n < nevents; ++n) {
		ready.push_back(ready_descriptor{events_[n].data.fd, translate_os_to_iomux(events_[n].events)});
	}

	return true;
}

/** \cond false */

std::unique_ptr<ioready_selector>
create_ioready_selector_epoll()
{
	return std::unique_ptr<ioready_selector>(new ioready_selector_epoll());
}

/** \endcond */

}
