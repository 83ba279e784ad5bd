/* -*- C++ -*-
 * (c) 2006 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1
 * Refer to the file "COPYING" for details.
 */

#include <iomux/ioready-kqueue.h>

#include <errno.h>
#include <unistd.h>
#include <fcntl.h>

#include <algorithm>
#include <cstdint>
#include <new>

#include <iomux/detail/timeout.h>
#include <iomux/log.h>

namespace iomux {

/**
	\class ioready_selector_kqueue
	\headerfile iomux/ioready-kqueue.h <iomux/ioready-kqueue.h>
	\brief Selector using the \p kqueue system call mechanism.

	This class collects the IO readiness state of the registered
	descriptors using the \p kevent system call.

	The \p kevent system call provides the fastest possible way to
	observe the state of a set of file descriptors on BSD-derived
	systems. Like \ref iomux::ioready_selector_epoll
	"ioready_selector_epoll" interest updates are O(1), and a wait only
	touches the descriptors that are ready.

	\p kqueue tracks readability and writability as two independent
	filters (\p EVFILT_READ, \p EVFILT_WRITE). The selector keeps track
	of which of the two filters are installed for every descriptor and
	only submits the additions and deletions needed to match the
	requested mask exactly. If a change fails halfway, the filters
	already changed are restored, so \ref modify leaves the previous
	registration intact on failure. Events reported for both filters
	of a descriptor are merged into a single mask.

	The kqueue descriptor itself is exposed through \ref fileno.
*/

namespace {

/* some kevent implementations reject longer timeouts with EINVAL */
constexpr uint64_t max_kevent_seconds = 100000000;

int
submit_change(int kqueue_fd, int fd, short filter, unsigned short flags) noexcept
{
	struct kevent change;
	EV_SET(&change, fd, filter, flags, 0, 0, 0);

	struct timespec timeout;
	timeout.tv_sec = 0;
	timeout.tv_nsec = 0;
	if (::kevent(kqueue_fd, &change, 1, /* eventlist */ nullptr, /* eventcount */ 0, &timeout) < 0) {
		return errno;
	}
	return 0;
}

}

ioready_selector_kqueue::~ioready_selector_kqueue() noexcept
{
	close();
}

ioready_selector_kqueue::ioready_selector_kqueue(std::size_t max_events)
	: max_events_(std::max<std::size_t>(max_events, 1)), active_filters_(0)
{
	kqueue_fd_ = ::kqueue();
	if (kqueue_fd_ < 0) {
		throw backend_error(errno, "kqueue");
	}
	::fcntl(kqueue_fd_, F_SETFD, FD_CLOEXEC);
}

const char *
ioready_selector_kqueue::name() const noexcept
{
	return "kqueue";
}

/**
	\brief Descriptor of the kqueue instance

	Throws \ref closed_error once the selector has been closed.
*/
int
ioready_selector_kqueue::fileno() const
{
	if (is_closed()) {
		throw closed_error();
	}
	return kqueue_fd_;
}

selector_key
ioready_selector_kqueue::modify(const io_handle & handle, ioready_events events, void * data)
{
	return modify_atomic(handle, events, data);
}

ioready_selector_kqueue::filter_slots
ioready_selector_kqueue::current(int fd) const noexcept
{
	std::size_t index = fd;
	return index < filters_.size() ? filters_[index] : filter_slots();
}

void
ioready_selector_kqueue::set_filter(int fd, short filter, bool enable)
{
	int error = submit_change(kqueue_fd_, fd, filter, enable ? EV_ADD : EV_DELETE);
	if (error) {
		throw backend_error(error, enable ? "kevent(EV_ADD)" : "kevent(EV_DELETE)");
	}

	/* the kernel accepted the descriptor, so it is small enough to
	index by */
	std::size_t index = fd;
	if (index >= filters_.size()) {
		try {
			filters_.resize(index + 1);
		}
		catch (const std::bad_alloc &) {
			submit_change(kqueue_fd_, fd, filter, EV_DELETE);
			throw;
		}
	}

	filter_slots & s = filters_[index];
	bool & slot = (filter == EVFILT_READ) ? s.read : s.write;
	slot = enable;
	if (enable) {
		++active_filters_;
	} else {
		--active_filters_;
	}
}

void
ioready_selector_kqueue::apply_mask(int fd, ioready_events events)
{
	filter_slots previous = current(fd);
	bool want_read = (events & ioready_input) != ioready_none;
	bool want_write = (events & ioready_output) != ioready_none;

	try {
		if (previous.read != want_read) {
			set_filter(fd, EVFILT_READ, want_read);
		}
		if (previous.write != want_write) {
			set_filter(fd, EVFILT_WRITE, want_write);
		}
	}
	catch (const backend_error &) {
		try {
			if (current(fd).read != previous.read) {
				set_filter(fd, EVFILT_READ, previous.read);
			}
		}
		catch (const backend_error & e) {
			log::warn("kqueue: unable to restore read filter of descriptor {}: {}", fd, e.what());
		}
		throw;
	}
}

void
ioready_selector_kqueue::add_interest(int fd, ioready_events events)
{
	apply_mask(fd, events);
}

void
ioready_selector_kqueue::remove_interest(int fd, ioready_events)
{
	std::size_t index = fd;
	if (index >= filters_.size()) {
		return;
	}

	filter_slots & s = filters_[index];
	int error = 0;
	if (s.read) {
		error = submit_change(kqueue_fd_, fd, EVFILT_READ, EV_DELETE);
		s.read = false;
		--active_filters_;
	}
	if (s.write) {
		int write_error = submit_change(kqueue_fd_, fd, EVFILT_WRITE, EV_DELETE);
		if (!error) {
			error = write_error;
		}
		s.write = false;
		--active_filters_;
	}
	/* the kernel drops all filters of a descriptor when it is closed,
	so the slots are cleared even if deletion failed */
	if (error) {
		throw backend_error(error, "kevent(EV_DELETE)");
	}
}

void
ioready_selector_kqueue::update_interest(int fd, ioready_events, ioready_events new_events)
{
	apply_mask(fd, new_events);
}

void
ioready_selector_kqueue::release() noexcept
{
	::close(kqueue_fd_);
	kqueue_fd_ = -1;
	filters_.clear();
	events_.clear();
	active_filters_ = 0;
}

bool
ioready_selector_kqueue::wait_ready(
	const std::chrono::steady_clock::duration * timeout,
	std::vector<ready_descriptor> & ready)
{
	struct timespec ts;
	struct timespec * kevent_timeout = nullptr;
	if (timeout) {
		uint64_t nsecs = detail::round_up_timeout<std::chrono::nanoseconds>(*timeout);
		ts.tv_sec = std::min<uint64_t>(nsecs / 1000000000, max_kevent_seconds);
		ts.tv_nsec = nsecs % 1000000000;
		kevent_timeout = &ts;
	}

	std::size_t limit = std::min(std::max<std::size_t>(active_filters_, 1), max_events_);
	events_.resize(limit);

	int nevents = ::kevent(
		kqueue_fd_,
		/* modlist */ nullptr, /* modcount */ 0,
		events_.data(), limit,
		kevent_timeout);
	if (nevents < 0) {
		int error = errno;
		if (error == EINTR) {
			return false;
		}
		throw backend_error(error, "kevent");
	}

	for (int n = 0; n < nevents; ++n) {
		int fd = events_[n].ident;
		ioready_events ev;
		if (events_[n].filter == EVFILT_READ) {
			ev = ioready_input;
		} else if (events_[n].filter == EVFILT_WRITE) {
			ev = ioready_output;
		} else {
			continue;
		}

		auto i = std::find_if(ready.begin(), ready.end(),
			[fd](const ready_descriptor & r) { return r.fd == fd; });
		if (i != ready.end()) {
			i->events |= ev;
		} else {
			ready.push_back(ready_descriptor{fd, ev});
		}
	}

	return true;
}

/** \cond false */

std::unique_ptr<ioready_selector>
create_ioready_selector_kqueue()
{
	return std::unique_ptr<ioready_selector>(new ioready_selector_kqueue());
}

/** \endcond */

}
