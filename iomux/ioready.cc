/* -*- C++ -*-
 * (c) 2006 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1
 * Refer to the file "COPYING" for details.
 */

#include <iomux/config.h>
#include <iomux/ioready.h>

#include <errno.h>

#include <algorithm>
#include <atomic>
#include <new>

#include <iomux/log.h>

/** \file ioready.cc */

/**
	\page ioready_descr I/O readiness

	The class \ref iomux::ioready_selector "ioready_selector" defines
	the interface through which callers monitor file descriptors for
	I/O readiness. Several concrete implementations of this interface
	exist and may be used on different platforms.

	\section ioready_registration Registration

	Callers register a handle together with an event mask and an
	optional opaque data pointer:

	\code
		std::unique_ptr<iomux::ioready_selector> sel = iomux::ioready_selector::create();

		iomux::selector_key key = sel->register_handle(fd, iomux::ioready_input, &connection);
	\endcode

	A handle is either a raw descriptor or a reference to any object
	exposing <TT>int fileno() const</TT>; the descriptor is resolved
	once at registration. The selector only references the handle, it
	never owns the descriptor: callers must \ref
	iomux::ioready_selector::unregister "unregister" a descriptor
	before closing it.

	\section ioready_waiting Waiting for events

	\code
		std::chrono::steady_clock::duration timeout = std::chrono::milliseconds(100);

		for (const iomux::selector_event & ev : sel->select(&timeout)) {
			if (ev.events & iomux::ioready_input) {
				// read from ev.key.fd()
			}
		}
	\endcode

	Passing \p nullptr waits indefinitely, a zero or negative timeout
	polls without blocking. Notification is level-triggered on every
	backend: a descriptor that stays ready is reported by every call
	until the caller resolves the condition. Reported events are always
	a subset of the registered interest; error and hangup conditions are
	reported as readiness for both input and output so that the
	subsequent read or write observes the condition.

	There is no built-in way to interrupt a blocking wait. Callers that
	need one register the read end of a \ref iomux::wakeup_pipe
	"wakeup_pipe" for input and set it from another thread.

	\section ioready_backends Backends

	- \ref iomux::ioready_selector_epoll "ioready_selector_epoll"
	  (Linux)
	- \ref iomux::ioready_selector_kqueue "ioready_selector_kqueue"
	  (BSD and derived systems)
	- \ref iomux::ioready_selector_poll "ioready_selector_poll"
	- \ref iomux::ioready_selector_select "ioready_selector_select"

	The kernel-resident variants (epoll, kqueue) update interest in
	O(1) and wait in O(ready), and expose their own descriptor through
	\p fileno() so that they can be registered inside another selector.
	The poll and select variants are O(n) per wait.
*/

namespace iomux {

/**
	\class ioready_events
	\brief I/O readiness event mask

	Bitmask encoding possible events on a file descriptor. When
	registering, the caller builds a mask consisting of the bitwise |
	(or) of the events it is interested in. When receiving
	notification, set bits describe the events that occurred.

	\var ioready_none
	\brief Empty event mask

	\var ioready_input
	\brief Descriptor ready for reading

	\var ioready_output
	\brief Descriptor ready for writing
*/

/**
	\class selector_key
	\brief Registration record

	Immutable value describing one registration: the handle as passed
	by the caller (a back-reference only), the descriptor resolved from
	it, the interest mask and the caller's opaque data pointer.
	Modification produces a new key.
*/

const char *
selector_backend_name(selector_backend backend) noexcept
{
	switch (backend) {
		case selector_backend::epoll: return "epoll";
		case selector_backend::kqueue: return "kqueue";
		case selector_backend::poll: return "poll";
		case selector_backend::select: return "select";
	}
	return "unknown";
}

/**
	\class ioready_selector
	\brief I/O readiness selector
	\headerfile iomux/ioready.h <iomux/ioready.h>

	Registry of monitored descriptors plus the operation waiting for
	them. The registry logic (validation, uniqueness, open/closed state)
	is shared by all implementations; concrete backends supply the hooks
	that mirror the registry into an operating system facility.

	A selector is either open or closed. Every operation except \ref
	close throws \ref closed_error once the selector has been closed.
	Concrete selectors close themselves on destruction.

	A selector is not safe for concurrent use from multiple threads
	without external synchronization.


	\fn ioready_selector::register_handle
	\brief Start monitoring a descriptor
	\param handle Descriptor or object exposing \p fileno()
	\param events Interest mask, non-empty combination of
		\ref ioready_input and \ref ioready_output
	\param data Opaque pointer stored in the key
	\returns The new key

	Throws \ref validation_error for an invalid mask or a handle not
	resolving to a descriptor, \ref duplicate_registration_error if the
	descriptor is registered already, \ref backend_error if the backend
	refuses the descriptor. On any failure the registry is unchanged.


	\fn ioready_selector::modify
	\brief Change interest mask and data of a registration

	The default implementation unregisters and registers again, which is
	not atomic: if the second step fails the handle is left unregistered
	and \ref modify_unregistered_error is thrown. Backends owning an
	atomic update primitive override this so that a failure leaves the
	previous key registered. If only \p data changes the key is
	replaced without involving the backend.


	\fn ioready_selector::select
	\brief Wait for readiness
	\param timeout Maximum time to wait, or nullptr to wait indefinitely
	\returns Ready keys with the events that occurred

	Interruption by a signal is retried internally with the remaining
	timeout.


	\fn ioready_selector::create()
	\brief Instantiate the best available selector

	Probes, in order of preference, epoll, kqueue, poll and select and
	returns the first one that can be constructed. The outcome of the
	probe is remembered for subsequent calls.
*/

ioready_selector::ioready_selector()
	: closed_(false)
{
}

ioready_selector::~ioready_selector() noexcept
{
}

selector_key
ioready_selector::register_handle(const io_handle & handle, ioready_events events, void * data)
{
	check_open();
	validate(events);

	int fd = handle.fileno();
	if (fd < 0) {
		throw validation_error("invalid file descriptor " + std::to_string(fd));
	}
	if (table_.find(fd)) {
		throw duplicate_registration_error(fd);
	}

	/* backend first: it rejects descriptors the table must never be
	sized for */
	selector_key key(handle, fd, events, data);
	add_interest(fd, events);
	try {
		table_.insert(key);
	}
	catch (const std::bad_alloc &) {
		discard_interest(key);
		throw;
	}

	return key;
}

selector_key
ioready_selector::unregister(const io_handle & handle)
{
	check_open();

	selector_key key = table_.remove(lookup(handle).fd());
	discard_interest(key);

	return key;
}

/**
	\brief Remove backend interest, logging failures

	A descriptor closed before being unregistered is not an error
	worth reporting to the caller: the kernel has dropped its state
	already.
*/
void
ioready_selector::discard_interest(const selector_key & key) noexcept
{
	try {
		remove_interest(key.fd(), key.events());
	}
	catch (const backend_error & e) {
		if (e.code() == std::errc::bad_file_descriptor || e.code() == std::errc::no_such_file_or_directory) {
			log::debug("{}: descriptor {} was closed before unregistering", name(), key.fd());
		} else {
			log::warn("{}: failed to remove descriptor {}: {}", name(), key.fd(), e.what());
		}
	}
}

selector_key
ioready_selector::modify(const io_handle & handle, ioready_events events, void * data)
{
	check_open();
	validate(events);

	const selector_key & current = lookup(handle);
	if (events == current.events()) {
		selector_key key(current.handle(), current.fd(), events, data);
		if (data != current.data()) {
			table_.replace(key);
		}
		return key;
	}

	selector_key old_key = unregister(handle);
	try {
		return register_handle(handle, events, data);
	}
	catch (const selector_error & e) {
		throw modify_unregistered_error(old_key, e.what());
	}
}

/**
	\brief Modify registration through \ref update_interest

	For use by backends overriding \ref modify: the registry entry is
	only replaced after the backend accepted the change, so a failing
	update leaves the previous key in place.
*/
selector_key
ioready_selector::modify_atomic(const io_handle & handle, ioready_events events, void * data)
{
	check_open();
	validate(events);

	const selector_key & current = lookup(handle);
	selector_key key(current.handle(), current.fd(), events, data);
	if (events != current.events()) {
		update_interest(current.fd(), current.events(), events);
	}
	table_.replace(key);

	return key;
}

/**
	\brief Change interest for a registered descriptor

	Default implementation for backends without an update primitive:
	remove the old interest, then add the new one.
*/
void
ioready_selector::update_interest(int fd, ioready_events old_events, ioready_events new_events)
{
	remove_interest(fd, old_events);
	add_interest(fd, new_events);
}

std::vector<selector_event>
ioready_selector::select(const std::chrono::steady_clock::duration * timeout)
{
	check_open();

	std::chrono::steady_clock::duration remaining;
	std::chrono::steady_clock::time_point deadline;
	const std::chrono::steady_clock::duration * wait_timeout = nullptr;
	if (timeout) {
		std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
		remaining = std::max(*timeout, std::chrono::steady_clock::duration::zero());
		/* saturate, so that duration::max() means "wait forever" */
		remaining = std::min(remaining, std::chrono::steady_clock::time_point::max() - now);
		deadline = now + remaining;
		wait_timeout = &remaining;
	}

	ready_.clear();
	while (!wait_ready(wait_timeout, ready_)) {
		log::debug("{}: wait interrupted by signal, retrying", name());
		ready_.clear();
		if (timeout) {
			remaining = std::max(
				deadline - std::chrono::steady_clock::now(),
				std::chrono::steady_clock::duration::zero());
		}
	}

	std::vector<selector_event> result;
	result.reserve(ready_.size());
	for (const ready_descriptor & r : ready_) {
		const selector_key * key = table_.find(r.fd);
		if (!key) {
			continue;
		}
		ioready_events events = r.events & key->events();
		if (events) {
			result.push_back(selector_event{*key, events});
		}
	}

	return result;
}

/**
	\brief Close selector

	Releases the backend's kernel resource and forgets all
	registrations. Registered descriptors are not closed. Closing an
	already closed selector has no effect.
*/
void
ioready_selector::close() noexcept
{
	if (closed_) {
		return;
	}
	closed_ = true;
	release();
	table_.clear();
}

selector_key
ioready_selector::get_key(const io_handle & handle) const
{
	check_open();
	return lookup(handle);
}

/**
	\brief Snapshot of all registrations, ordered by descriptor
*/
std::vector<selector_key>
ioready_selector::keys() const
{
	check_open();
	return table_.snapshot();
}

std::size_t
ioready_selector::size() const noexcept
{
	return table_.size();
}

void
ioready_selector::check_open() const
{
	if (closed_) {
		throw closed_error();
	}
}

const selector_key &
ioready_selector::lookup(const io_handle & handle) const
{
	int fd = handle.fileno();
	const selector_key * key;
	if (fd >= 0) {
		key = table_.find(fd);
	} else {
		/* handle does not expose a descriptor anymore; it may still
		be registered under the descriptor it had before */
		key = table_.find_handle(handle);
	}
	if (!key) {
		throw not_found_error("descriptor " + std::to_string(fd) + " is not registered");
	}
	return *key;
}

void
ioready_selector::validate(ioready_events events)
{
	if (!events) {
		throw validation_error("empty event mask");
	}
	if ((events & ~(ioready_input | ioready_output)) != ioready_none) {
		throw validation_error("invalid event mask " + std::to_string(events.bits()));
	}
}

static std::unique_ptr<ioready_selector>
create_ioready_selector_probe();

#ifdef HAVE_EPOLL
std::unique_ptr<ioready_selector>
create_ioready_selector_epoll();
#endif
#ifdef HAVE_KQUEUE
std::unique_ptr<ioready_selector>
create_ioready_selector_kqueue();
#endif
#ifdef HAVE_POLL
std::unique_ptr<ioready_selector>
create_ioready_selector_poll();
#endif
#ifdef HAVE_SELECT
std::unique_ptr<ioready_selector>
create_ioready_selector_select();
#endif

namespace {

typedef std::unique_ptr<ioready_selector> (*ioready_selector_creator_func_t)();

struct probe_entry {
	selector_backend backend;
	ioready_selector_creator_func_t fn;
};

std::atomic<ioready_selector_creator_func_t> ioready_selector_creator_func
	{&create_ioready_selector_probe};

const probe_entry probe_functions[] = {
#ifdef HAVE_EPOLL
	{selector_backend::epoll, &create_ioready_selector_epoll},
#endif
#ifdef HAVE_KQUEUE
	{selector_backend::kqueue, &create_ioready_selector_kqueue},
#endif
#ifdef HAVE_POLL
	{selector_backend::poll, &create_ioready_selector_poll},
#endif
#ifdef HAVE_SELECT
	{selector_backend::select, &create_ioready_selector_select},
#endif
	{selector_backend::select, nullptr}
};

}

static std::unique_ptr<ioready_selector>
create_ioready_selector_probe()
{
	for (const auto & entry : probe_functions) {
		if (!entry.fn) {
			break;
		}
		try {
			std::unique_ptr<ioready_selector> selector = entry.fn();
			ioready_selector_creator_func.store(entry.fn, std::memory_order_relaxed);
			log::debug("using {} selector", selector->name());
			return selector;
		}
		catch (const backend_error & e) {
			log::warn("{} selector unavailable: {}", selector_backend_name(entry.backend), e.what());
			continue;
		}
	}
	throw backend_error(ENOSYS, "no selector implementation available");
}

std::unique_ptr<ioready_selector>
ioready_selector::create()
{
	auto fn = ioready_selector_creator_func.load(std::memory_order_relaxed);
	return fn();
}

/**
	\brief Instantiate a specific selector

	Throws \ref backend_error with \p ENOSYS if the requested backend
	is not supported on this platform, or the backend's own error if
	it cannot be constructed.
*/
std::unique_ptr<ioready_selector>
ioready_selector::create(selector_backend backend)
{
	for (const auto & entry : probe_functions) {
		if (entry.fn && entry.backend == backend) {
			return entry.fn();
		}
	}
	throw backend_error(ENOSYS, std::string(selector_backend_name(backend)) + " selector");
}

/**
	\brief Backends compiled in, in order of preference
*/
std::vector<selector_backend>
ioready_selector::available_backends()
{
	std::vector<selector_backend> backends;
	for (const auto & entry : probe_functions) {
		if (entry.fn) {
			backends.push_back(entry.backend);
		}
	}
	return backends;
}

}
