/* -*- C++ -*-
 * (c) 2006 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1.
 * Refer to the file "COPYING" for details.
 */

#include <errno.h>
#include <unistd.h>
#include <fcntl.h>

#include <iomux/config.h>
#include <iomux/selector-error.h>
#include <iomux/wakeup-pipe.h>

namespace iomux {

/**
	\class wakeup_pipe
	\brief Flag that makes a descriptor readable
	\headerfile iomux/wakeup-pipe.h <iomux/wakeup-pipe.h>

	Selectors have no built-in way to interrupt a blocking \ref
	ioready_selector::select "select". This class provides the usual
	remedy: a control pipe whose read end is registered for \ref
	ioready_input; \ref set makes it readable (and thus terminates an
	ongoing or the next wait), \ref clear drains it again.

	\code
		iomux::wakeup_pipe wakeup;
		selector->register_handle(wakeup, iomux::ioready_input);

		// other thread or signal handler:
		wakeup.set();
	\endcode

	\ref set is thread-safe and async-signal safe. Only a single byte is
	ever written to the pipe until the flag is cleared.
*/

/**
	\brief Create wakeup_pipe

	Create a new wakeup_pipe initialized to "cleared" state. Both ends
	are non-blocking and close-on-exec. Throws \ref backend_error if
	file descriptors are exhausted.
*/
wakeup_pipe::wakeup_pipe()
	: flagged_(false)
{
	int filedes[2];
	int error = -1;

#ifdef HAVE_PIPE2
	error = ::pipe2(filedes, O_CLOEXEC | O_NONBLOCK);
#endif
	if (error) {
		error = ::pipe(filedes);
		if (error == 0) {
			for (int fd : filedes) {
				::fcntl(fd, F_SETFD, FD_CLOEXEC);
				::fcntl(fd, F_SETFL, O_NONBLOCK);
			}
		}
	}

	if (error) {
		throw backend_error(errno, "unable to create control pipe");
	}

	readfd_ = filedes[0];
	writefd_ = filedes[1];
}

wakeup_pipe::~wakeup_pipe() noexcept
{
	::close(readfd_);
	::close(writefd_);
}

/**
	\brief Set the flag

	Makes \ref readfd readable. Setting an already set flag has no
	further effect.
*/
void
wakeup_pipe::set() noexcept
{
	/* only the 0->1 transition posts a token */
	if (flagged_.exchange(true, std::memory_order_release)) {
		return;
	}

	char c = 0;
	while (::write(writefd_, &c, 1) < 0 && errno == EINTR) {
	}
}

/**
	\brief Clear the flag

	Drains the control pipe, \ref readfd is no longer readable
	afterwards. To be called by the thread that waits for the flag.
*/
void
wakeup_pipe::clear() noexcept
{
	if (!flagged_.exchange(false, std::memory_order_acquire)) {
		return;
	}

	char buffer[16];
	for (;;) {
		ssize_t count = ::read(readfd_, buffer, sizeof(buffer));
		if (count < 0 && errno == EINTR) {
			continue;
		}
		if (count <= 0) {
			break;
		}
	}
}

}
