/* -*- C++ -*-
 * (c) 2009 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1
 * Refer to the file "COPYING" for details.
 */

#include <poll.h>
#include <fcntl.h>

#include <iomux/wakeup-pipe.h>

#include <gtest/gtest.h>

namespace iomux {

namespace {

bool
readable(int fd)
{
	struct pollfd pfd;
	pfd.fd = fd;
	pfd.events = POLLIN;
	pfd.revents = 0;
	return ::poll(&pfd, 1, 0) == 1 && (pfd.revents & POLLIN);
}

}

TEST(WakeupPipeTests, set_clear)
{
	wakeup_pipe w;

	EXPECT_FALSE(w.flagged());
	EXPECT_FALSE(readable(w.readfd()));

	w.set();
	EXPECT_TRUE(w.flagged());
	EXPECT_TRUE(readable(w.readfd()));

	/* repeated set does not queue more tokens */
	w.set();
	w.set();
	w.clear();
	EXPECT_FALSE(w.flagged());
	EXPECT_FALSE(readable(w.readfd()));

	/* clearing a cleared flag is harmless */
	w.clear();
	EXPECT_FALSE(readable(w.readfd()));
}

TEST(WakeupPipeTests, descriptor_flags)
{
	wakeup_pipe w;

	EXPECT_EQ(w.readfd(), w.fileno());
	EXPECT_NE(0, ::fcntl(w.readfd(), F_GETFD) & FD_CLOEXEC);
	EXPECT_NE(0, ::fcntl(w.readfd(), F_GETFL) & O_NONBLOCK);
}

}
