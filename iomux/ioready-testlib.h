/* -*- C++ -*-
 * (c) 2006 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1
 * Refer to the file "COPYING" for details.
 */

#ifndef IOMUX_IOREADY_TESTLIB
#define IOMUX_IOREADY_TESTLIB

#include <fcntl.h>
#include <unistd.h>
#include <sys/socket.h>

#include <algorithm>
#include <chrono>
#include <limits>
#include <thread>

#include <iomux/ioready.h>
#include <iomux/wakeup-pipe.h>

#include <gtest/gtest.h>

namespace iomux {

class IoreadyTests : public ::testing::Test {
protected:
	/* connected, non-blocking stream socket pair */
	class socket_pair {
	public:
		socket_pair()
		{
			EXPECT_EQ(0, ::socketpair(AF_UNIX, SOCK_STREAM, 0, fd));
			::fcntl(fd[0], F_SETFL, O_NONBLOCK);
			::fcntl(fd[1], F_SETFL, O_NONBLOCK);
		}

		~socket_pair()
		{
			close_end(0);
			close_end(1);
		}

		void
		close_end(int n)
		{
			if (fd[n] >= 0) {
				::close(fd[n]);
				fd[n] = -1;
			}
		}

		int fd[2];
	};

	/* object handle: exposes its descriptor through fileno() */
	class descriptor_object {
	public:
		explicit descriptor_object(int fd) : fd_(fd) {}

		int
		fileno() const
		{
			return fd_;
		}

		void
		detach()
		{
			fd_ = -1;
		}

	private:
		int fd_;
	};

	static ioready_events
	events_for(const std::vector<selector_event> & events, int fd)
	{
		ioready_events result = ioready_none;
		for (const selector_event & ev : events) {
			if (ev.key.fd() == fd) {
				result |= ev.events;
			}
		}
		return result;
	}

	static std::vector<selector_event>
	poll_now(ioready_selector * s)
	{
		std::chrono::steady_clock::duration t = std::chrono::milliseconds(0);
		return s->select(&t);
	}

	void
	run_register(ioready_selector * s);

	void
	run_duplicate(ioready_selector * s);

	void
	run_unregister(ioready_selector * s);

	void
	run_modify(ioready_selector * s);

	void
	run_timeouts(ioready_selector * s);

	void
	run_invalid_descriptor(ioready_selector * s);

	void
	run_readiness(ioready_selector * s);

	void
	run_level_triggered(ioready_selector * s);

	void
	run_stale_handle(ioready_selector * s);

	void
	run_threads(ioready_selector * s);

	void
	run_close(ioready_selector * s);
};

inline void
IoreadyTests::run_register(ioready_selector * s)
{
	socket_pair p;
	int cookie = 0;

	selector_key key = s->register_handle(p.fd[0], ioready_input, &cookie);
	EXPECT_EQ(p.fd[0], key.fd());
	EXPECT_TRUE(key.handle() == io_handle(p.fd[0]));
	EXPECT_TRUE(key.events() == ioready_input);
	EXPECT_EQ(&cookie, key.data());
	EXPECT_TRUE(s->get_key(p.fd[0]) == key);
	EXPECT_EQ(1u, s->size());

	descriptor_object obj(p.fd[1]);
	selector_key okey = s->register_handle(obj, ioready_input | ioready_output);
	EXPECT_EQ(p.fd[1], okey.fd());
	EXPECT_TRUE(okey.handle().is_object());
	EXPECT_EQ(&obj, okey.handle().object());
	EXPECT_EQ(nullptr, okey.data());
	EXPECT_TRUE(s->get_key(obj) == okey);
	/* lookup goes through the descriptor, not the handle identity */
	EXPECT_TRUE(s->get_key(p.fd[1]) == okey);

	std::vector<selector_key> keys = s->keys();
	ASSERT_EQ(2u, keys.size());
	EXPECT_EQ(std::min(p.fd[0], p.fd[1]), keys[0].fd());
	EXPECT_EQ(std::max(p.fd[0], p.fd[1]), keys[1].fd());

	EXPECT_THROW(s->register_handle(p.fd[0] + 1000, ioready_none), validation_error);
	EXPECT_THROW(s->register_handle(p.fd[0] + 1000, ioready_events(4)), validation_error);
	EXPECT_THROW(s->register_handle(p.fd[0] + 1000, ioready_input | ioready_events(0x100)), validation_error);
	EXPECT_THROW(s->register_handle(-1, ioready_input), validation_error);

	s->unregister(p.fd[0]);
	s->unregister(obj);
	EXPECT_EQ(0u, s->size());
}

inline void
IoreadyTests::run_duplicate(ioready_selector * s)
{
	socket_pair p;
	int cookie = 0;

	selector_key key = s->register_handle(p.fd[0], ioready_input, &cookie);

	try {
		s->register_handle(p.fd[0], ioready_output);
		FAIL() << "duplicate registration accepted";
	}
	catch (const duplicate_registration_error & e) {
		EXPECT_EQ(p.fd[0], e.fd());
	}

	/* same descriptor through an object handle is a duplicate as well */
	descriptor_object obj(p.fd[0]);
	EXPECT_THROW(s->register_handle(obj, ioready_input), duplicate_registration_error);

	EXPECT_TRUE(s->get_key(p.fd[0]) == key);
	EXPECT_EQ(1u, s->size());

	s->unregister(p.fd[0]);
}

inline void
IoreadyTests::run_unregister(ioready_selector * s)
{
	socket_pair p;

	EXPECT_THROW(s->unregister(p.fd[0]), not_found_error);
	EXPECT_THROW(s->get_key(p.fd[0]), not_found_error);

	selector_key key = s->register_handle(p.fd[0], ioready_input | ioready_output);
	selector_key removed = s->unregister(p.fd[0]);
	EXPECT_TRUE(removed == key);
	EXPECT_THROW(s->get_key(p.fd[0]), not_found_error);
	EXPECT_THROW(s->unregister(p.fd[0]), not_found_error);
	EXPECT_EQ(0u, s->size());

	/* unregistered descriptors are not reported anymore */
	EXPECT_TRUE(poll_now(s).empty());

	/* descriptor can be registered again */
	s->register_handle(p.fd[0], ioready_output);
	EXPECT_TRUE(events_for(poll_now(s), p.fd[0]) == ioready_output);
	s->unregister(p.fd[0]);
}

inline void
IoreadyTests::run_modify(ioready_selector * s)
{
	socket_pair p;
	int first = 0, second = 0;

	EXPECT_THROW(s->modify(p.fd[0], ioready_input), not_found_error);

	s->register_handle(p.fd[0], ioready_input, &first);
	/* empty buffer, no data: nothing reported */
	EXPECT_TRUE(poll_now(s).empty());

	selector_key key = s->modify(p.fd[0], ioready_output, &second);
	EXPECT_EQ(p.fd[0], key.fd());
	EXPECT_TRUE(key.events() == ioready_output);
	EXPECT_EQ(&second, key.data());
	EXPECT_TRUE(s->get_key(p.fd[0]) == key);
	EXPECT_TRUE(events_for(poll_now(s), p.fd[0]) == ioready_output);

	/* data only */
	key = s->modify(p.fd[0], ioready_output, &first);
	EXPECT_EQ(&first, key.data());
	EXPECT_TRUE(s->get_key(p.fd[0]) == key);
	EXPECT_TRUE(events_for(poll_now(s), p.fd[0]) == ioready_output);

	/* invalid mask leaves registration untouched */
	EXPECT_THROW(s->modify(p.fd[0], ioready_none), validation_error);
	EXPECT_TRUE(s->get_key(p.fd[0]) == key);

	key = s->modify(p.fd[0], ioready_input | ioready_output);
	char c = 'x';
	EXPECT_EQ(1, ::write(p.fd[1], &c, 1));
	EXPECT_TRUE(events_for(poll_now(s), p.fd[0]) == (ioready_input | ioready_output));

	key = s->modify(p.fd[0], ioready_input);
	EXPECT_TRUE(events_for(poll_now(s), p.fd[0]) == ioready_input);

	s->unregister(p.fd[0]);
}

inline void
IoreadyTests::run_timeouts(ioready_selector * s)
{
	/* empty selector returns immediately on zero and negative timeout */
	auto start = std::chrono::steady_clock::now();
	EXPECT_TRUE(poll_now(s).empty());
	std::chrono::steady_clock::duration negative = std::chrono::seconds(-5);
	EXPECT_TRUE(s->select(&negative).empty());
	EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(500));

	socket_pair p;
	s->register_handle(p.fd[0], ioready_input);

	std::chrono::steady_clock::duration timeout = std::chrono::milliseconds(30);
	start = std::chrono::steady_clock::now();
	EXPECT_TRUE(s->select(&timeout).empty());
	EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(25));

	/* fractional timeouts are rounded up, never down to a busy poll */
	timeout = std::chrono::microseconds(1500);
	start = std::chrono::steady_clock::now();
	EXPECT_TRUE(s->select(&timeout).empty());
	EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(1));

	/* largest representable timeout waits until ready */
	s->modify(p.fd[0], ioready_output);
	timeout = std::chrono::steady_clock::duration::max();
	std::vector<selector_event> events = s->select(&timeout);
	ASSERT_EQ(1u, events.size());
	EXPECT_TRUE(events[0].events == ioready_output);

	s->unregister(p.fd[0]);
}

inline void
IoreadyTests::run_invalid_descriptor(ioready_selector * s)
{
	/* never issued by the OS; must be refused without sizing any
	per-descriptor table for it */
	int bogus = std::numeric_limits<int>::max() - 1;
	EXPECT_THROW(s->register_handle(bogus, ioready_input), backend_error);
	EXPECT_EQ(0u, s->size());
	EXPECT_THROW(s->get_key(bogus), not_found_error);

	socket_pair p;
	selector_key key = s->register_handle(p.fd[0], ioready_output);
	EXPECT_TRUE(s->get_key(p.fd[0]) == key);
	EXPECT_TRUE(events_for(poll_now(s), p.fd[0]) == ioready_output);
	s->unregister(p.fd[0]);
}

inline void
IoreadyTests::run_readiness(ioready_selector * s)
{
	socket_pair p;

	s->register_handle(p.fd[0], ioready_output);
	s->register_handle(p.fd[1], ioready_input);

	/* writable end reported, readable end not (no data yet) */
	std::vector<selector_event> events = poll_now(s);
	ASSERT_EQ(1u, events.size());
	EXPECT_EQ(p.fd[0], events[0].key.fd());
	EXPECT_TRUE(events[0].events == ioready_output);

	char buffer[16] = "hello";
	EXPECT_EQ(5, ::write(p.fd[0], buffer, 5));

	events = s->select();
	EXPECT_TRUE(events_for(events, p.fd[1]) == ioready_input);
	EXPECT_TRUE(events_for(events, p.fd[0]) == ioready_output);
	for (const selector_event & ev : events) {
		EXPECT_TRUE(ev.key == s->get_key(ev.key.fd()));
	}

	EXPECT_EQ(5, ::read(p.fd[1], buffer, sizeof(buffer)));
	events = poll_now(s);
	EXPECT_TRUE(events_for(events, p.fd[1]) == ioready_none);

	/* hangup is reported as readable */
	s->unregister(p.fd[0]);
	p.close_end(0);
	events = poll_now(s);
	EXPECT_TRUE(events_for(events, p.fd[1]) == ioready_input);

	s->unregister(p.fd[1]);
}

inline void
IoreadyTests::run_level_triggered(ioready_selector * s)
{
	socket_pair p;
	s->register_handle(p.fd[1], ioready_input);

	char c = 'x';
	EXPECT_EQ(1, ::write(p.fd[0], &c, 1));

	/* not drained: reported on every call */
	for (int n = 0; n < 3; ++n) {
		std::vector<selector_event> events = poll_now(s);
		ASSERT_EQ(1u, events.size());
		EXPECT_EQ(p.fd[1], events[0].key.fd());
		EXPECT_TRUE(events[0].events == ioready_input);
	}

	EXPECT_EQ(1, ::read(p.fd[1], &c, 1));
	EXPECT_TRUE(poll_now(s).empty());

	s->unregister(p.fd[1]);
}

inline void
IoreadyTests::run_stale_handle(ioready_selector * s)
{
	socket_pair p;
	descriptor_object obj(p.fd[0]);
	selector_key key = s->register_handle(obj, ioready_input);

	/* object gave up its descriptor before being unregistered */
	p.close_end(0);
	obj.detach();

	selector_key removed = s->unregister(obj);
	EXPECT_TRUE(removed == key);
	EXPECT_EQ(0u, s->size());

	descriptor_object unknown(-1);
	EXPECT_THROW(s->unregister(unknown), not_found_error);
}

inline void
IoreadyTests::run_threads(ioready_selector * s)
{
	wakeup_pipe wakeup;
	int cookie = 0;
	s->register_handle(wakeup, ioready_input, &cookie);

	std::vector<selector_event> events;
	std::thread t([s, &events]()
		{
			events = s->select(nullptr);
		});

	std::this_thread::sleep_for(std::chrono::milliseconds(20));
	wakeup.set();
	t.join();

	ASSERT_EQ(1u, events.size());
	EXPECT_EQ(wakeup.readfd(), events[0].key.fd());
	EXPECT_EQ(&cookie, events[0].key.data());
	EXPECT_TRUE(events[0].events == ioready_input);

	wakeup.clear();
	EXPECT_TRUE(poll_now(s).empty());

	s->unregister(wakeup);
}

inline void
IoreadyTests::run_close(ioready_selector * s)
{
	socket_pair p;
	s->register_handle(p.fd[0], ioready_input);

	s->close();
	EXPECT_TRUE(s->is_closed());
	EXPECT_EQ(0u, s->size());

	EXPECT_THROW(s->register_handle(p.fd[1], ioready_input), closed_error);
	EXPECT_THROW(s->unregister(p.fd[0]), closed_error);
	EXPECT_THROW(s->modify(p.fd[0], ioready_output), closed_error);
	EXPECT_THROW(s->get_key(p.fd[0]), closed_error);
	EXPECT_THROW(s->keys(), closed_error);
	EXPECT_THROW(poll_now(s), closed_error);

	/* closing again is harmless */
	s->close();
	EXPECT_TRUE(s->is_closed());

	/* registered descriptors are not owned by the selector */
	EXPECT_NE(-1, ::fcntl(p.fd[0], F_GETFD));
}

}

#endif
