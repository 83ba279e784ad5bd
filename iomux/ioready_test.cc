/* -*- C++ -*-
 * (c) 2006 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1
 * Refer to the file "COPYING" for details.
 */

#include <errno.h>

#include <algorithm>
#include <cstring>
#include <utility>

#include "ioready-testlib.h"

namespace iomux {

namespace {

/* selector whose backend behavior is scripted by the test */
class scripted_selector : public ioready_selector {
public:
	~scripted_selector() noexcept override
	{
		close();
	}

	const char *
	name() const noexcept override
	{
		return "scripted";
	}

	int add_error = 0;
	int remove_error = 0;
	int interrupts = 0;
	std::vector<ready_descriptor> script;

	int add_calls = 0;
	std::size_t size_at_add = 0;
	int remove_calls = 0;
	int wait_calls = 0;
	int release_calls = 0;
	std::vector<bool> wait_had_timeout;
	std::chrono::steady_clock::duration last_timeout{};

protected:
	void
	add_interest(int, ioready_events) override
	{
		++add_calls;
		size_at_add = size();
		if (add_error) {
			throw backend_error(add_error, "add");
		}
	}

	void
	remove_interest(int, ioready_events) override
	{
		++remove_calls;
		if (remove_error) {
			throw backend_error(remove_error, "remove");
		}
	}

	bool
	wait_ready(
		const std::chrono::steady_clock::duration * timeout,
		std::vector<ready_descriptor> & ready) override
	{
		++wait_calls;
		wait_had_timeout.push_back(timeout != nullptr);
		if (timeout) {
			last_timeout = *timeout;
		}
		if (interrupts) {
			--interrupts;
			return false;
		}
		ready = script;
		return true;
	}

	void
	release() noexcept override
	{
		++release_calls;
	}
};

/* same, with an update primitive */
class scripted_atomic_selector final : public scripted_selector {
public:
	selector_key
	modify(const io_handle & handle, ioready_events events, void * data = nullptr) override
	{
		return modify_atomic(handle, events, data);
	}

	int update_error = 0;
	int update_calls = 0;

protected:
	void
	update_interest(int, ioready_events, ioready_events) override
	{
		++update_calls;
		if (update_error) {
			throw backend_error(update_error, "update");
		}
	}
};

}

TEST(IoreadySelectorTests, event_mask)
{
	ioready_events e = ioready_input | ioready_output;
	EXPECT_EQ(3, e.bits());
	EXPECT_TRUE(e & ioready_input);
	EXPECT_FALSE(ioready_none);
	e &= ~ioready_input;
	EXPECT_TRUE(e == ioready_output);
}

TEST(IoreadySelectorTests, backend_names)
{
	EXPECT_STREQ("epoll", selector_backend_name(selector_backend::epoll));
	EXPECT_STREQ("kqueue", selector_backend_name(selector_backend::kqueue));
	EXPECT_STREQ("poll", selector_backend_name(selector_backend::poll));
	EXPECT_STREQ("select", selector_backend_name(selector_backend::select));
}

TEST(IoreadySelectorTests, failed_add_leaves_registry_unchanged)
{
	scripted_selector s;
	s.add_error = EPERM;

	try {
		s.register_handle(5, ioready_input);
		FAIL() << "backend failure not reported";
	}
	catch (const backend_error & e) {
		EXPECT_EQ(std::errc::operation_not_permitted, e.code());
	}
	EXPECT_EQ(0u, s.size());
	EXPECT_THROW(s.get_key(5), not_found_error);

	s.add_error = 0;
	selector_key key = s.register_handle(5, ioready_input);
	EXPECT_TRUE(s.get_key(5) == key);
}

TEST(IoreadySelectorTests, backend_accepts_before_registry_grows)
{
	scripted_selector s;
	s.register_handle(5, ioready_input);
	EXPECT_EQ(0u, s.size_at_add);
	s.register_handle(6, ioready_input);
	EXPECT_EQ(1u, s.size_at_add);
	EXPECT_EQ(2u, s.size());
}

TEST(IoreadySelectorTests, non_atomic_modify_failure)
{
	scripted_selector s;
	int cookie = 0;
	selector_key key = s.register_handle(5, ioready_input, &cookie);

	s.add_error = EIO;
	try {
		s.modify(5, ioready_output);
		FAIL() << "backend failure not reported";
	}
	catch (const modify_unregistered_error & e) {
		EXPECT_TRUE(e.key() == key);
		EXPECT_NE(nullptr, std::strstr(e.what(), "add"));
	}

	/* handle is no longer registered */
	EXPECT_EQ(0u, s.size());
	EXPECT_THROW(s.get_key(5), not_found_error);
}

TEST(IoreadySelectorTests, non_atomic_modify)
{
	scripted_selector s;
	s.register_handle(5, ioready_input);

	selector_key key = s.modify(5, ioready_output);
	EXPECT_TRUE(key.events() == ioready_output);
	EXPECT_EQ(1, s.remove_calls);
	EXPECT_EQ(2, s.add_calls);
	EXPECT_TRUE(s.get_key(5) == key);
}

TEST(IoreadySelectorTests, atomic_modify_failure_keeps_key)
{
	scripted_atomic_selector s;
	int cookie = 0;
	selector_key key = s.register_handle(5, ioready_input, &cookie);

	s.update_error = EBADF;
	EXPECT_THROW(s.modify(5, ioready_output), backend_error);
	EXPECT_TRUE(s.get_key(5) == key);
	EXPECT_EQ(0, s.remove_calls);

	s.update_error = 0;
	key = s.modify(5, ioready_output);
	EXPECT_TRUE(s.get_key(5) == key);
	EXPECT_TRUE(key.events() == ioready_output);
	EXPECT_EQ(2, s.update_calls);
}

TEST(IoreadySelectorTests, data_only_modify)
{
	scripted_atomic_selector s;
	int first = 0, second = 0;
	s.register_handle(5, ioready_input, &first);

	selector_key key = s.modify(5, ioready_input, &second);
	EXPECT_EQ(&second, key.data());
	EXPECT_TRUE(s.get_key(5) == key);
	EXPECT_EQ(0, s.update_calls);

	scripted_selector g;
	g.register_handle(5, ioready_input, &first);
	key = g.modify(5, ioready_input, &second);
	EXPECT_EQ(&second, key.data());
	EXPECT_TRUE(g.get_key(5) == key);
	EXPECT_EQ(1, g.add_calls);
	EXPECT_EQ(0, g.remove_calls);
}

TEST(IoreadySelectorTests, removal_failures_are_tolerated)
{
	scripted_selector s;
	selector_key a = s.register_handle(5, ioready_input);
	selector_key b = s.register_handle(6, ioready_input);

	s.remove_error = EBADF;
	EXPECT_TRUE(s.unregister(5) == a);

	s.remove_error = EIO;
	EXPECT_TRUE(s.unregister(6) == b);

	EXPECT_EQ(0u, s.size());
	EXPECT_EQ(2, s.remove_calls);
}

TEST(IoreadySelectorTests, reported_events_are_masked)
{
	scripted_selector s;
	int cookie = 0;
	s.register_handle(5, ioready_input, &cookie);
	s.register_handle(6, ioready_input);

	s.script = {
		{5, ioready_input | ioready_output},
		{6, ioready_output},
		{7, ioready_input}
	};

	std::vector<selector_event> events = s.select();
	ASSERT_EQ(1u, events.size());
	EXPECT_EQ(5, events[0].key.fd());
	EXPECT_EQ(&cookie, events[0].key.data());
	EXPECT_TRUE(events[0].events == ioready_input);
}

TEST(IoreadySelectorTests, interrupted_wait_is_retried)
{
	scripted_selector s;
	s.register_handle(5, ioready_input);
	s.script = {{5, ioready_input}};
	s.interrupts = 2;

	std::chrono::steady_clock::duration timeout = std::chrono::seconds(10);
	std::vector<selector_event> events = s.select(&timeout);
	EXPECT_EQ(3, s.wait_calls);
	ASSERT_EQ(1u, events.size());
	for (bool had_timeout : s.wait_had_timeout) {
		EXPECT_TRUE(had_timeout);
	}

	s.interrupts = 1;
	s.wait_had_timeout.clear();
	events = s.select();
	ASSERT_EQ(1u, events.size());
	ASSERT_EQ(2u, s.wait_had_timeout.size());
	EXPECT_FALSE(s.wait_had_timeout[0]);
	EXPECT_FALSE(s.wait_had_timeout[1]);
}

TEST(IoreadySelectorTests, unbounded_timeout_saturates)
{
	scripted_selector s;
	s.register_handle(5, ioready_input);
	s.script = {{5, ioready_input}};
	s.interrupts = 1;

	std::chrono::steady_clock::duration timeout = std::chrono::steady_clock::duration::max();
	std::vector<selector_event> events = s.select(&timeout);
	ASSERT_EQ(1u, events.size());
	EXPECT_EQ(2, s.wait_calls);
	/* remaining time after the retry is still effectively unbounded */
	EXPECT_GT(s.last_timeout, std::chrono::hours(24 * 365));
}

TEST(IoreadySelectorTests, close_releases_once)
{
	scripted_selector s;
	s.register_handle(5, ioready_input);

	s.close();
	s.close();
	EXPECT_EQ(1, s.release_calls);
	EXPECT_TRUE(s.is_closed());
	EXPECT_EQ(0u, s.size());
	EXPECT_EQ(0, s.remove_calls);

	EXPECT_THROW(s.register_handle(5, ioready_input), closed_error);
	EXPECT_THROW(s.select(), closed_error);
}

TEST(IoreadySelectorTests, validation_precedes_lookup)
{
	scripted_selector s;
	EXPECT_THROW(s.modify(5, ioready_none), validation_error);
	EXPECT_THROW(s.modify(5, ioready_input), not_found_error);
	EXPECT_THROW(s.register_handle(5, ioready_events(8)), validation_error);
	EXPECT_EQ(0, s.add_calls);
}

TEST(IoreadySelectorTests, available_backends)
{
	std::vector<selector_backend> backends = ioready_selector::available_backends();
	ASSERT_FALSE(backends.empty());

	for (selector_backend backend : backends) {
		std::unique_ptr<ioready_selector> s = ioready_selector::create(backend);
		ASSERT_TRUE(s != nullptr);
		EXPECT_STREQ(selector_backend_name(backend), s->name());
	}

	for (selector_backend backend : {selector_backend::epoll, selector_backend::kqueue,
		selector_backend::poll, selector_backend::select}) {
		if (std::find(backends.begin(), backends.end(), backend) != backends.end()) {
			continue;
		}
		try {
			ioready_selector::create(backend);
			FAIL() << "unsupported backend created";
		}
		catch (const backend_error & e) {
			EXPECT_EQ(std::errc::function_not_supported, e.code());
		}
	}
}

TEST(IoreadySelectorTests, create_prefers_first_backend)
{
	std::unique_ptr<ioready_selector> s = ioready_selector::create();
	ASSERT_TRUE(s != nullptr);
	EXPECT_STREQ(selector_backend_name(ioready_selector::available_backends().front()), s->name());

	/* second call uses the remembered choice */
	std::unique_ptr<ioready_selector> again = ioready_selector::create();
	EXPECT_STREQ(s->name(), again->name());
}

class IoreadyBackendTests : public IoreadyTests {};

namespace {

/* (role, events) pairs, role being the index of the descriptor in fds */
typedef std::vector<std::pair<int, int>> observation;

observation
observe(const std::vector<selector_event> & events, const int * fds, int count)
{
	observation result;
	for (const selector_event & ev : events) {
		for (int role = 0; role < count; ++role) {
			if (ev.key.fd() == fds[role]) {
				result.emplace_back(role, ev.events.bits());
			}
		}
	}
	std::sort(result.begin(), result.end());
	return result;
}

}

TEST_F(IoreadyBackendTests, equivalent_readiness)
{
	std::vector<observation> reference;

	for (selector_backend backend : ioready_selector::available_backends()) {
		SCOPED_TRACE(selector_backend_name(backend));
		std::unique_ptr<ioready_selector> s = ioready_selector::create(backend);
		socket_pair p;
		std::vector<observation> steps;
		char c = 'x';

		s->register_handle(p.fd[0], ioready_input | ioready_output);
		s->register_handle(p.fd[1], ioready_input);
		steps.push_back(observe(poll_now(s.get()), p.fd, 2));

		EXPECT_EQ(1, ::write(p.fd[0], &c, 1));
		EXPECT_EQ(1, ::write(p.fd[1], &c, 1));
		steps.push_back(observe(poll_now(s.get()), p.fd, 2));

		s->modify(p.fd[0], ioready_input);
		s->modify(p.fd[1], ioready_output);
		steps.push_back(observe(poll_now(s.get()), p.fd, 2));

		s->unregister(p.fd[1]);
		steps.push_back(observe(poll_now(s.get()), p.fd, 2));

		EXPECT_EQ(1, ::read(p.fd[0], &c, 1));
		steps.push_back(observe(poll_now(s.get()), p.fd, 2));

		s->unregister(p.fd[0]);
		steps.push_back(observe(poll_now(s.get()), p.fd, 2));

		int in = ioready_input.bits();
		int out = ioready_output.bits();
		std::vector<observation> expected = {
			{{0, out}},
			{{0, in | out}, {1, in}},
			{{0, in}, {1, out}},
			{{0, in}},
			{},
			{}
		};
		EXPECT_EQ(expected, steps);

		if (reference.empty()) {
			reference = steps;
		} else {
			EXPECT_EQ(reference, steps);
		}
	}
}

}
