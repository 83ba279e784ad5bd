/* -*- C++ -*-
 * (c) 2006 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1
 * Refer to the file "COPYING" for details.
 */

#include "ioready-testlib.h"

#include <iomux/ioready-kqueue.h>
#include <iomux/ioready-select.h>

namespace iomux {

class IoreadyKqueueTests : public IoreadyTests {};

TEST_F(IoreadyKqueueTests, registration)
{
	auto selector = std::make_unique<ioready_selector_kqueue>();
	run_register(selector.get());
}

TEST_F(IoreadyKqueueTests, duplicate)
{
	auto selector = std::make_unique<ioready_selector_kqueue>();
	run_duplicate(selector.get());
}

TEST_F(IoreadyKqueueTests, unregister)
{
	auto selector = std::make_unique<ioready_selector_kqueue>();
	run_unregister(selector.get());
}

TEST_F(IoreadyKqueueTests, modify)
{
	auto selector = std::make_unique<ioready_selector_kqueue>();
	run_modify(selector.get());
}

TEST_F(IoreadyKqueueTests, timeouts)
{
	auto selector = std::make_unique<ioready_selector_kqueue>();
	run_timeouts(selector.get());
}

TEST_F(IoreadyKqueueTests, invalid_descriptor)
{
	auto selector = std::make_unique<ioready_selector_kqueue>();
	run_invalid_descriptor(selector.get());
}

TEST_F(IoreadyKqueueTests, readiness)
{
	auto selector = std::make_unique<ioready_selector_kqueue>();
	run_readiness(selector.get());
}

TEST_F(IoreadyKqueueTests, level_triggered)
{
	auto selector = std::make_unique<ioready_selector_kqueue>();
	run_level_triggered(selector.get());
}

TEST_F(IoreadyKqueueTests, stale_handle)
{
	auto selector = std::make_unique<ioready_selector_kqueue>();
	run_stale_handle(selector.get());
}

TEST_F(IoreadyKqueueTests, threads)
{
	auto selector = std::make_unique<ioready_selector_kqueue>();
	run_threads(selector.get());
}

TEST_F(IoreadyKqueueTests, close)
{
	auto selector = std::make_unique<ioready_selector_kqueue>();
	run_close(selector.get());
}

TEST_F(IoreadyKqueueTests, filters)
{
	auto selector = std::make_unique<ioready_selector_kqueue>();
	socket_pair p;

	selector->register_handle(p.fd[0], ioready_input | ioready_output);
	EXPECT_EQ(2u, selector->active_filters());

	selector->modify(p.fd[0], ioready_output);
	EXPECT_EQ(1u, selector->active_filters());
	EXPECT_TRUE(events_for(poll_now(selector.get()), p.fd[0]) == ioready_output);

	selector->register_handle(p.fd[1], ioready_input);
	EXPECT_EQ(2u, selector->active_filters());

	selector->unregister(p.fd[0]);
	selector->unregister(p.fd[1]);
	EXPECT_EQ(0u, selector->active_filters());
}

TEST_F(IoreadyKqueueTests, fileno)
{
	auto selector = std::make_unique<ioready_selector_kqueue>();
	EXPECT_GE(selector->fileno(), 0);
	selector->close();
	EXPECT_THROW(selector->fileno(), closed_error);
}

TEST_F(IoreadyKqueueTests, nested_in_select)
{
	auto inner = std::make_unique<ioready_selector_kqueue>();
	auto outer = std::make_unique<ioready_selector_select>();
	socket_pair p;

	inner->register_handle(p.fd[1], ioready_input);
	outer->register_handle(*inner, ioready_input);
	EXPECT_TRUE(poll_now(outer.get()).empty());

	char c = 'x';
	EXPECT_EQ(1, ::write(p.fd[0], &c, 1));

	std::vector<selector_event> events = poll_now(outer.get());
	ASSERT_EQ(1u, events.size());
	EXPECT_EQ(inner->fileno(), events[0].key.fd());

	outer->unregister(*inner);
}

TEST_F(IoreadyKqueueTests, failed_modify_restores_filters)
{
	/* a kqueue descriptor only supports the read filter, so adding a
	write filter for it fails after the read filter was changed */
	auto inner = std::make_unique<ioready_selector_kqueue>();
	auto outer = std::make_unique<ioready_selector_kqueue>();
	socket_pair p;
	int cookie = 0;

	inner->register_handle(p.fd[1], ioready_input);
	selector_key key = outer->register_handle(*inner, ioready_input, &cookie);
	EXPECT_EQ(1u, outer->active_filters());

	EXPECT_THROW(outer->modify(*inner, ioready_output), backend_error);
	EXPECT_TRUE(outer->get_key(*inner) == key);
	EXPECT_EQ(1u, outer->active_filters());

	EXPECT_THROW(outer->modify(*inner, ioready_input | ioready_output), backend_error);
	EXPECT_TRUE(outer->get_key(*inner) == key);
	EXPECT_EQ(1u, outer->active_filters());

	/* the restored read filter still reports */
	char c = 'x';
	EXPECT_EQ(1, ::write(p.fd[0], &c, 1));
	std::vector<selector_event> events = poll_now(outer.get());
	ASSERT_EQ(1u, events.size());
	EXPECT_TRUE(events[0].key == key);
	EXPECT_TRUE(events[0].events == ioready_input);

	outer->unregister(*inner);
	EXPECT_EQ(0u, outer->active_filters());
}

}
