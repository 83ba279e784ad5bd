/* -*- C++ -*-
 * (c) 2006 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1.
 * Refer to the file "COPYING" for details.
 */

#ifndef IOMUX_DETAIL_TIMEOUT_H
#define IOMUX_DETAIL_TIMEOUT_H

#include <algorithm>
#include <chrono>
#include <limits>

namespace iomux {
namespace detail {

/* Number of Unit ticks covering a non-negative timeout, rounded up and
saturated at limit. Never adds to the timeout itself, so huge values
such as duration::max() do not overflow. */
template<typename Unit>
typename Unit::rep
round_up_timeout(
	std::chrono::steady_clock::duration timeout,
	typename Unit::rep limit = std::numeric_limits<typename Unit::rep>::max()) noexcept
{
	Unit whole = std::chrono::duration_cast<Unit>(timeout);
	typename Unit::rep count = whole.count();
	if (whole < timeout && count < limit) {
		++count;
	}
	return std::min(count, limit);
}

}
}

#endif
