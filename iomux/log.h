/* -*- C++ -*-
 * (c) 2006 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1.
 * Refer to the file "COPYING" for details.
 */

#ifndef IOMUX_LOG_H
#define IOMUX_LOG_H

#include <spdlog/spdlog.h>

namespace iomux {

namespace log = spdlog;

}

#endif
