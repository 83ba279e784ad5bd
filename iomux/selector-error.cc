/* -*- C++ -*-
 * (c) 2006 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1
 * Refer to the file "COPYING" for details.
 */

#include <iomux/selector-error.h>

namespace iomux {

/**
	\class selector_error
	\brief Base of all errors reported by selectors
	\headerfile iomux/selector-error.h <iomux/selector-error.h>

	Every operation of \ref ioready_selector reports failure by throwing
	an exception derived from this class. Errors are always raised
	synchronously from the call that triggered them.
*/

selector_error::selector_error(const std::string & what)
	: std::runtime_error(what)
{
}

selector_error::~selector_error() noexcept
{
}

/**
	\class validation_error
	\brief Invalid arguments

	Thrown for an empty event mask, a mask containing bits other than
	\ref ioready_input and \ref ioready_output, or a handle that does
	not resolve to a non-negative descriptor.
*/

validation_error::validation_error(const std::string & what)
	: selector_error(what)
{
}

validation_error::~validation_error() noexcept
{
}

/**
	\class duplicate_registration_error
	\brief Descriptor is registered already

	The registry is left unchanged.
*/

duplicate_registration_error::duplicate_registration_error(int fd)
	: selector_error("descriptor " + std::to_string(fd) + " is already registered")
	, fd_(fd)
{
}

duplicate_registration_error::~duplicate_registration_error() noexcept
{
}

not_found_error::not_found_error(const std::string & what)
	: selector_error(what)
{
}

not_found_error::~not_found_error() noexcept
{
}

closed_error::closed_error()
	: selector_error("selector is closed")
{
}

closed_error::~closed_error() noexcept
{
}

/**
	\class backend_error
	\brief Failure of an operating system call

	Wraps the \p errno value reported by the underlying multiplexing
	primitive. Interruption by a signal (\p EINTR) during a wait is
	retried internally and never reported through this exception.
*/

backend_error::backend_error(int error, const std::string & operation)
	: selector_error(operation + ": " + std::system_category().message(error))
	, code_(error, std::system_category())
{
}

backend_error::~backend_error() noexcept
{
}

/**
	\class modify_unregistered_error
	\brief Non-atomic modification lost the registration

	Thrown by the generic \ref ioready_selector::modify when the handle
	was unregistered successfully but could not be registered again
	with the new parameters. The handle is <I>not</I> registered
	anymore; \ref key returns the key that was removed so that the
	caller can restore monitoring by registering again.
*/

modify_unregistered_error::modify_unregistered_error(
	const selector_key & key, const std::string & cause)
	: selector_error("descriptor " + std::to_string(key.fd()) + " left unregistered by modify: " + cause)
	, key_(key)
{
}

modify_unregistered_error::~modify_unregistered_error() noexcept
{
}

}
