/* -*- C++ -*-
 * (c) 2006 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1.
 * Refer to the file "COPYING" for details.
 */

#ifndef IOMUX_SELECTOR_ERROR_H
#define IOMUX_SELECTOR_ERROR_H

/** \file selector-error.h */

#include <stdexcept>
#include <string>
#include <system_error>

#include <iomux/selector-key.h>

namespace iomux {

class selector_error : public std::runtime_error {
public:
	explicit selector_error(const std::string & what);
	~selector_error() noexcept override;
};

class validation_error final : public selector_error {
public:
	explicit validation_error(const std::string & what);
	~validation_error() noexcept override;
};

class duplicate_registration_error final : public selector_error {
public:
	explicit duplicate_registration_error(int fd);
	~duplicate_registration_error() noexcept override;

	inline int
	fd() const noexcept
	{
		return fd_;
	}

private:
	int fd_;
};

class not_found_error final : public selector_error {
public:
	explicit not_found_error(const std::string & what);
	~not_found_error() noexcept override;
};

class closed_error final : public selector_error {
public:
	closed_error();
	~closed_error() noexcept override;
};

class backend_error final : public selector_error {
public:
	backend_error(int error, const std::string & operation);
	~backend_error() noexcept override;

	inline const std::error_code &
	code() const noexcept
	{
		return code_;
	}

private:
	std::error_code code_;
};

class modify_unregistered_error final : public selector_error {
public:
	modify_unregistered_error(const selector_key & key, const std::string & cause);
	~modify_unregistered_error() noexcept override;

	inline const selector_key &
	key() const noexcept
	{
		return key_;
	}

private:
	selector_key key_;
};

}

#endif
