/* -*- C++ -*-
 * (c) 2006 Helge Bahmann <hcb@chaoticmind.net>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License version 2.1.
 * Refer to the file "COPYING" for details.
 */

#ifndef IOMUX_SELECTOR_KEY_H
#define IOMUX_SELECTOR_KEY_H

/** \file selector-key.h */

#include <type_traits>
#include <utility>

namespace iomux {

class ioready_events {
public:
	/** \brief Initialize from bitmask */
	constexpr explicit inline ioready_events(int repr) : repr_(repr) {}

	constexpr inline ioready_events() noexcept : repr_(0) {}
	/** \brief Bitwise OR of event bitmask */
	inline ioready_events operator|(ioready_events other) const noexcept { return ioready_events(repr_ | other.repr_); }
	/** \brief Bitwise AND of event bitmask */
	inline ioready_events operator&(ioready_events other) const noexcept { return ioready_events(repr_ & other.repr_); }
	/** \brief Bitwise OR of event bitmask */
	inline ioready_events& operator|=(ioready_events other) noexcept { repr_ |= other.repr_; return *this; }
	/** \brief Bitwise AND of event bitmask */
	inline ioready_events& operator&=(ioready_events other) noexcept { repr_ &= other.repr_; return *this; }
	/** \brief Equality */
	inline bool operator==(ioready_events other) const noexcept { return repr_ == other.repr_; }
	/** \brief Inequality */
	inline bool operator!=(ioready_events other) const noexcept { return repr_ != other.repr_; }
	/** \brief Equivalent to *this != ioready_none */
	inline operator bool() const noexcept { return repr_; }
	/** \brief Bitwise negation */
	inline ioready_events operator~() const noexcept { return ioready_events(~repr_); }
	/** \brief Raw bitmask */
	constexpr inline int bits() const noexcept { return repr_; }

private:
	int repr_;
};

constexpr ioready_events ioready_none{0x000};
constexpr ioready_events ioready_input{0x001};
constexpr ioready_events ioready_output{0x002};

class io_handle {
public:
	inline io_handle(int fd) noexcept
		: object_(nullptr), resolve_(nullptr), fd_(fd)
	{
	}

	template<
		typename T,
		typename = typename std::enable_if<
			!std::is_same<typename std::decay<T>::type, io_handle>::value>::type,
		typename = decltype(std::declval<const T &>().fileno())>
	inline io_handle(const T & object) noexcept
		: object_(&object), resolve_(&resolve_object<T>), fd_(-1)
	{
	}

	inline int
	fileno() const
	{
		return resolve_ ? resolve_(object_) : fd_;
	}

	inline bool
	is_object() const noexcept
	{
		return object_ != nullptr;
	}

	inline const void *
	object() const noexcept
	{
		return object_;
	}

	inline bool
	operator==(const io_handle & other) const noexcept
	{
		if (object_ || other.object_) {
			return object_ == other.object_;
		}
		return fd_ == other.fd_;
	}

	inline bool
	operator!=(const io_handle & other) const noexcept
	{
		return !(*this == other);
	}

private:
	template<typename T>
	static int
	resolve_object(const void * object)
	{
		return static_cast<const T *>(object)->fileno();
	}

	const void * object_;
	int (*resolve_)(const void *);
	int fd_;
};

class selector_key {
public:
	inline
	selector_key(io_handle handle, int fd, ioready_events events, void * data) noexcept
		: handle_(handle), fd_(fd), events_(events), data_(data)
	{
	}

	inline const io_handle &
	handle() const noexcept
	{
		return handle_;
	}

	inline int
	fd() const noexcept
	{
		return fd_;
	}

	inline ioready_events
	events() const noexcept
	{
		return events_;
	}

	inline void *
	data() const noexcept
	{
		return data_;
	}

	inline bool
	operator==(const selector_key & other) const noexcept
	{
		return handle_ == other.handle_ && fd_ == other.fd_ &&
			events_ == other.events_ && data_ == other.data_;
	}

	inline bool
	operator!=(const selector_key & other) const noexcept
	{
		return !(*this == other);
	}

private:
	io_handle handle_;
	int fd_;
	ioready_events events_;
	void * data_;
};

struct selector_event {
	selector_key key;
	ioready_events events;
};

}

#endif
