// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#pragma once

#include "frac/sys/error.h"

#include <memory>
#include <new>

namespace frac {

// Will return ERROR if expr evaluates to false.
// If expr is of Expected<> type, then it's error will be passed forward.
#define EXPECT(expr)                                                                               \
	{                                                                                              \
		auto &&_expect_value = ((expr));                                                           \
		if(__builtin_expect(!_expect_value, false))                                                \
			return frac::detail::passError(_expect_value, FRAC_STRINGIZE(expr), __FILE__,           \
										   __LINE__);                                              \
	}

// Evaluates an expression of type Expected<T>.
// If it's valid then the value is simply passed, otherwise error is returned.
//
// Example use:
// Ex<int> func1(int v) { ... }
// Ex<float> func2() { auto value = EX_PASS(func1(10)); return value * 0.5f; }
#define EX_PASS(...)                                                                               \
	({                                                                                             \
		auto _expect_result = __VA_ARGS__;                                                         \
		static_assert(frac::is_expected<decltype(_expect_result)>,                                 \
					  "You have to pass Expected<...> to EX_PASS");                                \
		if(!_expect_result)                                                                        \
			return _expect_result.error();                                                         \
		std::move(_expect_result.get());                                                       \
	})

namespace detail {
	Error expectMakeError(const char *, const char *, int);
}

template <class T> constexpr bool is_expected = false;
template <class T> constexpr bool is_expected<Expected<T>> = true;

// Simple class which can hold value or an error.
template <class T> class [[nodiscard]] Expected {
  public:
	static_assert(!is_same<T, Error>);

	Expected(const T &value) : m_has_value(true) { new(&m_value) T(value); }
	Expected(T &&value) : m_has_value(true) { new(&m_value) T(move(value)); }
	Expected(Error error) : m_has_value(false) {
		new(&m_error) ErrorPtr(new Error(move(error)));
	}
	~Expected() {
		if(m_has_value)
			m_value.~T();
		else
			m_error.~ErrorPtr();
	}

	Expected(const Expected &rhs) : m_has_value(rhs.m_has_value) {
		if(m_has_value)
			new(&m_value) T(rhs.m_value);
		else
			new(&m_error) ErrorPtr(new Error(*rhs.m_error));
	}
	Expected(Expected &&rhs) : m_has_value(rhs.m_has_value) {
		if(m_has_value)
			new(&m_value) T(move(rhs.m_value));
		else
			new(&m_error) ErrorPtr(move(rhs.m_error));
	}

	void operator=(Expected &&rhs) {
		if(&rhs != this) {
			this->~Expected();
			new(this) Expected(move(rhs));
		}
	}

	void operator=(const Expected &rhs) {
		if(&rhs != this) {
			this->~Expected();
			new(this) Expected(rhs);
		}
	}

	bool hasValue() const { return m_has_value; }
	explicit operator bool() const { return m_has_value; }

	T *operator->() { return DASSERT(m_has_value), &m_value; }
	const T *operator->() const { return DASSERT(m_has_value), &m_value; }
	T &operator*() { return DASSERT(m_has_value), m_value; }
	const T &operator*() const { return DASSERT(m_has_value), m_value; }

	Error &error() { return DASSERT(!m_has_value), *m_error; }
	const Error &error() const { return DASSERT(!m_has_value), *m_error; }

	const T &orElse(const T &on_error) const { return m_has_value ? m_value : on_error; }

	T &get() {
		if(!m_has_value)
			fatalError(*m_error);
		return m_value;
	}
	const T &get() const { return ((Expected *)this)->get(); }

	bool operator==(const T &rhs) const { return m_has_value && m_value == rhs; }

  private:
	using ErrorPtr = std::unique_ptr<Error>;

	union {
		ErrorPtr m_error;
		T m_value;
	};
	bool m_has_value;
};

namespace detail {
	template <class T>
	Error passError(const T &, const char *expr, const char *file, int line) {
		return expectMakeError(expr, file, line);
	}

	template <class T> Error passError(const Expected<T> &value, const char *, const char *, int) {
		return value.error();
	}
}
}
