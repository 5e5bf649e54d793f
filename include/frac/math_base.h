// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#pragma once

#include "frac/sys_base.h"

#include <cmath>
#include <limits>

#ifdef _MSC_VER
#include <boost/multiprecision/cpp_int.hpp>
#endif

namespace frac {

#ifdef _MSC_VER
using qint = boost::multiprecision::int128_t;
#else
using qint = __int128_t;
#endif

namespace detail {
	template <class T> struct Promotion { using Type = T; };
	template <> struct Promotion<int> { using Type = llint; };
	template <> struct Promotion<llint> { using Type = qint; };
}

// Integer type wide enough to hold a product of two T's (and a sum of two such products
// when one factor of each is positive)
template <class T> using Promote = typename detail::Promotion<T>::Type;

// Works for INT64_MIN too
constexpr u64 uabs(llint value) {
	return value < 0 ? u64(-(value + 1)) + 1u : u64(value);
}

template <class T, class PT> constexpr bool fitsIn(const PT &value) {
	return value >= PT(std::numeric_limits<T>::min()) && value <= PT(std::numeric_limits<T>::max());
}

inline bool isFinite(double value) { return std::isfinite(value); }

constexpr double sqrt2 = 1.41421356237309504880;
constexpr double pi = 3.14159265358979323846;
}
