// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#pragma once

#include "frac/math_base.h"

#include <iterator>

namespace frac {

// Binary GCD; arguments have to be non-negative
int gcd(int, int);
llint gcd(llint, llint);
u64 gcd(u64, u64);

template <class TRange>
	requires requires(const TRange &range) { std::begin(range) != std::end(range); }
auto gcd(const TRange &range) {
	using T = std::remove_cvref_t<decltype(*std::begin(range))>;
	auto it = std::begin(range), it_end = std::end(range);
	if(it == it_end)
		return T(0);
	T out = *it++;
	while(it != it_end && out != T(1)) {
		out = gcd(out, *it);
		it++;
	}
	return out;
}

template <class T> T gcdEuclid(T a, T b) {
	static_assert(is_integral<T>);
	while(true) {
		if(a == T(0))
			return b;
		b = b % a;

		if(b == T(0))
			return a;
		a = a % b;
	}
}
}
