// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#include "frac/math/gcd.h"

namespace frac {

namespace {

	int ctz(unsigned x) { return __builtin_ctz(x); }
	int ctz(unsigned long long x) { return __builtin_ctzll(x); }

	// Iterative form of:
	// gcd(2a, 2b) = 2 * gcd(a, b)
	// gcd(2a, b)  = gcd(a, b) for odd b
	// gcd(a, b)   = gcd(|a - b| / 2, min(a, b)) for odd a, b
	template <class T> T gcdBinary(T u, T v) {
		if(u == v)
			return u;
		if(u == 0)
			return v;
		if(v == 0)
			return u;

		int shift = ctz(u | v);
		u >>= ctz(u);

		do {
			v >>= ctz(v);
			if(u > v)
				swap(u, v);
			v = v - u;
		} while(v);

		return u << shift;
	}
}

int gcd(int a, int b) {
	DASSERT(a >= 0 && b >= 0);
	return int(gcdBinary<unsigned>(a, b));
}

llint gcd(llint a, llint b) {
	DASSERT(a >= 0 && b >= 0);
	return llint(gcdBinary<unsigned long long>(a, b));
}

u64 gcd(u64 a, u64 b) { return gcdBinary<unsigned long long>(a, b); }
}
