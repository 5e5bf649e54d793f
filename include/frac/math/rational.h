// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#pragma once

#include "frac/math_base.h"
#include "frac/sys/expected.h"

namespace frac {

// Kinds of errors returned by recoverable Rational operations;
// Error::kind of such errors is equal to toString(RationalError)
enum class RationalError {
	none,
	zero_denominator,
	malformed_text,
	non_finite,
	invalid_tolerance,
	overflow
};

const char *toString(RationalError);
// Returns RationalError::none for errors which weren't produced by Rational
RationalError errorKind(const Error &);

// Exact fraction of two integers; the denominator is always positive.
//
// Values are not kept in reduced form: arithmetic simply combines numerators and denominators,
// reduced() has to be called explicitly. Equality and ordering are exact and don't depend on
// the representation (1/2 == 2/4).
//
// Arithmetic is computed on Promote<T>; if a result doesn't fit in T, FATAL is called.
template <class T> class Rational {
  public:
	static_assert(is_same<T, int> || is_same<T, llint>, "Unsupported rational base type");
	using PT = Promote<T>;

	// Negative denominator flips signs of both parts; zero denominator is fatal
	Rational(T num, T den) : m_num(num), m_den(den) {
		if(__builtin_expect(den <= T(0), false))
			fixDenominator();
	}
	Rational(T num, T den, NoSignCheck) : m_num(num), m_den(den) { PASSERT(den > T(0)); }
	Rational(T value) : m_num(value), m_den(1) {}
	Rational() : m_num(0), m_den(1) {}

	// Same as constructor, but errors are returned instead of being fatal
	static Ex<Rational> make(T num, T den);

	// Parses text in the form: <integer>/<integer>; whitespace is not allowed
	static Ex<Rational> parse(const string &);

	// Finds the simplest fraction in the open range (value - tolerance, value + tolerance);
	// values closer than tolerance to an integer are returned as that integer.
	// Tolerance has to be positive and finite.
	static Ex<Rational> approximate(double value, double tolerance);

	T num() const { return m_num; }
	T den() const { return m_den; }

	Rational reduced() const;
	bool isInteger() const { return m_num % m_den == T(0); }

	double toDouble() const { return double(m_num) / double(m_den); }
	explicit operator double() const { return toDouble(); }

	Rational operator+(const Rational &) const;
	Rational operator-(const Rational &) const;
	Rational operator*(const Rational &) const;
	Rational operator/(const Rational &) const;
	Rational operator-() const;

	// Returns -1, 0 or 1
	int order(const Rational &) const;

	bool operator==(const Rational &) const;
	bool operator<(const Rational &rhs) const { return order(rhs) < 0; }
	bool operator>(const Rational &rhs) const { return order(rhs) > 0; }
	bool operator<=(const Rational &rhs) const { return order(rhs) <= 0; }
	bool operator>=(const Rational &rhs) const { return order(rhs) >= 0; }

	// Prints reduced form: "num/den"
	void operator>>(TextFormatter &) const;

  private:
	void fixDenominator() NOINLINE;

	T m_num, m_den;
};

using RatI = Rational<int>;
using RatL = Rational<llint>;

extern template class Rational<int>;
extern template class Rational<llint>;
}
