// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#include "frac/math/rational.h"

#include "frac/format.h"
#include "frac/math/gcd.h"
#include "frac/parse.h"

#include <cctype>

namespace frac {

#define TEMPLATE template <class T>
#define TRATIONAL Rational<T>

#define RATIONAL_ERROR(kind, ...) ERROR_KIND(toString(RationalError::kind), __VA_ARGS__)

const char *toString(RationalError error) {
	switch(error) {
	case RationalError::none:
		return "none";
	case RationalError::zero_denominator:
		return "zero_denominator";
	case RationalError::malformed_text:
		return "malformed_text";
	case RationalError::non_finite:
		return "non_finite";
	case RationalError::invalid_tolerance:
		return "invalid_tolerance";
	case RationalError::overflow:
		return "overflow";
	}
	return "unknown";
}

RationalError errorKind(const Error &error) {
	for(auto kind : {RationalError::zero_denominator, RationalError::malformed_text,
					 RationalError::non_finite, RationalError::invalid_tolerance,
					 RationalError::overflow})
		if(error.kind == toString(kind))
			return kind;
	return RationalError::none;
}

namespace {

	template <class T, class PT> T narrow(const PT &value, const char *op) {
		if(!fitsIn<T>(value))
			FATAL("Rational overflow in operator%s (%d-bit base type)", op, int(sizeof(T) * 8));
		return T(value);
	}

	// Returns largest k >= 1 for which pred(from + k * step) holds; it has to hold for k = 1.
	// The result is limited so that the denominator doesn't exceed T's range.
	template <class T, class PT, class Pred>
	PT jumpLength(PT from_num, PT from_den, PT step_num, PT step_den, const Pred &pred) {
		PT max_k = (PT(std::numeric_limits<T>::max()) - from_den) / step_den;
		auto holds = [&](PT steps) {
			return pred(from_num + steps * step_num, from_den + steps * step_den);
		};

		// holds(good) && (bad > max_k || !holds(bad))
		PT good = 1, bad = 2;
		while(bad <= max_k && holds(bad)) {
			good = bad;
			bad *= 2;
		}
		if(bad > max_k)
			bad = max_k + 1;
		while(bad - good > PT(1)) {
			PT mid = good + (bad - good) / 2;
			if(holds(mid))
				good = mid;
			else
				bad = mid;
		}
		return good;
	}

	// Stern-Brocot search for the first fraction in (fract - tolerance, fract + tolerance);
	// fract has to lie in [tolerance, 1 - tolerance].
	//
	// Distance is computed as num - fract * den (with a single rounding), so the window doesn't
	// collapse when tolerance is below the resolution of fract; fract itself is always accepted.
	//
	// Runs of moves in the same direction are done in a single step. Consecutive iterations
	// alternate directions and denominators grow at least like Fibonacci numbers, so the loop
	// ends (with a result or with an overflow error) after at most ~sizeof(T) * 12 iterations.
	template <class T> Ex<Pair<T>> sternBrocotSearch(double fract, double tolerance) {
		using PT = Promote<T>;
		auto distance = [=](const PT &num, const PT &den) {
			return std::fma(-fract, double(den), double(num));
		};
		auto too_big = [=](const PT &num, const PT &den) {
			return distance(num, den) >= tolerance * double(den);
		};
		auto too_small = [=](const PT &num, const PT &den) {
			return distance(num, den) <= -tolerance * double(den);
		};

		PT lower_num = 0, lower_den = 1;
		PT upper_num = 1, upper_den = 1;

		while(true) {
			PT mid_num = lower_num + upper_num, mid_den = lower_den + upper_den;
			if(!fitsIn<T>(mid_den))
				return RATIONAL_ERROR(overflow, "Cannot approximate % with tolerance %: "
												"denominator doesn't fit in % bits",
									  fract, tolerance, int(sizeof(T) * 8));

			if(too_big(mid_num, mid_den)) {
				// upper = k * lower + upper
				auto k = jumpLength<T>(upper_num, upper_den, lower_num, lower_den, too_big);
				upper_num += k * lower_num;
				upper_den += k * lower_den;
			} else if(too_small(mid_num, mid_den)) {
				// lower = lower + k * upper
				auto k = jumpLength<T>(lower_num, lower_den, upper_num, upper_den, too_small);
				lower_num += k * upper_num;
				lower_den += k * upper_den;
			} else {
				return Pair<T>(T(mid_num), T(mid_den));
			}
		}
	}
}

TEMPLATE void TRATIONAL::fixDenominator() {
	if(m_den == T(0))
		FATAL("Rational with zero denominator: %lld/0", llint(m_num));
	if(m_num == std::numeric_limits<T>::min() || m_den == std::numeric_limits<T>::min())
		FATAL("Rational overflow while normalizing sign: %lld/%lld", llint(m_num), llint(m_den));
	m_num = -m_num;
	m_den = -m_den;
}

TEMPLATE Ex<TRATIONAL> TRATIONAL::make(T num, T den) {
	if(den == T(0))
		return RATIONAL_ERROR(zero_denominator, "Rational with zero denominator: %/0", num);
	if(den < T(0) &&
	   (num == std::numeric_limits<T>::min() || den == std::numeric_limits<T>::min()))
		return RATIONAL_ERROR(overflow, "Cannot normalize sign of rational: %/%", num, den);
	return Rational(num, den);
}

TEMPLATE Ex<TRATIONAL> TRATIONAL::parse(const string &text) {
	auto slash = text.find('/');
	bool valid = slash != string::npos && text.find('/', slash + 1) == string::npos;
	for(char c : text)
		if(isspace((unsigned char)c))
			valid = false;
	if(!valid)
		return RATIONAL_ERROR(malformed_text, "Invalid rational: \"%\" (expected: <int>/<int>)",
							  text);

	auto parsePart = [&](const string &part) -> Ex<T> {
		TextParser parser(part);
		auto value = parser.parseLong();
		if(!value || parser.hasAnythingLeft() || !fitsIn<T>(*value))
			return RATIONAL_ERROR(malformed_text, "Invalid integer \"%\" in rational \"%\"", part,
								  text);
		return T(*value);
	};

	auto num = EX_PASS(parsePart(text.substr(0, slash)));
	auto den = EX_PASS(parsePart(text.substr(slash + 1)));
	return make(num, den);
}

TEMPLATE Ex<TRATIONAL> TRATIONAL::approximate(double value, double tolerance) {
	if(!isFinite(value))
		return RATIONAL_ERROR(non_finite, "Cannot approximate non-finite value: %", value);
	if(!isFinite(tolerance) || tolerance <= 0.0)
		return RATIONAL_ERROR(invalid_tolerance, "Invalid approximation tolerance: %", tolerance);
	if(tolerance > 0.5)
		log(format("Approximation tolerance % is wider than 0.5; results will be integers",
				   tolerance),
			"frac.approximate.wide_tolerance");

	double int_part = std::floor(value);
	if(!(int_part >= double(std::numeric_limits<T>::min()) &&
		 int_part < double(std::numeric_limits<T>::max())))
		return RATIONAL_ERROR(overflow, "Value % doesn't fit in % bits", value,
							  int(sizeof(T) * 8));

	T whole = T(int_part);
	double fract = value - int_part;
	if(fract < tolerance)
		return Rational(whole, T(1));
	if(fract > 1.0 - tolerance)
		return Rational(T(whole + 1), T(1));

	auto [num, den] = EX_PASS(sternBrocotSearch<T>(fract, tolerance));
	PT out_num = PT(whole) * den + num;
	if(!fitsIn<T>(out_num))
		return RATIONAL_ERROR(overflow, "Approximation of % doesn't fit in % bits", value,
							  int(sizeof(T) * 8));
	return Rational(T(out_num), den);
}

TEMPLATE TRATIONAL TRATIONAL::reduced() const {
	u64 div = gcd(uabs(m_num), u64(m_den));
	if(div <= 1)
		return *this;
	return {T(llint(m_num) / llint(div)), T(llint(m_den) / llint(div)), no_sign_check};
}

TEMPLATE TRATIONAL TRATIONAL::operator+(const Rational &rhs) const {
	PT num = PT(m_num) * rhs.m_den + PT(rhs.m_num) * m_den;
	PT den = PT(m_den) * rhs.m_den;
	return {narrow<T>(num, "+"), narrow<T>(den, "+"), no_sign_check};
}

TEMPLATE TRATIONAL TRATIONAL::operator-(const Rational &rhs) const {
	PT num = PT(m_num) * rhs.m_den - PT(rhs.m_num) * m_den;
	PT den = PT(m_den) * rhs.m_den;
	return {narrow<T>(num, "-"), narrow<T>(den, "-"), no_sign_check};
}

TEMPLATE TRATIONAL TRATIONAL::operator*(const Rational &rhs) const {
	PT num = PT(m_num) * rhs.m_num;
	PT den = PT(m_den) * rhs.m_den;
	return {narrow<T>(num, "*"), narrow<T>(den, "*"), no_sign_check};
}

TEMPLATE TRATIONAL TRATIONAL::operator/(const Rational &rhs) const {
	PT num = PT(m_num) * rhs.m_den;
	PT den = PT(m_den) * rhs.m_num;
	return Rational(narrow<T>(num, "/"), narrow<T>(den, "/"));
}

TEMPLATE TRATIONAL TRATIONAL::operator-() const {
	return {narrow<T>(-PT(m_num), "-"), m_den, no_sign_check};
}

TEMPLATE int TRATIONAL::order(const Rational &rhs) const {
	PT lhs_value = PT(m_num) * rhs.m_den;
	PT rhs_value = PT(rhs.m_num) * m_den;
	return lhs_value < rhs_value ? -1 : lhs_value > rhs_value ? 1 : 0;
}

TEMPLATE bool TRATIONAL::operator==(const Rational &rhs) const {
	auto lhs_red = reduced(), rhs_red = rhs.reduced();
	return lhs_red.m_num == rhs_red.m_num && lhs_red.m_den == rhs_red.m_den;
}

TEMPLATE void TRATIONAL::operator>>(TextFormatter &out) const {
	auto red = reduced();
	out("%/%", red.m_num, red.m_den);
}

template class Rational<int>;
template class Rational<llint>;
}
