// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#include "testing.h"

#include "frac/math/gcd.h"
#include "frac/math/rational.h"

#include <random>

constexpr llint max_llint = std::numeric_limits<llint>::max();
constexpr llint min_llint = std::numeric_limits<llint>::min();

void testGcd() {
	ASSERT_EQ(gcd(12, 18), 6);
	ASSERT_EQ(gcd(0, 5), 5);
	ASSERT_EQ(gcd(7, 0), 7);
	ASSERT_EQ(gcd(0, 0), 0);
	ASSERT_EQ(gcd(17, 17), 17);
	ASSERT_EQ(gcd(13, 8), 1);
	ASSERT_EQ(gcd(48ll, 180ll), 12ll);
	ASSERT_EQ(gcd(u64(1) << 63, u64(3) << 62), u64(1) << 62);
	ASSERT_EQ(gcd(u64(max_llint), u64(max_llint)), u64(max_llint));

	ASSERT_EQ(gcd(vector<int>{12, 18, 30}), 6);
	ASSERT_EQ(gcd(vector<int>{7, 14, 9}), 1);
	ASSERT_EQ(gcd(vector<int>{}), 0);

	std::mt19937_64 random(1234);
	std::uniform_int_distribution<llint> dist(0, 1000000000000ll);
	for(int n = 0; n < 10000; n++) {
		llint a = dist(random), b = dist(random);
		if(n % 4 == 0) {
			llint common = dist(random) % 100000 + 1;
			a = a % 1000000 * common;
			b = b % 1000000 * common;
		}
		ASSERT_EQ(gcd(a, b), gcdEuclid(a, b));
	}
}

void testConstruction() {
	RatL r1(2, -4);
	ASSERT_EQ(r1.num(), -2);
	ASSERT_EQ(r1.den(), 4);

	RatL r2(-3, -9);
	ASSERT_EQ(r2.num(), 3);
	ASSERT_EQ(r2.den(), 9);

	RatL r3(5);
	ASSERT_EQ(r3.num(), 5);
	ASSERT_EQ(r3.den(), 1);
	ASSERT(r3.isInteger());
	ASSERT(RatL(6, 3).isInteger());
	ASSERT(!RatL(6, 4).isInteger());

	ASSERT_EQ(RatL().num(), 0);
	ASSERT_EQ(RatL().den(), 1);
	ASSERT_EQ(double(RatL(1, 4)), 0.25);
	ASSERT_EQ(RatL(-3, 8).toDouble(), -0.375);

	auto made = RatL::make(3, -6);
	ASSERT(made);
	ASSERT_EQ(made->num(), -3);
	ASSERT_EQ(made->den(), 6);

	auto zero_den = RatL::make(1, 0);
	ASSERT(!zero_den);
	ASSERT_EQ(errorKind(zero_den.error()), RationalError::zero_denominator);
	ASSERT_EQ(errorKind(RatL::make(min_llint, -1).error()), RationalError::overflow);
	ASSERT_EQ(errorKind(RatL::make(1, min_llint).error()), RationalError::overflow);
	ASSERT(RatL::make(min_llint, 1));
}

void testReduction() {
	auto r1 = RatL(6, 8).reduced();
	ASSERT_EQ(r1.num(), 3);
	ASSERT_EQ(r1.den(), 4);

	auto r2 = RatL(0, 5).reduced();
	ASSERT_EQ(r2.num(), 0);
	ASSERT_EQ(r2.den(), 1);

	auto r3 = RatL(-6, 8).reduced();
	ASSERT_EQ(r3.num(), -3);
	ASSERT_EQ(r3.den(), 4);

	// reduced() doesn't modify the source
	RatL r4(10, 20);
	(void)r4.reduced();
	ASSERT_EQ(r4.num(), 10);

	auto r5 = RatL(min_llint, 2).reduced();
	ASSERT_EQ(r5.num(), min_llint / 2);
	ASSERT_EQ(r5.den(), 1);

	std::mt19937_64 random(42);
	std::uniform_int_distribution<llint> num_dist(-1000000, 1000000), den_dist(-1000000, 1000000);
	for(int n = 0; n < 10000; n++) {
		llint num = num_dist(random), den = den_dist(random);
		if(den == 0)
			continue;
		auto red = RatL(num, den).reduced();
		ASSERT_GT(red.den(), 0);
		ASSERT_EQ(gcd(uabs(red.num()), u64(red.den())), u64(1));
		ASSERT_EQ(red, RatL(num, den));
	}
}

void testEquality() {
	ASSERT_EQ(RatL(1, 2), RatL(2, 4));
	ASSERT_EQ(RatL(-1, 2), RatL(1, -2));
	ASSERT_EQ(RatL(0, 3), RatL(0, 7));
	ASSERT_NE(RatL(1, 2), RatL(1, 3));
	ASSERT_NE(RatL(1, 2), RatL(-1, 2));
	ASSERT_EQ(RatL(4, 2), 2);

	std::mt19937_64 random(7);
	std::uniform_int_distribution<llint> dist(-100000, 100000), scale_dist(1, 1000);
	for(int n = 0; n < 1000; n++) {
		llint num = dist(random), den = dist(random), scale = scale_dist(random);
		if(den == 0)
			continue;
		RatL value(num, den), scaled(num * scale, den * scale);
		ASSERT(value == value);
		ASSERT_EQ(value, scaled);
		ASSERT_EQ(scaled, value);
	}
}

void testOrdering() {
	ASSERT_LT(RatL(1, 3), RatL(1, 2));
	ASSERT_LT(RatL(-1, 2), RatL(1, 3));
	ASSERT_LT(RatL(-1, 2), RatL(-1, 3));
	ASSERT_LE(RatL(2, 4), RatL(1, 2));
	ASSERT_GE(RatL(2, 4), RatL(1, 2));
	ASSERT_GT(RatL(7, 3), 2);
	ASSERT_EQ(RatL(2, 4).order(RatL(1, 2)), 0);
	ASSERT_EQ(RatL(1, 4).order(RatL(1, 2)), -1);
	ASSERT_EQ(RatL(3, 4).order(RatL(1, 2)), 1);

	// Values which are equal as doubles are still ordered correctly
	RatL close1(max_llint - 1, max_llint), close2(max_llint - 2, max_llint - 1);
	ASSERT_EQ(double(close1), double(close2));
	ASSERT_GT(close1, close2);
	ASSERT_LT(close2, close1);

	// Above 2^53 doubles may even order values the other way
	llint p53 = 1ll << 53;
	RatL below(p53 - 1, p53), above(p53 + 1, p53 + 2);
	ASSERT_LT(below, above);
	ASSERT(!(double(below) < double(above)));

	std::mt19937_64 random(123);
	std::uniform_int_distribution<llint> num_dist(-1000, 1000), den_dist(1, 1000);
	for(int n = 0; n < 10000; n++) {
		RatL a(num_dist(random), den_dist(random));
		RatL b(num_dist(random), den_dist(random));
		double da = double(a), db = double(b);
		if(da == db)
			ASSERT_EQ(a, b);
		else
			ASSERT_EQ(a < b, da < db);
		ASSERT_EQ(a.order(b), -b.order(a));
	}
}

void testArithmetic() {
	auto sum = RatL(1, 2) + RatL(1, 2);
	ASSERT_EQ(sum, RatL(1, 1));
	ASSERT_EQ(sum.num(), 4);
	ASSERT_EQ(sum.den(), 4);

	ASSERT_EQ(RatL(1, 2) - RatL(1, 2), RatL(0, 5));
	ASSERT_EQ(RatL(1, 2) * RatL(3, 4), RatL(3, 8));
	ASSERT_EQ(RatL(1, 2) / RatL(3, 4), RatL(4, 6));
	ASSERT_EQ(RatL(1, 3) - RatL(1, 2), RatL(-1, 6));

	auto quot = RatL(1, 2) / RatL(-3, 4);
	ASSERT_EQ(quot, RatL(-2, 3));
	ASSERT_GT(quot.den(), 0);

	ASSERT_EQ(-RatL(3, 5), RatL(-3, 5));
	ASSERT_EQ(-RatL(0, 5), RatL(0, 1));
	ASSERT_EQ(RatL(5, 3) + 1, RatL(8, 3));

	ASSERT_EQ(RatI(1, 3) + RatI(1, 6), RatI(1, 2));
	ASSERT_EQ(RatI(46341, 1) * RatI(46340, 1), RatI(2147441940));

	RatL big(max_llint / 3, max_llint / 2);
	ASSERT_EQ(big * RatL(1, 1), big);
	ASSERT_LT(big, big + RatL(1, 1));
}

void testFatalFaults() {
	for(llint num : {-5ll, 0ll, 7ll, max_llint})
		ASSERT_FATAL(RatL(num, 0));
	ASSERT_FATAL(RatI(1, 0));
	ASSERT_FATAL(RatL(1, 2) / RatL(0, 3));
	ASSERT_FATAL(RatL(min_llint, -1));
	ASSERT_FATAL(RatL(max_llint, 1) + RatL(1, 1));
	ASSERT_FATAL(RatL(max_llint, 1) * RatL(2, 1));
	ASSERT_FATAL(RatL(1, max_llint) * RatL(1, 2));
	ASSERT_FATAL(-RatL(min_llint, 1));
	ASSERT_FATAL(RatI(1 << 30, 1) + RatI(1 << 30, 1));
	ASSERT_FATAL(RatL::make(1, 0).get());
}

void testParsing() {
	ASSERT_EQ(RatL::parse("3/4").get(), RatL(3, 4));
	ASSERT_EQ(RatL::parse("-3/4").get(), RatL(-3, 4));
	ASSERT_EQ(RatL::parse("+3/4").get(), RatL(3, 4));
	ASSERT_EQ(RatL::parse("3/-4").get(), RatL(-3, 4));
	ASSERT_EQ(RatL::parse("0/5").get(), RatL(0, 1));
	ASSERT_EQ(RatL::parse("9223372036854775807/1").get(), RatL(max_llint));
	ASSERT_EQ(RatI::parse("-7/3").get(), RatI(-7, 3));

	// Parsed values are not reduced
	auto parsed = RatL::parse("6/8");
	ASSERT_EQ(parsed->num(), 6);
	ASSERT_EQ(parsed->den(), 8);

	for(const char *text : {"", "1", "/", "1/2/3", "a/2", "1 /2", " 1/2", "1/2 ", "1/", "/2",
							"1/2x", "1.5/2", "--1/2", "1/+", "0x10/2", "9223372036854775808/1"})
		ASSERT_EQ(errorKind(RatL::parse(text).error()), RationalError::malformed_text);
	ASSERT_EQ(errorKind(RatI::parse("3000000000/1").error()), RationalError::malformed_text);

	ASSERT_EQ(errorKind(RatL::parse("3/0").error()), RationalError::zero_denominator);
	ASSERT_EQ(errorKind(RatL::parse("0/0").error()), RationalError::zero_denominator);
	ASSERT_FAIL(RatL::parse("1,2"));

	ASSERT_EQ(toString(RatL(2, 4)), "1/2");
	ASSERT_EQ(toString(RatL(4, 2)), "2/1");
	ASSERT_EQ(toString(RatL(0, 7)), "0/1");
	ASSERT_EQ(toString(RatL(3, -6)), "-1/2");
	ASSERT_EQ(format("[%]", RatI(10, 15)), "[2/3]");

	std::mt19937_64 random(99);
	std::uniform_int_distribution<llint> num_dist(min_llint, max_llint), den_dist(1, max_llint);
	for(int n = 0; n < 1000; n++) {
		RatL value(num_dist(random), den_dist(random));
		ASSERT_EQ(RatL::parse(toString(value)).get(), value);
	}
}

void testApproximation() {
	auto pi1 = RatL::approximate(3.1415926, 0.01).get();
	ASSERT_EQ(pi1.num(), 22);
	ASSERT_EQ(pi1.den(), 7);

	auto pi2 = RatL::approximate(pi, 0.00001).get();
	ASSERT_EQ(pi2.num(), 355);
	ASSERT_EQ(pi2.den(), 113);
	ASSERT_EQ(RatI::approximate(pi, 0.00001).get(), RatI(355, 113));

	ASSERT_EQ(RatL::approximate(0.5, 0.1).get(), RatL(1, 2));
	ASSERT_EQ(RatL::approximate(0.75, 0.01).get(), RatL(3, 4));
	ASSERT_EQ(RatL::approximate(0.333333, 0.001).get(), RatL(1, 3));
	ASSERT_EQ(RatL::approximate(1.0 / 7.0, 1e-9).get(), RatL(1, 7));

	auto negative = RatL::approximate(-0.5, 0.1).get();
	ASSERT_EQ(negative.num(), -1);
	ASSERT_EQ(negative.den(), 2);
	ASSERT_EQ(RatL::approximate(-2.25, 0.01).get(), RatL(-9, 4));

	// Values close to integers
	for(auto [value, expected] : {Pair<double, llint>{5.0, 5}, {2.999, 3}, {2.005, 2}, {-3.0, -3},
								  {-2.999, -3}, {0.0, 0}, {0.995, 1}}) {
		auto result = RatL::approximate(value, 0.01).get();
		ASSERT_EQ(result.num(), expected);
		ASSERT_EQ(result.den(), 1);
	}

	std::mt19937_64 random(2024);
	std::uniform_real_distribution<double> value_dist(-100.0, 100.0);
	for(double tolerance : {0.3, 0.1, 0.01, 1e-4, 1e-6, 1e-9, 1e-12}) {
		for(int n = 0; n < 1000; n++) {
			double value = value_dist(random);
			auto result = RatL::approximate(value, tolerance).get();
			ASSERT_LE(std::fabs(result.toDouble() - value), tolerance + 1e-13);
			ASSERT_GT(result.den(), 0);
			ASSERT_EQ(gcd(uabs(result.num()), u64(result.den())), u64(1));
		}
	}

	// No fraction with denominator smaller than the result fits in the window
	for(int n = 0; n < 200; n++) {
		double value = value_dist(random), tolerance = 0.001;
		auto result = RatL::approximate(value, tolerance).get();
		for(llint den = 1; den < result.den(); den++) {
			double scaled = value * double(den);
			for(double num : {std::floor(scaled), std::ceil(scaled)})
				ASSERT_GE(std::fabs(num / double(den) - value), tolerance);
		}
	}

	auto expectError = [](auto result, RationalError kind) {
		ASSERT(!result);
		ASSERT_EQ(errorKind(result.error()), kind);
	};
	double inf = std::numeric_limits<double>::infinity();
	double nan = std::numeric_limits<double>::quiet_NaN();

	expectError(RatL::approximate(nan, 0.1), RationalError::non_finite);
	expectError(RatL::approximate(inf, 0.1), RationalError::non_finite);
	expectError(RatL::approximate(-inf, 0.1), RationalError::non_finite);
	expectError(RatL::approximate(1.5, 0.0), RationalError::invalid_tolerance);
	expectError(RatL::approximate(1.5, -0.1), RationalError::invalid_tolerance);
	expectError(RatL::approximate(1.5, nan), RationalError::invalid_tolerance);
	expectError(RatL::approximate(1.5, inf), RationalError::invalid_tolerance);
	expectError(RatL::approximate(1e30, 0.1), RationalError::overflow);
	expectError(RatL::approximate(-1e30, 0.1), RationalError::overflow);
	expectError(RatI::approximate(3e9, 0.1), RationalError::overflow);
	expectError(RatI::approximate(0.5 + 1e-12, 1e-15), RationalError::overflow);

	// Mediants lying exactly on the window bounds are rejected
	ASSERT_EQ(RatL::approximate(0.75, 0.25).get(), RatL(2, 3));
	auto above_bound = RatL::approximate(2.25, 0.25).get();
	ASSERT_EQ(above_bound.num(), 7);
	ASSERT_EQ(above_bound.den(), 3);
	ASSERT_EQ(RatL::approximate(0.5, 0.25).get(), RatL(1, 2));
	ASSERT_EQ(RatL::approximate(-0.75, 0.25).get(), RatL(-2, 3));

	// Tolerances below the resolution of the value
	ASSERT_EQ(RatL::approximate(0.5, 1e-17).get(), RatL(1, 2));
	ASSERT_EQ(RatI::approximate(0.5, 1e-17).get(), RatI(1, 2));
	ASSERT_EQ(RatL::approximate(0.25, 5e-324).get(), RatL(1, 4));
	ASSERT_EQ(RatL::approximate(3.375, 1e-300).get(), RatL(27, 8));
	for(auto [value, tolerance] : {Pair<double>{0.1, 1e-18}, {1.0 / 3.0, 1e-17}, {0.7, 5e-324},
								   {0.999999, 1e-17}, {0.3, 1e-17}, {pi, 1e-20}}) {
		auto result = RatL::approximate(value, tolerance);
		if(result)
			ASSERT_LE(std::fabs(result->toDouble() - value), 1e-15);
		else
			ASSERT_EQ(errorKind(result.error()), RationalError::overflow);

		auto small_result = RatI::approximate(value, tolerance);
		if(small_result)
			ASSERT_LE(std::fabs(small_result->toDouble() - value), 1e-9);
		else
			ASSERT_EQ(errorKind(small_result.error()), RationalError::overflow);
	}

	ASSERT_EQ(RatL::approximate(2.3, 0.7).get(), RatL(2));
	ASSERT(logKeyPresent("frac.approximate.wide_tolerance"));
}

void testMain() {
	testGcd();
	testConstruction();
	testReduction();
	testEquality();
	testOrdering();
	testArithmetic();
	testFatalFaults();
	testParsing();
	testApproximation();
}
