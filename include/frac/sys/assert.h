// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#pragma once

#include "frac/format.h"

namespace frac {

namespace detail {
	[[noreturn]] void assertBinaryFailed(const char *file, int line, const char *expr,
										 const string &value1, const string &value2);

	template <class T1, class T2>
	[[noreturn]] NOINLINE void assertBinaryFailed(const char *file, int line, const char *expr,
												  const T1 &value1, const T2 &value2) {
		assertBinaryFailed(file, line, expr, toString(value1), toString(value2));
	}
}

// On failure both values are printed
#define ASSERT_BINARY(e1, e2, op)                                                                  \
	((__builtin_expect(!!((e1)op(e2)), true)) ||                                                   \
	 (frac::detail::assertBinaryFailed(__FILE__, __LINE__, FRAC_STRINGIZE(e1 op e2), e1, e2), 0))

#define ASSERT_EQ(expr1, expr2) ASSERT_BINARY(expr1, expr2, ==)
#define ASSERT_NE(expr1, expr2) ASSERT_BINARY(expr1, expr2, !=)
#define ASSERT_GT(expr1, expr2) ASSERT_BINARY(expr1, expr2, >)
#define ASSERT_LT(expr1, expr2) ASSERT_BINARY(expr1, expr2, <)
#define ASSERT_LE(expr1, expr2) ASSERT_BINARY(expr1, expr2, <=)
#define ASSERT_GE(expr1, expr2) ASSERT_BINARY(expr1, expr2, >=)
}
