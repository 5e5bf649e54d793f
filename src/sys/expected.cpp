// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#include "frac/sys/expected.h"

#include "frac/sys/error.h"

namespace frac {
namespace detail {
	Error expectMakeError(const char *expr, const char *file, int line) {
		return Error(ErrorLoc{file, line}, format("Failed: %", expr));
	}
}
}
