// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#include "frac/sys/assert.h"
#include "frac/sys/backtrace.h"
#include "frac/sys/error.h"

#include <cstdio>
#include <cstdlib>
#include <stdarg.h>

namespace frac {

static thread_local bool t_fail_protect = false;

static Error failMakeError(const char *file, int line, const char *message) {
	if(t_fail_protect) {
		printf("%s:%d: %s\nFATAL ERROR in libfrac (error within an error)\n", file, line, message);
		fflush(stdout);
		exit(1);
	}

	t_fail_protect = true;
	auto bt = Backtrace::get(2);
	Error out(ErrorChunk(ErrorLoc{file, line}, message), move(bt));
	t_fail_protect = false;
	return out;
}

void fatalError(const char *file, int line, const char *fmt, ...) {
	char buffer[4096], *bptr = buffer;
	bptr += snprintf(buffer, sizeof(buffer), "FATAL: ");

	va_list ap;
	va_start(ap, fmt);
	vsnprintf(bptr, sizeof(buffer) - (bptr - buffer), fmt, ap);
	va_end(ap);

	failMakeError(file, line, buffer).print();
	exit(1);
}

void fatalError(const Error &error) {
	error.print();
	exit(1);
}

void assertFailed(const char *file, int line, const char *text) {
	char buffer[4096];
	snprintf(buffer, sizeof(buffer), "Assertion failed: %s", text);
	failMakeError(file, line, buffer).print();
	exit(1);
}

namespace detail {
	void assertBinaryFailed(const char *file, int line, const char *expr, const string &value1,
							const string &value2) {
		auto message = stdFormat("Assertion failed: %s\n  left:  %s\n  right: %s", expr,
								 value1.c_str(), value2.c_str());
		failMakeError(file, line, message.c_str()).print();
		exit(1);
	}
}
}
