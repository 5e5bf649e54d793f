// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#pragma once

#include "frac/format.h"
#include "frac/sys/backtrace.h"

namespace frac {

struct ErrorLoc {
	const char *file = nullptr;
	int line = 0;

	bool operator==(const ErrorLoc &) const;
};

struct ErrorChunk {
	ErrorChunk(string message = {}) : message(move(message)) {}
	ErrorChunk(ErrorLoc loc, string message = {}) : message(move(message)), loc(loc) {}
	FRAC_COPYABLE_CLASS(ErrorChunk);

	bool operator==(const ErrorChunk &) const;
	bool empty() const { return message.empty() && !loc.file; }
	void operator>>(TextFormatter &) const;

	string message;
	ErrorLoc loc;
};

// Creates an error with formatted text
// Example: ERROR("Low-case string should be passed: %", str)
#define ERROR(...) frac::detail::makeError(__FILE__, __LINE__, frac::format(__VA_ARGS__))

// Like ERROR, but the created error is tagged with a kind name
// Example: ERROR_KIND("malformed_text", "Invalid input: '%'", str)
#define ERROR_KIND(kind, ...)                                                                      \
	frac::detail::makeError(__FILE__, __LINE__, frac::format(__VA_ARGS__), kind)

struct Error {
	using Chunk = ErrorChunk;

	Error(ErrorLoc, string message);
	Error(Chunk, Backtrace = {});
	Error(vector<Chunk>, Backtrace = {});
	Error();
	FRAC_COPYABLE_CLASS(Error);

	static Error merge(vector<Error>);

	void operator+=(const Chunk &);
	Error operator+(const Chunk &) const;
	bool operator==(const Error &) const;

	void print() const;
	bool empty() const { return chunks.empty() && !backtrace; }

	void operator>>(TextFormatter &) const;

	vector<Chunk> chunks;
	Backtrace backtrace;

	// Empty for errors which don't carry any particular kind
	string kind;
};

namespace detail {
	Error makeError(const char *file, int line, string message, string kind = {});
}
}
