// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#include "frac/sys/error.h"

#include "frac/format.h"
#include "frac/sys/backtrace.h"

namespace frac {

bool ErrorLoc::operator==(const ErrorLoc &rhs) const {
	return line == rhs.line && (file == rhs.file || (file && rhs.file && strcmp(file, rhs.file) == 0));
}

FRAC_COPYABLE_CLASS_IMPL(ErrorChunk)

bool ErrorChunk::operator==(const ErrorChunk &rhs) const {
	return message == rhs.message && loc == rhs.loc;
}

void ErrorChunk::operator>>(TextFormatter &out) const {
	if(loc.file)
		out("%:%%", loc.file, loc.line, message.empty() ? "\n" : ": ");
	if(!message.empty())
		out("%\n", message);
}

Error::Error(ErrorLoc loc, string message) { chunks.emplace_back(loc, move(message)); }

Error::Error(Chunk chunk, Backtrace bt) : backtrace(move(bt)) { chunks.emplace_back(move(chunk)); }
Error::Error(vector<Chunk> chunks, Backtrace bt) : chunks(move(chunks)), backtrace(move(bt)) {}
Error::Error() = default;

FRAC_COPYABLE_CLASS_IMPL(Error)

bool Error::operator==(const Error &rhs) const { return chunks == rhs.chunks && kind == rhs.kind; }

void Error::operator+=(const Chunk &chunk) { chunks.emplace_back(chunk); }

Error Error::operator+(const Chunk &chunk) const {
	auto out = *this;
	out.chunks.emplace_back(chunk);
	return out;
}

void Error::operator>>(TextFormatter &out) const {
	for(auto &chunk : chunks)
		out << chunk;
	if(backtrace)
		out("%\n", backtrace);
}

// Kind of the first tagged error is kept
Error Error::merge(vector<Error> list) {
	DASSERT(!list.empty());
	if(list.size() == 1)
		return move(list[0]);

	Error out;
	for(auto &err : list) {
		for(auto &chunk : err.chunks)
			out.chunks.emplace_back(chunk);
		if(err.backtrace)
			out.chunks.emplace_back(err.backtrace.format());
		if(out.kind.empty())
			out.kind = err.kind;
	}
	return out;
}

void Error::print() const { frac::print("%\n", *this); }

namespace detail {
	Error makeError(const char *file, int line, string message, string kind) {
		Error out(ErrorLoc{file, line}, move(message));
		out.kind = move(kind);
		return out;
	}
}
}
