// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#pragma once

#include "frac/sys_base.h"

namespace frac {

struct BacktraceInfo {
	string file, function;
	int line = 0;
};

string demangle(string);

// fast: symbol names only (backtrace_symbols)
// full: additionally resolves file:line with addr2line
enum class BacktraceMode { disabled, fast, full };

class Backtrace {
  public:
	using Mode = BacktraceMode;

	Backtrace(vector<void *> addrs, Mode mode = Mode::fast)
		: m_addresses(move(addrs)), m_mode(mode) {}
	Backtrace() = default;

	static inline thread_local Mode t_default_mode = Mode::fast;

	static Backtrace get(int skip = 0, Mode mode = t_default_mode);

	vector<BacktraceInfo> analyze() const;

	string format() const;
	static string format(vector<BacktraceInfo>);

	explicit operator bool() const { return !m_addresses.empty(); }
	int size() const { return int(m_addresses.size()); }
	bool empty() const { return m_addresses.empty(); }

	bool operator==(const Backtrace &rhs) const { return m_addresses == rhs.m_addresses; }
	void operator>>(TextFormatter &) const;

  private:
	vector<void *> m_addresses;
	Mode m_mode = Mode::disabled;
};
}
