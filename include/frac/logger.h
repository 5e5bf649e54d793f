// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#pragma once

#include "frac/sys_base.h"

#include <unordered_set>

namespace frac {

// Prints messages; messages with a unique key are printed only once
class Logger {
  public:
	Logger();
	FRAC_COPYABLE_CLASS(Logger);

	void addMessage(const string &, const string &unique_key);
	bool keyPresent(const string &) const;

  private:
	std::unordered_set<string> m_keys;
};
}
