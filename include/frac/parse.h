// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#pragma once

#include "frac/sys/expected.h"

namespace frac {

// Parses whitespace-separated elements from a null-terminated string.
// Failed parse leaves the parser position unchanged.
class TextParser {
  public:
	TextParser(const char *input) : m_current(input) { DASSERT(input); }
	TextParser(const string &input) : TextParser(input.c_str()) {}

	// Accepts optional sign followed by decimal digits; rejects values outside of 64-bit range
	Ex<llint> parseLong();
	Ex<double> parseDouble();
	Ex<string> parseString();

	int countElements() const;
	bool hasAnythingLeft();
	bool isFinished() const { return !*m_current; }
	const char *current() const { return m_current; }

  private:
	const char *m_current;
};
}
