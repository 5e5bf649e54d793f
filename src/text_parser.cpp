// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#include "frac/parse.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace frac {

namespace {

	Error parseError(const char *input, const char *type_name) NOINLINE;
	Error parseError(const char *input, const char *type_name) {
		size_t max_len = 32;
		string short_input =
			strlen(input) > max_len ? string(input, input + max_len) + "..." : string(input);
		return ERROR("Error while parsing % from \"%\"", type_name, short_input);
	}

	const char *skipSpaces(const char *ptr) {
		while(isspace((unsigned char)*ptr))
			ptr++;
		return ptr;
	}

	bool isIntegerStart(const char *ptr) {
		if(*ptr == '-' || *ptr == '+')
			ptr++;
		return isdigit((unsigned char)*ptr);
	}
}

Ex<llint> TextParser::parseLong() {
	const char *start = skipSpaces(m_current);
	if(!isIntegerStart(start))
		return parseError(m_current, "long");

	char *end_ptr = nullptr;
	errno = 0;
	llint value = ::strtoll(start, &end_ptr, 10);
	if(errno != 0 || end_ptr == start)
		return parseError(m_current, "long");
	m_current = end_ptr;
	return value;
}

Ex<double> TextParser::parseDouble() {
	const char *start = skipSpaces(m_current);
	char *end_ptr = nullptr;
	errno = 0;
	double value = ::strtod(start, &end_ptr);
	if(errno != 0 || end_ptr == start)
		return parseError(m_current, "double");
	m_current = end_ptr;
	return value;
}

Ex<string> TextParser::parseString() {
	const char *start = skipSpaces(m_current);
	if(!*start)
		return parseError(m_current, "string");
	const char *end = start;
	while(*end && !isspace((unsigned char)*end))
		end++;
	m_current = end;
	return string(start, end);
}

int TextParser::countElements() const {
	int count = 0;
	const char *ptr = m_current;
	while(*ptr) {
		while(isspace((unsigned char)*ptr))
			ptr++;
		if(*ptr) {
			count++;
			while(*ptr && !isspace((unsigned char)*ptr))
				ptr++;
		}
	}
	return count;
}

bool TextParser::hasAnythingLeft() {
	m_current = skipSpaces(m_current);
	return !isFinished();
}
}
