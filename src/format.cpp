// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#include "frac/format.h"

#include <cstdio>
#include <cstdlib>
#include <stdarg.h>

namespace frac {

TextFormatter::TextFormatter(int capacity) {
	DASSERT(capacity > 0);
	m_data.reserve(capacity);
}

TextFormatter::TextFormatter(const TextFormatter &) = default;
TextFormatter::~TextFormatter() = default;

void TextFormatter::trim(int count) {
	DASSERT(count >= 0);
	m_data.resize(count >= size() ? 0 : size() - count);
}

void TextFormatter::clear() { m_data.clear(); }

static int countPercents(const char *ptr) {
	int out = 0;
	char prev = 0;
	while(*ptr) {
		if(*ptr == '%' && prev != '\\')
			out++;
		prev = *ptr++;
	}
	return out;
}

void TextFormatter::checkArgCount(const char *format_str, int arg_count) {
	DASSERT(format_str);
	int num_percent = countPercents(format_str);
	if(num_percent != arg_count)
		FATAL("Invalid nr of arguments passed: %d, expected: %d\nFormat string: \"%s\"", arg_count,
			  num_percent, format_str);
}

const char *TextFormatter::nextElement(const char *format_str) {
	while(*format_str) {
		if(format_str[0] == '\\' && format_str[1] == '%') {
			m_data += '%';
			format_str += 2;
			continue;
		}
		if(*format_str == '%')
			return format_str + 1;
		m_data += *format_str++;
	}
	return format_str;
}

void TextFormatter::finish(const char *format_str) {
	while(*format_str) {
		if(format_str[0] == '\\' && format_str[1] == '%') {
			m_data += '%';
			format_str += 2;
		} else {
			m_data += *format_str++;
		}
	}
}

void TextFormatter::stdFormat(const char *format, ...) {
	va_list ap, ap_copy;
	va_start(ap, format);
	va_copy(ap_copy, ap);
	int length = vsnprintf(nullptr, 0, format, ap);
	va_end(ap);

	if(length > 0) {
		int offset = size();
		m_data.resize(offset + length + 1);
		vsnprintf(&m_data[offset], length + 1, format, ap_copy);
		m_data.resize(offset + length);
	}
	va_end(ap_copy);
}

TextFormatter &TextFormatter::operator<<(const char *str) {
	DASSERT(str);
	m_data += str;
	return *this;
}

TextFormatter &TextFormatter::operator<<(const string &str) {
	m_data += str;
	return *this;
}

TextFormatter &TextFormatter::operator<<(char c) {
	m_data += c;
	return *this;
}

TextFormatter &TextFormatter::operator<<(bool value) { return *this << (value ? "true" : "false"); }

// Shortest representation which parses back to the same value
TextFormatter &TextFormatter::operator<<(double value) {
	char buffer[64];
	for(int precision = 1; precision <= 17; precision++) {
		snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
		if(strtod(buffer, nullptr) == value || value != value)
			break;
	}
	return *this << buffer;
}

TextFormatter &TextFormatter::operator<<(float value) { return *this << double(value); }

#define FORMAT_INTEGER(type, spec)                                                                 \
	TextFormatter &TextFormatter::operator<<(type value) {                                         \
		char buffer[32];                                                                           \
		snprintf(buffer, sizeof(buffer), spec, value);                                             \
		return *this << buffer;                                                                    \
	}

FORMAT_INTEGER(int, "%d")
FORMAT_INTEGER(unsigned int, "%u")
FORMAT_INTEGER(long, "%ld")
FORMAT_INTEGER(unsigned long, "%lu")
FORMAT_INTEGER(long long, "%lld")
FORMAT_INTEGER(unsigned long long, "%llu")

#undef FORMAT_INTEGER

string stdFormat(const char *format, ...) {
	va_list ap;
	va_start(ap, format);
	int length = vsnprintf(nullptr, 0, format, ap);
	va_end(ap);

	string out(length > 0 ? length : 0, '\0');
	if(length > 0) {
		va_start(ap, format);
		vsnprintf(&out[0], length + 1, format, ap);
		va_end(ap);
	}
	return out;
}

namespace detail {
	void printText(const string &text) {
		fputs(text.c_str(), stdout);
		fflush(stdout);
	}
}
}
