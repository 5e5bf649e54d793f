// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#ifndef FRAC_FORMAT_H
#define FRAC_FORMAT_H

#include "frac/sys_base.h"

namespace frac {

template <class T>
concept c_right_formattible = requires(const T &value, TextFormatter &out) { value >> out; };

// To make new type formattible provide the following member:
// void MyNewType::operator>>(TextFormatter&) const;
//
// Format strings use '%' as a placeholder for consecutive arguments; "\\%" is a literal '%'.
class TextFormatter {
  public:
	explicit TextFormatter(int capacity = 256);
	TextFormatter(const TextFormatter &);
	~TextFormatter();

	TextFormatter &operator<<(const char *);
	TextFormatter &operator<<(const string &);

	// char is treated as a single character, not like a number!
	TextFormatter &operator<<(char);

	TextFormatter &operator<<(bool);
	TextFormatter &operator<<(double);
	TextFormatter &operator<<(float);
	TextFormatter &operator<<(int);
	TextFormatter &operator<<(unsigned int);
	TextFormatter &operator<<(long);
	TextFormatter &operator<<(unsigned long);
	TextFormatter &operator<<(long long);
	TextFormatter &operator<<(unsigned long long);

	template <class T>
		requires(c_right_formattible<T>)
	TextFormatter &operator<<(const T &rhs) {
		rhs >> *this;
		return *this;
	}

	template <class T> TextFormatter &operator<<(const vector<T> &values) {
		for(int n = 0; n < int(values.size()); n++) {
			if(n > 0)
				*this << ' ';
			*this << values[n];
		}
		return *this;
	}

	template <class... T> void operator()(const char *format_str, const T &...args) {
		IF_DEBUG(checkArgCount(format_str, int(sizeof...(T))));
		((format_str = nextElement(format_str), (*this << args)), ...);
		finish(format_str);
	}

	void stdFormat(const char *format, ...) ATTRIB_PRINTF(2, 3);

	void trim(int count);
	void clear();

	const char *c_str() const & { return m_data.c_str(); }
	const string &text() const & { return m_data; }
	int size() const { return int(m_data.size()); }
	bool empty() const { return m_data.empty(); }

  private:
	static void checkArgCount(const char *format_str, int arg_count);
	const char *nextElement(const char *format_str);
	void finish(const char *format_str);

	string m_data;
};

namespace detail {
	void printText(const string &);
}

string stdFormat(const char *format, ...) ATTRIB_PRINTF(1, 2);

template <class... T> string format(const char *str, const T &...args) {
	TextFormatter out;
	out(str, args...);
	return out.text();
}

template <class... T> void print(const char *str, const T &...args) {
	TextFormatter out(1024);
	out(str, args...);
	detail::printText(out.text());
}

template <class T> string toString(const T &value) {
	TextFormatter out;
	out << value;
	return out.text();
}
}

#endif
