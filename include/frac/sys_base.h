// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#pragma once

#include <algorithm>
#include <array>
#include <cstring>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#define NOINLINE __attribute__((noinline))

#ifdef __clang__
#define ATTRIB_PRINTF(fmt, next) __attribute__((__format__(__printf__, fmt, next)))
#else
#define ATTRIB_PRINTF(fmt, next)
#endif

#define FRAC_MOVABLE_CLASS(Class)                                                                  \
	~Class();                                                                                      \
	Class(const Class &) = delete;                                                                 \
	Class(Class &&);                                                                               \
	Class &operator=(const Class &) = delete;                                                      \
	Class &operator=(Class &&);

#define FRAC_MOVABLE_CLASS_IMPL(Class)                                                             \
	Class::~Class() = default;                                                                     \
	Class::Class(Class &&) = default;                                                              \
	Class &Class::operator=(Class &&) = default;

#define FRAC_COPYABLE_CLASS(Class)                                                                 \
	~Class();                                                                                      \
	Class(const Class &);                                                                          \
	Class(Class &&);                                                                               \
	Class &operator=(const Class &);                                                               \
	Class &operator=(Class &&);

#define FRAC_COPYABLE_CLASS_IMPL(Class)                                                            \
	FRAC_MOVABLE_CLASS_IMPL(Class)                                                                 \
	Class::Class(const Class &) = default;                                                         \
	Class &Class::operator=(const Class &) = default;

#define FRAC_STRINGIZE(...) FRAC_STRINGIZE_(__VA_ARGS__)
#define FRAC_STRINGIZE_(...) #__VA_ARGS__

namespace frac {

using std::array;
using std::move;
using std::string;
using std::swap;
using std::vector;

template <class T1, class T2 = T1> using Pair = std::pair<T1, T2>;

using u64 = unsigned long long;
using llint = long long;

template <class T1, class T2> constexpr bool is_same = std::is_same<T1, T2>::value;
template <class T> constexpr bool is_integral = std::is_integral<T>::value;

struct NoSignCheck {};
constexpr NoSignCheck no_sign_check;

template <class> class Expected;
template <class T> using Ex = Expected<T>;

struct ErrorChunk;
struct Error;

class Backtrace;
class TextFormatter;
class TextParser;

[[noreturn]] void fatalError(const char *file, int line, const char *fmt, ...) ATTRIB_PRINTF(3, 4);
[[noreturn]] void fatalError(const Error &);
[[noreturn]] void assertFailed(const char *file, int line, const char *str);

// Implemented in logger.[h|cpp]
void log(const string &message, const string &unique_key);
void log(const string &message);
bool logKeyPresent(const string &);

#define FATAL(...) frac::fatalError(__FILE__, __LINE__, __VA_ARGS__)

#define ASSERT(expr)                                                                               \
	((__builtin_expect(!!(expr), true) ||                                                          \
	  (frac::assertFailed(__FILE__, __LINE__, FRAC_STRINGIZE(expr)), 0)))

#ifdef NDEBUG
#define DASSERT(expr) ((void)0)
#define IF_DEBUG(...) ((void)0)
#else
#define DASSERT(expr) ASSERT(expr)
#define IF_DEBUG(...) __VA_ARGS__
#endif

#if defined(FRAC_PARANOID)
#define PASSERT(expr) ASSERT(expr)
#else
#define PASSERT(expr) ((void)0)
#endif
}
