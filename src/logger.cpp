// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#include "frac/logger.h"

#include "frac/format.h"

#include <mutex>

namespace frac {

Logger::Logger() = default;
FRAC_COPYABLE_CLASS_IMPL(Logger);

bool Logger::keyPresent(const string &key) const {
	if(!key.empty())
		return m_keys.find(key) != m_keys.end();
	return false;
}

void Logger::addMessage(const string &text, const string &unique_key) {
	if(!unique_key.empty()) {
		if(m_keys.find(unique_key) != m_keys.end())
			return;
		m_keys.insert(unique_key);
	}

	print("%\n", text);
}

static Logger s_logger;
static std::mutex s_mutex;

void log(const string &message, const string &unique_key) {
	std::lock_guard<std::mutex> lock(s_mutex);
	s_logger.addMessage(message, unique_key);
}

void log(const string &message) { log(message, ""); }

bool logKeyPresent(const string &key) {
	std::lock_guard<std::mutex> lock(s_mutex);
	return s_logger.keyPresent(key);
}
}
