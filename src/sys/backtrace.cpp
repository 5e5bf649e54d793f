// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#include "frac/sys/backtrace.h"

#include "frac/format.h"

#include <cstdio>
#include <cstdlib>
#include <cxxabi.h>

#ifdef __linux__
#include <execinfo.h>
#endif

namespace frac {

string demangle(string str) {
	int status = 0;
	char *result = abi::__cxa_demangle(str.c_str(), nullptr, nullptr, &status);
	if(result) {
		str = result;
		free(result);
	}
	return str;
}

namespace {

	// backtrace_symbols returns: file(mangled_name+offset) [address]
	BacktraceInfo parseSymbol(const string &str) {
		BacktraceInfo out;
		auto p1 = str.find('('), p2 = str.rfind('+'), p3 = str.find(')');
		out.file = str.substr(0, p1);
		if(p1 != string::npos && p2 != string::npos && p3 != string::npos && p1 < p2 && p2 < p3)
			out.function = demangle(str.substr(p1 + 1, p2 - p1 - 1));
		return out;
	}

	vector<string> execLines(const string &command) {
		vector<string> out;
		FILE *pipe = popen(command.c_str(), "r");
		if(!pipe)
			return out;

		char buffer[1024];
		while(fgets(buffer, sizeof(buffer), pipe)) {
			string line = buffer;
			while(!line.empty() && (line.back() == '\n' || line.back() == '\r'))
				line.pop_back();
			out.emplace_back(move(line));
		}
		if(pclose(pipe) != 0)
			out.clear();
		return out;
	}

	// TODO: addresses in PIE executables have to be translated to offsets before they are
	//       passed to addr2line; currently such lines resolve to ??:0
	vector<string> analyzeAddresses(const vector<void *> &addresses) {
		TextFormatter command;
		command("addr2line -e /proc/self/exe ");
		for(auto address : addresses)
			command.stdFormat("%p ", address);
		command("2>/dev/null");

		auto lines = execLines(command.text());
		lines.resize(addresses.size());
		return lines;
	}
}

Backtrace Backtrace::get(int skip, Mode mode) {
	if(mode == Mode::disabled)
		return {};

#ifdef __linux__
	array<void *, 64> buffer;
	int count = ::backtrace(buffer.data(), int(buffer.size()));
	// Backtrace::get itself is skipped too
	skip = std::min(skip + 1, count);
	return {vector<void *>(buffer.begin() + skip, buffer.begin() + count), mode};
#else
	return {};
#endif
}

vector<BacktraceInfo> Backtrace::analyze() const {
	vector<BacktraceInfo> out;
#ifdef __linux__
	if(m_addresses.empty())
		return out;

	char **strings = backtrace_symbols(m_addresses.data(), int(m_addresses.size()));
	if(!strings)
		return out;
	for(int n = 0; n < size(); n++)
		out.emplace_back(parseSymbol(strings[n]));
	::free(strings);

	if(m_mode == Mode::full) {
		auto file_lines = analyzeAddresses(m_addresses);
		for(int n = 0; n < size(); n++) {
			const string &file_line = file_lines[n];
			auto colon_pos = file_line.rfind(':');
			if(file_line.empty() || file_line[0] == '?' || colon_pos == string::npos)
				continue;
			out[n].file = file_line.substr(0, colon_pos);
			out[n].line = atoi(file_line.c_str() + colon_pos + 1);
		}
	}
#endif
	return out;
}

string Backtrace::format() const { return format(analyze()); }

string Backtrace::format(vector<BacktraceInfo> infos) {
	int max_file_size = 0;
	for(auto &info : infos) {
		if(info.line > 0)
			info.file += frac::format(":%", info.line);
		max_file_size = std::max(max_file_size, int(info.file.size()));
	}

	string out;
	for(auto &info : infos) {
		out += string(max_file_size - info.file.size(), ' ') + info.file + " ";
		out += info.function.empty() ? "???" : info.function;
		out += "\n";
	}
	return out;
}

void Backtrace::operator>>(TextFormatter &out) const { out << format(); }
}
