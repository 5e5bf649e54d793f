// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#include "frac/exposure.h"
#include "frac/format.h"
#include "frac/parse.h"

#include <cstdio>

using namespace frac;

void printHelp(const char *app_name) {
	printf("Synopsis:\n"
		   "  %s <f-number>...\n"
		   "  %s -a <value> <tolerance>\n\n"
		   "Prints exposure stops (Av) of given f-numbers as rationals (third-stop resolution)\n"
		   "and nominal f-numbers which they map back to.\n"
		   "With -a prints the simplest rational within tolerance of a given value.\n\n"
		   "Examples:\n"
		   "  %s 1.4 f/2.8 5.6\n"
		   "  %s -a 3.14159265 0.001\n\n",
		   app_name, app_name, app_name, app_name);
}

Ex<double> parseNumber(const char *text) {
	TextParser parser(text);
	auto value = EX_PASS(parser.parseDouble());
	if(parser.hasAnythingLeft())
		return ERROR("Invalid number: \"%\"", text);
	return value;
}

Ex<string> describeStop(const string &arg) {
	string number = arg.compare(0, 2, "f/") == 0 ? arg.substr(2) : arg;
	auto fnumber = EX_PASS(parseNumber(number.c_str()));
	auto stop = EX_PASS(stopFromFNumber(fnumber));
	auto nominal = EX_PASS(nominalFNumber(stop));
	return format("f/%: stop % (nominal f/%)", fnumber, stop, nominal);
}

Ex<string> describeApproximation(const char *value_text, const char *tolerance_text) {
	auto value = EX_PASS(parseNumber(value_text));
	auto tolerance = EX_PASS(parseNumber(tolerance_text));
	auto result = EX_PASS(RatL::approximate(value, tolerance));
	return format("% ~= % (difference: %)", value, result, result.toDouble() - value);
}

int main(int argc, char **argv) {
	if(argc <= 1 || strcmp(argv[1], "--help") == 0 || strcmp(argv[1], "-h") == 0) {
		printHelp(argv[0]);
		return argc <= 1 ? 1 : 0;
	}

	if(strcmp(argv[1], "-a") == 0) {
		if(argc != 4) {
			printHelp(argv[0]);
			return 1;
		}
		auto result = describeApproximation(argv[2], argv[3]);
		if(!result) {
			result.error().print();
			return 1;
		}
		print("%\n", *result);
		return 0;
	}

	int num_errors = 0;
	for(int n = 1; n < argc; n++) {
		auto result = describeStop(argv[n]);
		if(result)
			print("%\n", *result);
		else {
			result.error().print();
			num_errors++;
		}
	}

	return num_errors > 0 ? 1 : 0;
}
