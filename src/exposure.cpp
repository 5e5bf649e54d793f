// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#include "frac/exposure.h"

#include "frac/format.h"

namespace frac {

Ex<RatL> stopFromFNumber(double fnumber) {
	if(!isFinite(fnumber) || fnumber <= 0.0)
		return ERROR("Invalid f-number: %", fnumber);
	return RatL::approximate(2.0 * std::log2(fnumber), stop_tolerance);
}

double fNumberFromStop(const RatL &stop) { return std::pow(sqrt2, stop.toDouble()); }

Ex<double> nominalFNumber(const RatL &stop) {
	return floorSignificant(fNumberFromStop(stop), 2);
}

Ex<double> floorSignificant(double value, int digits) {
	if(!isFinite(value) || value <= 0.0)
		return ERROR("Cannot floor % to significant digits", value);
	EXPECT(digits >= 1 && digits <= 17);

	int exponent = digits - 1 - int(std::floor(std::log10(value)));
	if(exponent >= 0) {
		double scale = std::pow(10.0, exponent);
		return std::floor(value * scale) / scale;
	}
	double scale = std::pow(10.0, -exponent);
	return std::floor(value / scale) * scale;
}
}
