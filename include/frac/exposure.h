// Copyright (C) Krzysztof Jakubowski <nadult@fastmail.fm>
// This file is part of libfrac. See license.txt for details.

#pragma once

#include "frac/math/rational.h"

namespace frac {

// Conversions between aperture f-numbers and exposure stops (Av).
// One stop doubles or halves the amount of light; f-number = sqrt(2) ^ stop.

// Stops are approximated with third-stop resolution
constexpr double stop_tolerance = 0.1;

// f/1.4 -> 1/1, f/1.7 -> 3/2, f/1.6 -> 4/3, f/22 -> 9/1
Ex<RatL> stopFromFNumber(double fnumber);

double fNumberFromStop(const RatL &stop);

// Nominal f-number as printed on lenses: precise value floored to 2 significant digits
// stop 1 -> 1.4, stop 5/3 -> 1.7, stop 9 -> 22
Ex<double> nominalFNumber(const RatL &stop);

// floorSignificant(1234, 2) == 1200; floorSignificant(0.1234, 3) == 0.123
// Value has to be positive and finite
Ex<double> floorSignificant(double value, int digits);
}
