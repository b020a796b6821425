#pragma once
#include <string>

namespace geohash {

// Smallest digit count whose rounding grid (10^-digits) is narrower than the
// interval 2*error. error must be finite and positive.
int precision(double error);

std::string format_coordinate(double value, int digits);

}
