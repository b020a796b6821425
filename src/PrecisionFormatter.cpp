#include "PrecisionFormatter.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace geohash {

int precision(double error) {
    if (!std::isfinite(error) || error <= 0) {
        throw std::invalid_argument("precision requires a finite positive error");
    }
    int digits = static_cast<int>(std::floor(-std::log10(2 * error))) + 1;
    return std::max(0, digits);
}

std::string format_coordinate(double value, int digits) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(std::max(0, digits)) << value;
    return ss.str();
}

}
