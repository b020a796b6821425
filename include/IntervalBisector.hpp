#pragma once
#include <cstddef>
#include "BitInterleaver.hpp"

namespace geohash {

struct AxisEstimate {
    double value;
    double error;
};

// Halves [lo, hi] once per bit: 1 keeps the upper half, 0 the lower half.
// Returns the midpoint and half width of what is left.
AxisEstimate narrow(const Bits& bits, double lo, double hi);

// Inverse of narrow: emits the bits that locate value inside [lo, hi].
// value == mid goes to the lower half.
Bits widen(double value, double lo, double hi, size_t bit_count);

size_t longitude_bit_count(size_t length);
size_t latitude_bit_count(size_t length);

}
