#include "IntervalBisector.hpp"
#include "Alphabet.hpp"

namespace geohash {

AxisEstimate narrow(const Bits& bits, double lo, double hi) {
    for (bool bit : bits) {
        double mid = (lo + hi) / 2;
        if (bit) lo = mid;
        else hi = mid;
    }
    return { (lo + hi) / 2, (hi - lo) / 2 };
}

Bits widen(double value, double lo, double hi, size_t bit_count) {
    Bits bits;
    bits.reserve(bit_count);
    while (bits.size() < bit_count) {
        double mid = (lo + hi) / 2;
        if (value > mid) {
            bits.push_back(true);
            lo = mid;
        } else {
            bits.push_back(false);
            hi = mid;
        }
    }
    return bits;
}

size_t longitude_bit_count(size_t length) {
    return (length * BITS_PER_SYMBOL + 1) / 2;
}

size_t latitude_bit_count(size_t length) {
    return length * BITS_PER_SYMBOL / 2;
}

}
