#include "BitInterleaver.hpp"
#include "Alphabet.hpp"
#include "GeoErrors.hpp"
#include <stdexcept>

namespace geohash {

Bits geohash_to_bits(std::string_view geohash) {
    Bits bits;
    bits.reserve(geohash.size() * BITS_PER_SYMBOL);
    for (size_t i = 0; i < geohash.size(); ++i) {
        if (!is_valid_symbol(geohash[i])) {
            throw InvalidSymbol(geohash[i], i);
        }
        int value = symbol_to_value(geohash[i]);
        for (int mask = 1 << (BITS_PER_SYMBOL - 1); mask != 0; mask >>= 1) {
            bits.push_back((value & mask) != 0);
        }
    }
    return bits;
}

std::string bits_to_geohash(const Bits& bits) {
    if (bits.size() % BITS_PER_SYMBOL != 0) {
        throw std::invalid_argument("bit count " + std::to_string(bits.size()) + " is not a multiple of 5");
    }
    std::string geohash;
    geohash.reserve(bits.size() / BITS_PER_SYMBOL);
    int value = 0;
    for (size_t i = 0; i < bits.size(); ++i) {
        value = (value << 1) | (bits[i] ? 1 : 0);
        if (i % BITS_PER_SYMBOL == BITS_PER_SYMBOL - 1) {
            geohash += value_to_symbol(value);
            value = 0;
        }
    }
    return geohash;
}

AxisBits split_bits(const Bits& bits) {
    AxisBits axes;
    axes.longitude.reserve((bits.size() + 1) / 2);
    axes.latitude.reserve(bits.size() / 2);
    for (size_t i = 0; i < bits.size(); ++i) {
        if (i % 2 == 0) axes.longitude.push_back(bits[i]);
        else axes.latitude.push_back(bits[i]);
    }
    return axes;
}

Bits merge_bits(const Bits& longitude, const Bits& latitude) {
    if (latitude.size() > longitude.size() || longitude.size() - latitude.size() > 1) {
        throw std::invalid_argument("latitude stream must match the longitude stream or be one bit shorter");
    }
    Bits bits;
    bits.reserve(longitude.size() + latitude.size());
    for (size_t i = 0; i < longitude.size(); ++i) {
        bits.push_back(longitude[i]);
        if (i < latitude.size()) bits.push_back(latitude[i]);
    }
    return bits;
}

}
