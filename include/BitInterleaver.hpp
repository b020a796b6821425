#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace geohash {

using Bits = std::vector<bool>;

struct AxisBits {
    Bits longitude;
    Bits latitude;
};

Bits geohash_to_bits(std::string_view geohash);
std::string bits_to_geohash(const Bits& bits);

// Longitude takes the even positions, latitude the odd ones.
AxisBits split_bits(const Bits& bits);
Bits merge_bits(const Bits& longitude, const Bits& latitude);

}
