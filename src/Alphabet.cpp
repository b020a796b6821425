#include "Alphabet.hpp"
#include "GeoErrors.hpp"
#include <stdexcept>
#include <string>

namespace geohash {

static int lookup(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    auto pos = BASE32.find(c, 10);
    if (pos == std::string_view::npos) return -1;
    return static_cast<int>(pos);
}

bool is_valid_symbol(char c) {
    return lookup(c) >= 0;
}

int symbol_to_value(char c) {
    int value = lookup(c);
    if (value < 0) {
        throw InvalidSymbol(c, 0);
    }
    return value;
}

char value_to_symbol(int value) {
    if (value < 0 || value >= static_cast<int>(BASE32.size())) {
        throw std::out_of_range("geohash symbol value out of range: " + std::to_string(value));
    }
    return BASE32[value];
}

}
