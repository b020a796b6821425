#include "GeoErrors.hpp"

namespace geohash {

static std::string describe_symbol(char symbol, size_t position) {
    std::string message = "invalid geohash symbol '";
    message += symbol;
    message += "' at position " + std::to_string(position);
    return message;
}

InvalidSymbol::InvalidSymbol(char symbol, size_t position)
    : GeoError(describe_symbol(symbol, position)), symbol_(symbol), position_(position) {}

}
