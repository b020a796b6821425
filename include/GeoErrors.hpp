#pragma once
#include <stdexcept>
#include <string>
#include <cstddef>

namespace geohash {

class GeoError : public std::runtime_error {
public:
    explicit GeoError(const std::string& message) : std::runtime_error(message) {}
};

// Character outside the base-32 alphabet. position is the index in the
// decoded string.
class InvalidSymbol : public GeoError {
public:
    InvalidSymbol(char symbol, size_t position);

    char symbol() const { return symbol_; }
    size_t position() const { return position_; }

private:
    char symbol_;
    size_t position_;
};

class OutOfRange : public GeoError {
public:
    explicit OutOfRange(const std::string& message) : GeoError(message) {}
};

}
