#pragma once
#include <string>
#include <string_view>

namespace geohash {

constexpr double MIN_LATITUDE = -90.0;
constexpr double MAX_LATITUDE = 90.0;
constexpr double MIN_LONGITUDE = -180.0;
constexpr double MAX_LONGITUDE = 180.0;

constexpr int DEFAULT_LENGTH = 12;

struct FormattedCoordinates {
    std::string latitude;
    std::string longitude;
};

struct DecodedPosition {
    double latitude;
    double longitude;
    double latitude_error;
    double longitude_error;
};

// Throws OutOfRange for coordinates outside the valid ranges or a negative length.
std::string encode(double latitude, double longitude, int length = DEFAULT_LENGTH);

// Both throw InvalidSymbol when the string holds a character outside BASE32.
FormattedCoordinates decode(std::string_view geohash);
DecodedPosition decode_with_error(std::string_view geohash);

}
