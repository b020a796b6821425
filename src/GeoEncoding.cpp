#include "GeoEncoding.hpp"
#include "BitInterleaver.hpp"
#include "GeoErrors.hpp"
#include "IntervalBisector.hpp"
#include "PrecisionFormatter.hpp"
#include <algorithm>
#include <sstream>

namespace geohash {

static void check_coordinates(double latitude, double longitude) {
    // Written so that NaN fails both comparisons.
    bool invalidLatitude = !(latitude >= MIN_LATITUDE && latitude <= MAX_LATITUDE);
    bool invalidLongitude = !(longitude >= MIN_LONGITUDE && longitude <= MAX_LONGITUDE);
    if (!invalidLatitude && !invalidLongitude) return;

    std::ostringstream err;
    err << "invalid ";
    if (invalidLongitude) err << "longitude " << longitude;
    if (invalidLongitude && invalidLatitude) err << ", ";
    if (invalidLatitude) err << "latitude " << latitude;
    throw OutOfRange(err.str());
}

std::string encode(double latitude, double longitude, int length) {
    if (length < 0) {
        throw OutOfRange("invalid geohash length " + std::to_string(length));
    }
    check_coordinates(latitude, longitude);

    size_t symbols = static_cast<size_t>(length);
    Bits lngBits = widen(longitude, MIN_LONGITUDE, MAX_LONGITUDE, longitude_bit_count(symbols));
    Bits latBits = widen(latitude, MIN_LATITUDE, MAX_LATITUDE, latitude_bit_count(symbols));
    return bits_to_geohash(merge_bits(lngBits, latBits));
}

DecodedPosition decode_with_error(std::string_view geohash) {
    AxisBits axes = split_bits(geohash_to_bits(geohash));
    AxisEstimate lat = narrow(axes.latitude, MIN_LATITUDE, MAX_LATITUDE);
    AxisEstimate lng = narrow(axes.longitude, MIN_LONGITUDE, MAX_LONGITUDE);
    return { lat.value, lng.value, lat.error, lng.error };
}

FormattedCoordinates decode(std::string_view geohash) {
    DecodedPosition pos = decode_with_error(geohash);
    // One digit count for both axes, taken from the narrower one. At even
    // lengths the latitude error is half the longitude error.
    int digits = precision(std::min(pos.latitude_error, pos.longitude_error));
    return { format_coordinate(pos.latitude, digits), format_coordinate(pos.longitude, digits) };
}

}
