#include <boost/test/unit_test.hpp>
#include "GeoEncoding.hpp"
#include "Alphabet.hpp"
#include "GeoErrors.hpp"
#include <cmath>
#include <limits>
#include <string>

namespace geohash {

BOOST_AUTO_TEST_SUITE( GeoEncodingTests )

BOOST_AUTO_TEST_CASE( encode_reference_hashes ) {
  BOOST_CHECK_EQUAL("ezs42", encode(42.6, -5.6, 5));
  BOOST_CHECK_EQUAL("u283bmvkvwg7", encode(48.152555, 11.619999, 12));
  BOOST_CHECK_EQUAL("u283bmvkvwg7", encode(48.152555, 11.619999));
  BOOST_CHECK_EQUAL("c216ne", encode(45.37, -121.7, 6));
  BOOST_CHECK_EQUAL("r3gx2f9tt5sne", encode(-33.8671390, 151.2071140, 13));
  BOOST_CHECK_EQUAL("gcpuvpk44kprq", encode(51.5001524, -0.1262362, 13));
}

BOOST_AUTO_TEST_CASE( encode_lengths ) {
  BOOST_CHECK_EQUAL("", encode(10.0, 20.0, 0));
  BOOST_CHECK_EQUAL(1u, encode(10.0, 20.0, 1).size());
  BOOST_CHECK_EQUAL(25u, encode(10.0, 20.0, 25).size());
}

BOOST_AUTO_TEST_CASE( encode_corners ) {
  BOOST_CHECK_EQUAL("z", encode(90, 180, 1));
  BOOST_CHECK_EQUAL("000", encode(-90, -180, 3));
  BOOST_CHECK_EQUAL("7z", encode(0, 0, 2));
}

BOOST_AUTO_TEST_CASE( encode_rejects_out_of_range ) {
  BOOST_CHECK_THROW(encode(90.5, 0, 5), OutOfRange);
  BOOST_CHECK_THROW(encode(-91, 0, 5), OutOfRange);
  BOOST_CHECK_THROW(encode(0, 180.01, 5), OutOfRange);
  BOOST_CHECK_THROW(encode(0, -200, 5), OutOfRange);
  BOOST_CHECK_THROW(encode(std::numeric_limits<double>::quiet_NaN(), 0, 5), OutOfRange);
  BOOST_CHECK_THROW(encode(0, 0, -1), OutOfRange);
  BOOST_CHECK_THROW(encode(0, 0, -1), GeoError);
}

BOOST_AUTO_TEST_CASE( decode_reference_hashes ) {
  FormattedCoordinates coords = decode("ezs42");
  BOOST_CHECK_EQUAL("42.60", coords.latitude);
  BOOST_CHECK_EQUAL("-5.60", coords.longitude);

  // Even length: digits follow the latitude error, half the longitude one.
  coords = decode("c216ne");
  BOOST_CHECK_EQUAL("45.371", coords.latitude);
  BOOST_CHECK_EQUAL("-121.701", coords.longitude);

  coords = decode("u283bmvkvwg7");
  BOOST_CHECK_EQUAL("48.1525551", coords.latitude);
  BOOST_CHECK_EQUAL("11.6199992", coords.longitude);
}

BOOST_AUTO_TEST_CASE( decode_empty ) {
  FormattedCoordinates coords = decode("");
  BOOST_CHECK_EQUAL("0", coords.latitude);
  BOOST_CHECK_EQUAL("0", coords.longitude);

  DecodedPosition pos = decode_with_error("");
  BOOST_CHECK_EQUAL(0.0, pos.latitude);
  BOOST_CHECK_EQUAL(0.0, pos.longitude);
  BOOST_CHECK_EQUAL(90.0, pos.latitude_error);
  BOOST_CHECK_EQUAL(180.0, pos.longitude_error);
}

BOOST_AUTO_TEST_CASE( decode_single_symbol ) {
  // 3 longitude bits, 2 latitude bits
  DecodedPosition pos = decode_with_error(encode(90, 180, 1));
  BOOST_CHECK_EQUAL(67.5, pos.latitude);
  BOOST_CHECK_EQUAL(157.5, pos.longitude);
  BOOST_CHECK_EQUAL(22.5, pos.latitude_error);
  BOOST_CHECK_EQUAL(22.5, pos.longitude_error);
}

BOOST_AUTO_TEST_CASE( decode_with_error_values ) {
  DecodedPosition pos = decode_with_error("ezs42");
  BOOST_CHECK_EQUAL(42.60498046875, pos.latitude);
  BOOST_CHECK_EQUAL(-5.60302734375, pos.longitude);
  BOOST_CHECK_EQUAL(0.02197265625, pos.latitude_error);
  BOOST_CHECK_EQUAL(0.02197265625, pos.longitude_error);
}

BOOST_AUTO_TEST_CASE( decode_rejects_excluded_letters ) {
  for (const char* bad : {"a", "ezsi2", "l0", "u28o", "EZS42", "ezs4 "}) {
    BOOST_CHECK_THROW(decode(bad), InvalidSymbol);
    BOOST_CHECK_THROW(decode_with_error(bad), InvalidSymbol);
  }
}

BOOST_AUTO_TEST_CASE( round_trip_within_error ) {
  const double coords[][2] = {
    {0, 0}, {42.6, -5.6}, {-33.867139, 151.207114}, {89.9999, -179.9999},
    {-90, 180}, {12.345678, 98.765432}, {-0.0001, 0.0001}, {51.5001524, -0.1262362}
  };
  for (const auto& c : coords) {
    for (int length = 1; length <= 14; ++length) {
      DecodedPosition pos = decode_with_error(encode(c[0], c[1], length));
      BOOST_CHECK_LE(std::fabs(pos.latitude - c[0]), pos.latitude_error);
      BOOST_CHECK_LE(std::fabs(pos.longitude - c[1]), pos.longitude_error);
    }
  }
}

BOOST_AUTO_TEST_CASE( error_monotonic_in_length ) {
  DecodedPosition prev = decode_with_error(encode(37.7749, -122.4194, 0));
  for (int length = 1; length <= 16; ++length) {
    DecodedPosition next = decode_with_error(encode(37.7749, -122.4194, length));
    BOOST_CHECK_LE(next.latitude_error, prev.latitude_error);
    BOOST_CHECK_LE(next.longitude_error, prev.longitude_error);
    BOOST_CHECK(next.longitude_error == next.latitude_error ||
                next.longitude_error == 2 * next.latitude_error);
    prev = next;
  }
}

BOOST_AUTO_TEST_CASE( error_halves_per_bit ) {
  // 5 bits per symbol, longitude first: odd lengths give longitude the extra bit.
  DecodedPosition one = decode_with_error("s");
  DecodedPosition two = decode_with_error("s0");
  BOOST_CHECK_EQUAL(one.longitude_error / 4, two.longitude_error);
  BOOST_CHECK_EQUAL(one.latitude_error / 8, two.latitude_error);
}

static void check_formatted_within_error(const std::string& hash) {
  DecodedPosition pos = decode_with_error(hash);
  FormattedCoordinates coords = decode(hash);
  double lat = std::stod(coords.latitude);
  double lng = std::stod(coords.longitude);
  BOOST_CHECK_MESSAGE(std::fabs(lat - pos.latitude) <= pos.latitude_error,
                      hash << " latitude " << coords.latitude);
  BOOST_CHECK_MESSAGE(std::fabs(lng - pos.longitude) <= pos.longitude_error,
                      hash << " longitude " << coords.longitude);
}

BOOST_AUTO_TEST_CASE( formatted_within_error_even_length ) {
  std::string hash = "u???00";
  for (char a : BASE32) {
    for (char b : BASE32) {
      for (char c : BASE32) {
        hash[1] = a;
        hash[2] = b;
        hash[3] = c;
        check_formatted_within_error(hash);
      }
    }
  }
}

BOOST_AUTO_TEST_CASE( formatted_within_error_every_length ) {
  std::string hash;
  for (int length = 0; length <= 16; ++length) {
    check_formatted_within_error(hash);
    hash += BASE32[(length * 7 + 3) % 32];
  }
}

BOOST_AUTO_TEST_SUITE_END()

}
