#pragma once
#include <string_view>

namespace geohash {

constexpr std::string_view BASE32 = "0123456789bcdefghjkmnpqrstuvwxyz";
constexpr int BITS_PER_SYMBOL = 5;

bool is_valid_symbol(char c);
int symbol_to_value(char c);
char value_to_symbol(int value);

}
