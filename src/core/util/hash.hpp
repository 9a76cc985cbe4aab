#pragma once

#include <string>
#include <string_view>

namespace stride::util {

bool hashing_ready();
std::string blake2b_hex(std::string_view payload);
bool checksum_matches(std::string_view payload, std::string_view expected_hex);

}  // namespace stride::util
