#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace stride::util {

std::int64_t unix_timestamp_now();

std::string lowercase_copy(std::string_view value);
std::string trim_copy(std::string_view value);

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields);
std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload);

std::vector<std::string> split_csv(std::string_view csv);
std::string join_csv(const std::vector<std::string>& values);

bool parse_int64(std::string_view text, std::int64_t& out);
bool parse_bool(std::string_view text, bool& out);

}  // namespace stride::util
