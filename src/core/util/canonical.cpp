#include "core/util/canonical.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cctype>
#include <iterator>
#include <ranges>
#include <sstream>
#include <system_error>

namespace stride::util {

std::int64_t unix_timestamp_now() {
  const auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

std::string lowercase_copy(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  std::ranges::transform(value, std::back_inserter(out), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string trim_copy(std::string_view value) {
  std::size_t begin = 0;
  while (begin < value.size() && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
    ++begin;
  }

  std::size_t end = value.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }

  return std::string{value.substr(begin, end - begin)};
}

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields) {
  std::ranges::sort(fields, [](const auto& lhs, const auto& rhs) {
    return lhs.first < rhs.first;
  });

  std::string payload;
  for (const auto& [key, value] : fields) {
    payload.append(key);
    payload.push_back('=');
    for (char c : value) {
      if (c == '\n') {
        payload.append("\\n");
      } else if (c == '\\') {
        payload.append("\\\\");
      } else {
        payload.push_back(c);
      }
    }
    payload.push_back('\n');
  }

  return payload;
}

std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload) {
  std::unordered_map<std::string, std::string> parsed;

  std::string key;
  std::string value;
  key.reserve(64);
  value.reserve(payload.size());

  bool reading_key = true;
  bool escaping = false;
  for (char c : payload) {
    if (reading_key) {
      if (c == '=') {
        reading_key = false;
        continue;
      }
      if (c == '\n') {
        key.clear();
        continue;
      }
      key.push_back(c);
      continue;
    }

    if (escaping) {
      if (c == 'n') {
        value.push_back('\n');
      } else {
        value.push_back(c);
      }
      escaping = false;
      continue;
    }

    if (c == '\\') {
      escaping = true;
      continue;
    }

    if (c == '\n') {
      if (!key.empty()) {
        parsed.emplace(key, value);
      }
      key.clear();
      value.clear();
      reading_key = true;
      continue;
    }

    value.push_back(c);
  }

  if (!reading_key && !key.empty()) {
    parsed.emplace(key, value);
  }

  return parsed;
}

std::vector<std::string> split_csv(std::string_view csv) {
  std::vector<std::string> values;
  std::string current;
  for (char c : csv) {
    if (c == ',') {
      std::string trimmed = trim_copy(current);
      if (!trimmed.empty()) {
        values.push_back(std::move(trimmed));
      }
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  std::string trimmed = trim_copy(current);
  if (!trimmed.empty()) {
    values.push_back(std::move(trimmed));
  }
  return values;
}

std::string join_csv(const std::vector<std::string>& values) {
  std::ostringstream out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ',';
    }
    out << values[i];
  }
  return out.str();
}

bool parse_int64(std::string_view text, std::int64_t& out) {
  if (text.empty()) {
    return false;
  }
  std::int64_t value = 0;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
    return false;
  }
  out = value;
  return true;
}

bool parse_bool(std::string_view text, bool& out) {
  const std::string lowered = lowercase_copy(trim_copy(text));
  if (lowered == "1" || lowered == "true" || lowered == "yes") {
    out = true;
    return true;
  }
  if (lowered == "0" || lowered == "false" || lowered == "no") {
    out = false;
    return true;
  }
  return false;
}

}  // namespace stride::util
