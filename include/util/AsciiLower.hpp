#pragma once

#include <string>

namespace paceline::util {

constexpr char ascii_lower(unsigned char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
}

inline std::string ascii_lower_copy(std::string s) {
  for (auto& c : s) c = ascii_lower(static_cast<unsigned char>(c));
  return s;
}

} // namespace paceline::util
