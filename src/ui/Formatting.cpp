#include "ui/Formatting.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace paceline::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i=0; i<s.size();){
    // Skip ANSI escape sequences
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++; // skip final byte
      continue;
    }
    i += u8_len((unsigned char)s[i]);
    cols += 1;
  }
  return cols;
}

std::string take_cols(const std::string& s, int cols){
  if (cols <= 0) return std::string();
  std::string out;
  out.reserve(s.size());
  int seen = 0;
  size_t i = 0;
  while (i < s.size()) {
    // Escapes are copied even past the cut so trailing resets survive
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      size_t start = i;
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++;
      out.append(s, start, i - start);
      continue;
    }
    int len = u8_len((unsigned char)s[i]);
    if (i + (size_t)len > s.size()) len = 1;
    if (seen < cols) {
      out.append(s, i, len);
      seen += 1;
    }
    i += len;
  }
  return out;
}

std::string format_tokens(uint64_t n) {
  char buf[32];
  if (n < 1000) return std::to_string(n);
  if (n < 9'950) {
    std::snprintf(buf, sizeof(buf), "%.1fk", static_cast<double>(n) / 1000.0);
    return buf;
  }
  if (n < 999'500) return std::to_string((n + 500) / 1000) + "k";
  std::snprintf(buf, sizeof(buf), "%.1fM", static_cast<double>(n) / 1'000'000.0);
  return buf;
}

std::string format_pct(double pct) {
  if (!(pct >= 0.0)) pct = 0.0;
  return std::to_string(std::lround(pct)) + "%";
}

std::string format_ratio(double ratio) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2fx", ratio);
  return buf;
}

} // namespace paceline::ui
