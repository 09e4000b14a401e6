#include "ui/Terminal.hpp"
#include "util/AsciiLower.hpp"
#include <unistd.h>
#include <algorithm>
#include <cstdlib>
#include <string>

namespace paceline::ui {

void best_effort_write(int fd, const char* buf, size_t len) {
  if (len == 0) return;
  if (::write(fd, buf, len) < 0) { /* ignore */ }
}

bool truecolor_capable() {
  const char* ct = std::getenv("COLORTERM");
  if (ct) {
    std::string s = paceline::util::ascii_lower_copy(ct);
    if (s.find("truecolor") != std::string::npos || s.find("24bit") != std::string::npos) return true;
  }
  return false;
}

std::string sgr_reset() {
  return std::string("\x1B[0m");
}

std::string sgr_code_int(int code) {
  return std::string("\x1B[") + std::to_string(code) + "m";
}

std::string sgr_palette_idx(int idx) {
  idx = std::clamp(idx, 0, 255);
  if (idx <= 7) return sgr_code_int(30 + idx);
  if (idx <= 15) return sgr_code_int(90 + (idx - 8));
  return std::string("\x1B[38;5;") + std::to_string(idx) + "m";
}

std::string sgr_palette_idx_bg(int idx) {
  idx = std::clamp(idx, 0, 255);
  if (idx <= 7) return sgr_code_int(40 + idx);
  if (idx <= 15) return sgr_code_int(100 + (idx - 8));
  return std::string("\x1B[48;5;") + std::to_string(idx) + "m";
}

std::string sgr_truecolor(int r, int g, int b) {
  r = std::clamp(r,0,255); g = std::clamp(g,0,255); b = std::clamp(b,0,255);
  return std::string("\x1B[38;2;") + std::to_string(r) + ";" + std::to_string(g) + ";" + std::to_string(b) + "m";
}

std::string sgr_truecolor_bg(int r, int g, int b) {
  r = std::clamp(r,0,255); g = std::clamp(g,0,255); b = std::clamp(b,0,255);
  return std::string("\x1B[48;2;") + std::to_string(r) + ";" + std::to_string(g) + ";" + std::to_string(b) + "m";
}

} // namespace paceline::ui
