#pragma once

#include <cstdint>
#include <string>

namespace paceline::ui {

// UTF-8 text width utilities (ANSI SGR sequences take no columns)
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);

// Number formatting for segment text
std::string format_tokens(uint64_t n);
std::string format_pct(double pct);
std::string format_ratio(double ratio);

} // namespace paceline::ui
