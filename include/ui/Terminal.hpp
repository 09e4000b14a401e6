#pragma once

#include <cstddef>
#include <string>

namespace paceline::ui {

// Terminal capability detection
[[nodiscard]] bool truecolor_capable();

// SGR code generation. Output never depends on whether stdout is a tty:
// the status line is usually captured through a pipe by the host.
[[nodiscard]] std::string sgr_reset();
[[nodiscard]] std::string sgr_code_int(int code);
[[nodiscard]] std::string sgr_palette_idx(int idx);
[[nodiscard]] std::string sgr_palette_idx_bg(int idx);
[[nodiscard]] std::string sgr_truecolor(int r, int g, int b);
[[nodiscard]] std::string sgr_truecolor_bg(int r, int g, int b);

// Best-effort terminal write
void best_effort_write(int fd, const char* buf, size_t len);

} // namespace paceline::ui
