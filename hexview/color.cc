// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "hexview/color.h"
#include "absl/strings/str_format.h"

namespace hexview::color {

std::string SetColor(const Color &c) {
  if (c.fixed == FixedColor::kNotSet) {
    return "";
  }
  const char *mod = (c.mod & kBold) != 0 ? ";1" : "";
  int fg_base = 30;
  int bg_base = 40;
  if ((c.mod & kBright) != 0) {
    fg_base = 90;
    bg_base = 100;
  }
  int color_code =
      (((c.mod & kBackground) != 0) ? bg_base : fg_base) + int(c.fixed);
  return absl::StrFormat("\033[%d%sm", color_code, mod);
}

std::string ResetColor() { return "\033[0m"; }

} // namespace hexview::color
