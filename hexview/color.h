// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include <string>

namespace hexview::color {

// 3-bit fixed colors supported by most terminals.
enum class FixedColor {
  kNotSet = -1,
  kBlack = 0,
  kRed,
  kGreen,
  kYellow,
  kBlue,
  kMagenta,
  kCyan,
  kWhite,
  kNormal = 9,
};

// Modifiers for colors.
using Modifier = int;

static constexpr Modifier kNormal = 0;
static constexpr Modifier kBold = 1;

// Bright looks better, except on light terminals.
static constexpr Modifier kBright = 2;

// Set the background color (otherwise the foreground is set)
static constexpr Modifier kBackground = 64;

struct Color {
  Modifier mod = kNormal;
  FixedColor fixed = FixedColor::kNotSet;
};

inline Color MakeFixed(FixedColor color, Modifier mod = kNormal) {
  return Color{.mod = mod, .fixed = color};
}

inline Color BoldRed() { return MakeFixed(FixedColor::kRed, kBold); }
inline Color BoldGreen() { return MakeFixed(FixedColor::kGreen, kBold); }
inline Color BoldBlue() { return MakeFixed(FixedColor::kBlue, kBold); }
inline Color BoldYellow() { return MakeFixed(FixedColor::kYellow, kBold); }
inline Color BoldMagenta() { return MakeFixed(FixedColor::kMagenta, kBold); }
inline Color BoldCyan() { return MakeFixed(FixedColor::kCyan, kBold); }
inline Color BoldNormal() { return MakeFixed(FixedColor::kNormal, kBold); }

// Escape sequence that switches the terminal to the color.  Empty if
// the color is not set.
std::string SetColor(const Color &c);

// Escape sequence that resets the terminal to its normal color.
std::string ResetColor();

} // namespace hexview::color
