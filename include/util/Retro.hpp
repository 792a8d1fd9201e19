#pragma once
#include <string>

namespace tessera::util {

// Bar cells for a fraction in 0..1: round(fraction * width) `fill` cells,
// the rest `track`. Fractions outside 0..1 are clamped.
auto retro_bar(double fraction, int width, char fill = '#', char track = '.') -> std::string;

// Number of filled cells retro_bar would draw.
auto retro_filled(double fraction, int width) -> int;

} // namespace tessera::util
