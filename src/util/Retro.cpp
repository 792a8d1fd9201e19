#include "util/Retro.hpp"
#include <algorithm>
#include <cmath>

namespace tessera::util {

auto retro_filled(double fraction, int width) -> int {
  if (width <= 0 || !std::isfinite(fraction)) return 0;
  fraction = std::clamp(fraction, 0.0, 1.0);
  int filled = static_cast<int>(std::lround(fraction * width));
  return std::clamp(filled, 0, width);
}

auto retro_bar(double fraction, int width, char fill, char track) -> std::string {
  if (width <= 0) return std::string();
  int filled = retro_filled(fraction, width);
  std::string s;
  s.reserve(width);
  s.append(filled, fill);
  s.append(width - filled, track);
  return s;
}

} // namespace tessera::util
