#pragma once

namespace tessera::util {

constexpr char ascii_lower(unsigned char c) {
  return (c >= 'A' && c <= 'Z') ? (char)(c - 'A' + 'a') : (char)c;
}

} // namespace tessera::util
