#include "ui/Text.hpp"
#include "ui/Errors.hpp"
#include "util/AsciiLower.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace tessera::ui {

static void require_width(int width, const char* what) {
  if (width <= 0)
    throw InvalidConfig(std::string(what) + ": width must be positive, got " + std::to_string(width));
}

// Byte offset of the first `cols` columns of s (clamped to s.size()).
static size_t cols_to_bytes(const std::string& s, int cols) {
  size_t i = 0;
  int seen = 0;
  while (i < s.size() && seen < cols) {
    int len = u8_len((unsigned char)s[i]);
    if (i + (size_t)len > s.size()) len = 1;
    i += len;
    seen += 1;
  }
  return i;
}

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
    i += u8_len((unsigned char)s[i]);
    cols += 1;
  }
  return cols;
}

std::string take_cols(const std::string& s, int cols){
  if (cols <= 0) return std::string();
  return s.substr(0, cols_to_bytes(s, cols));
}

std::string drop_cols(const std::string& s, int cols){
  if (cols <= 0) return s;
  return s.substr(cols_to_bytes(s, cols));
}

std::string sanitize(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char ch : s) {
    auto c = (unsigned char)ch;
    if (c == '\t') out.append(4, ' ');
    else if (c < 0x20 || c == 0x7F) out.push_back(' ');
    else out.push_back(ch);
  }
  return out;
}

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> out;
  size_t start = 0;
  while (true) {
    size_t nl = text.find('\n', start);
    std::string ln = text.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
    if (!ln.empty() && ln.back() == '\r') ln.pop_back();
    out.push_back(std::move(ln));
    if (nl == std::string::npos) break;
    start = nl + 1;
  }
  return out;
}

std::vector<std::string> hard_break(const std::string& line, int width) {
  require_width(width, "hard_break");
  std::vector<std::string> out;
  std::string rest = line;
  while (display_cols(rest) > width) {
    out.push_back(take_cols(rest, width));
    rest = drop_cols(rest, width);
  }
  out.push_back(std::move(rest));
  return out;
}

std::vector<std::string> wrap(const std::string& text, int width) {
  require_width(width, "wrap");
  std::vector<std::string> out;
  for (const auto& para : split_lines(text)) {
    std::vector<std::string> tokens;
    std::istringstream ss(para);
    for (std::string tok; ss >> tok;) tokens.push_back(std::move(tok));
    if (tokens.empty()) { out.emplace_back(); continue; }

    std::string cur;
    int cur_w = 0;
    for (auto& tok : tokens) {
      int tw = display_cols(tok);
      if (cur_w > 0 && cur_w + 1 + tw <= width) {
        cur += ' ';
        cur += tok;
        cur_w += 1 + tw;
        continue;
      }
      if (cur_w > 0) { out.push_back(std::move(cur)); cur.clear(); cur_w = 0; }
      // Over-long tokens are split at the width boundary; the tail stays open.
      auto pieces = hard_break(tok, width);
      for (size_t i = 0; i + 1 < pieces.size(); ++i) out.push_back(std::move(pieces[i]));
      cur = std::move(pieces.back());
      cur_w = display_cols(cur);
    }
    out.push_back(std::move(cur));
  }
  return out;
}

std::string align(const std::string& text, int width, Align mode) {
  require_width(width, "align");
  int cols = display_cols(text);
  if (cols >= width) return text;
  int fill = width - cols;
  switch (mode) {
    case Align::Left:
      return text + std::string(fill, ' ');
    case Align::Right:
      return std::string(fill, ' ') + text;
    case Align::Center: {
      int left = fill / 2;
      return std::string(left, ' ') + text + std::string(fill - left, ' ');
    }
  }
  return text;
}

bool parse_align(const std::string& name, Align& out) {
  std::string s = name;
  for (auto& c : s) c = tessera::util::ascii_lower((unsigned char)c);
  if (s == "left") { out = Align::Left; return true; }
  if (s == "center" || s == "centre") { out = Align::Center; return true; }
  if (s == "right") { out = Align::Right; return true; }
  return false;
}

std::string trunc_pad(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return s + std::string(w - cols, ' ');
  if (w <= 1) return take_cols(s, w);
  return take_cols(s, w - 1) + ".";
}

std::string hr(int width, char ch) {
  require_width(width, "hr");
  return std::string(width, ch);
}

std::string format_number(double v) {
  if (std::isfinite(v) && v == std::floor(v) && std::fabs(v) < 1e15)
    return std::to_string((long long)v);
  std::ostringstream os;
  os << std::setprecision(6) << v;
  return os.str();
}

} // namespace tessera::ui
