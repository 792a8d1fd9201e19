#pragma once

#include <string>
#include <vector>

namespace tessera::ui {

enum class Align { Left, Center, Right };

// UTF-8 column utilities (one column per code point)
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);
std::string drop_cols(const std::string& s, int cols);

// Line cleanup
std::string sanitize(const std::string& s);
std::vector<std::string> split_lines(const std::string& text);

// Wrapping. Both raise InvalidConfig when width <= 0.
std::vector<std::string> wrap(const std::string& text, int width);
std::vector<std::string> hard_break(const std::string& line, int width);

// Alignment and padding
std::string align(const std::string& text, int width, Align mode = Align::Left);
bool parse_align(const std::string& name, Align& out);
std::string trunc_pad(const std::string& s, int w);
std::string hr(int width, char ch = '-');

// Numbers are printed without a fractional part when they are integral
std::string format_number(double v);

} // namespace tessera::ui
