#include "irodori/color.hpp"
#include <cmath>
#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace irodori {

double perceptual_distance(const Rgb& a, const Rgb& b) {
    double dr = static_cast<double>(a.r) - static_cast<double>(b.r);
    double dg = static_cast<double>(a.g) - static_cast<double>(b.g);
    double db = static_cast<double>(a.b) - static_cast<double>(b.b);
    return std::sqrt(dr * dr * 0.30 + dg * dg * 0.59 + db * db * 0.11);
}

std::string to_hex(const Rgb& color) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", color.r, color.g, color.b);
    return std::string(buf);
}

namespace {
int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}
}  // namespace

Rgb parse_hex(const std::string& text) {
    size_t pos = (!text.empty() && text[0] == '#') ? 1 : 0;
    if (text.size() != pos + 6) {
        throw std::invalid_argument("Invalid color: " + text);
    }
    uint8_t channels[3];
    for (size_t i = 0; i < 3; ++i) {
        int hi = hex_digit(text[pos + i * 2]);
        int lo = hex_digit(text[pos + i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid color: " + text);
        }
        channels[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return Rgb{channels[0], channels[1], channels[2]};
}

Palette::Palette(std::vector<Rgb> colors)
    : colors_(std::move(colors)) {}

const Rgb& Palette::color(ColorIndex index) const {
    if (index == BACKGROUND || index > colors_.size()) {
        throw std::out_of_range("Color index out of range: " + std::to_string(index));
    }
    return colors_[index - 1];
}

} // namespace irodori
