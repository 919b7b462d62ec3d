#include "utils/Color.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace holdings::utils {

namespace {

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower >= 'a' && lower <= 'f') return lower - 'a' + 10;
    return -1;
}

// Остаток в [0, 1) для любого знака аргумента
double wrapUnit(double value) {
    double r = std::fmod(value, 1.0);
    return r < 0.0 ? r + 1.0 : r;
}

double hueChannel(double m1, double m2, double hue) {
    hue = wrapUnit(hue);
    if (hue < 1.0 / 6.0) return m1 + (m2 - m1) * hue * 6.0;
    if (hue < 0.5) return m2;
    if (hue < 2.0 / 3.0) return m1 + (m2 - m1) * (2.0 / 3.0 - hue) * 6.0;
    return m1;
}

int toByte(double channel) {
    double clamped = std::min(1.0, std::max(0.0, channel));
    return static_cast<int>(clamped * 255.0);
}

} // namespace

std::optional<Rgb> parseHexColor(const std::string& hex) {
    std::string digits = (!hex.empty() && hex[0] == '#') ? hex.substr(1) : hex;
    if (digits.size() != 6 && digits.size() != 3) {
        return std::nullopt;
    }

    std::size_t width = digits.size() / 3;
    int channels[3] = {0, 0, 0};
    for (std::size_t i = 0; i < 3; ++i) {
        int value = 0;
        for (std::size_t k = 0; k < width; ++k) {
            int d = hexDigit(digits[i * width + k]);
            if (d < 0) {
                return std::nullopt;
            }
            value = value * 16 + d;
        }
        if (width == 1) {
            value = value * 17; // #abc -> #aabbcc
        }
        channels[i] = value;
    }

    return Rgb{channels[0] / 255.0, channels[1] / 255.0, channels[2] / 255.0};
}

std::string toHexColor(const Rgb& color) {
    std::ostringstream ss;
    ss << '#' << std::hex << std::setfill('0')
       << std::setw(2) << toByte(color.r)
       << std::setw(2) << toByte(color.g)
       << std::setw(2) << toByte(color.b);
    return ss.str();
}

Hls rgbToHls(const Rgb& c) {
    double maxc = std::max({c.r, c.g, c.b});
    double minc = std::min({c.r, c.g, c.b});
    double sum = maxc + minc;
    double range = maxc - minc;

    Hls out;
    out.l = sum / 2.0;
    if (minc == maxc) {
        return out;
    }

    out.s = (out.l <= 0.5) ? range / sum : range / (2.0 - maxc - minc);

    double rc = (maxc - c.r) / range;
    double gc = (maxc - c.g) / range;
    double bc = (maxc - c.b) / range;

    double h;
    if (c.r == maxc) {
        h = bc - gc;
    } else if (c.g == maxc) {
        h = 2.0 + rc - bc;
    } else {
        h = 4.0 + gc - rc;
    }
    out.h = wrapUnit(h / 6.0);
    return out;
}

Rgb hlsToRgb(const Hls& c) {
    if (c.s == 0.0) {
        return Rgb{c.l, c.l, c.l};
    }
    double m2 = (c.l <= 0.5) ? c.l * (1.0 + c.s) : c.l + c.s - c.l * c.s;
    double m1 = 2.0 * c.l - m2;
    return Rgb{
        hueChannel(m1, m2, c.h + 1.0 / 3.0),
        hueChannel(m1, m2, c.h),
        hueChannel(m1, m2, c.h - 1.0 / 3.0)
    };
}

std::string lightenColor(const std::string& hex, double amount) {
    auto rgb = parseHexColor(hex);
    if (!rgb) {
        throw std::invalid_argument("lightenColor: invalid hex color '" + hex + "'");
    }

    Hls hls = rgbToHls(*rgb);
    hls.l = std::min(1.0, hls.l + amount * (1.0 - hls.l));
    return toHexColor(hlsToRgb(hls));
}

} // namespace holdings::utils
