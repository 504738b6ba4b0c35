#include "swarm/rendering/color.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace Rendering {

namespace {

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    return -1;
}

double hueToChannel(double p, double q, double t) {
    if (t < 0.0) t += 1.0;
    if (t > 1.0) t -= 1.0;
    if (t < 1.0 / 6.0) return p + (q - p) * 6.0 * t;
    if (t < 1.0 / 2.0) return q;
    if (t < 2.0 / 3.0) return p + (q - p) * (2.0 / 3.0 - t) * 6.0;
    return p;
}

std::uint8_t toByte(double v) {
    return static_cast<std::uint8_t>(std::lround(std::clamp(v, 0.0, 1.0) * 255.0));
}

} // namespace

std::optional<Rgba> parseHexColor(const std::string& hex) {
    std::size_t start = (!hex.empty() && hex[0] == '#') ? 1 : 0;
    if (hex.size() - start != 6) {
        return std::nullopt;
    }

    int channels[3];
    for (int i = 0; i < 3; ++i) {
        int const hi = hexDigit(hex[start + 2 * i]);
        int const lo = hexDigit(hex[start + 2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        channels[i] = hi * 16 + lo;
    }

    Rgba out;
    out.r = static_cast<std::uint8_t>(channels[0]);
    out.g = static_cast<std::uint8_t>(channels[1]);
    out.b = static_cast<std::uint8_t>(channels[2]);
    out.a = 255;
    return out;
}

Rgba offsetLightness(const Rgba& color, double delta) {
    double const r = color.r / 255.0;
    double const g = color.g / 255.0;
    double const b = color.b / 255.0;

    double const maxC = std::max({r, g, b});
    double const minC = std::min({r, g, b});
    double h = 0.0;
    double s = 0.0;
    double l = (maxC + minC) / 2.0;

    if (maxC != minC) {
        double const d = maxC - minC;
        s = (l > 0.5) ? d / (2.0 - maxC - minC) : d / (maxC + minC);
        if (maxC == r) {
            h = (g - b) / d + (g < b ? 6.0 : 0.0);
        } else if (maxC == g) {
            h = (b - r) / d + 2.0;
        } else {
            h = (r - g) / d + 4.0;
        }
        h /= 6.0;
    }

    l = std::clamp(l + delta, 0.0, 1.0);

    Rgba out;
    out.a = color.a;
    if (s == 0.0) {
        out.r = out.g = out.b = toByte(l);
        return out;
    }

    double const q = (l < 0.5) ? l * (1.0 + s) : l + s - l * s;
    double const p = 2.0 * l - q;
    out.r = toByte(hueToChannel(p, q, h + 1.0 / 3.0));
    out.g = toByte(hueToChannel(p, q, h));
    out.b = toByte(hueToChannel(p, q, h - 1.0 / 3.0));
    return out;
}

} // namespace Rendering
