// color.cpp - Color parsing and interpolation across color spaces

#include "keymorph/color.hpp"
#include "keymorph/types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace keymorph {

namespace {

struct Triple {
    double x, y, z;
};

double clamp_channel(double v) {
    return std::max(0.0, std::min(255.0, v));
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

// Hue blend along the shorter way around the wheel, degrees
double blend_hue(double from, double to, double t) {
    if (std::abs(to - from) > 180.0) {
        if (to > from) {
            from += 360.0;
        } else {
            to += 360.0;
        }
    }
    double h = std::fmod(lerp(from, to, t), 360.0);
    return h < 0.0 ? h + 360.0 : h;
}

// =============================================================================
// HSV
// =============================================================================

Triple rgb_to_hsv(const Color& c) {
    double r = c.r() / 255.0, g = c.g() / 255.0, b = c.b() / 255.0;
    double maxc = std::max({r, g, b});
    double minc = std::min({r, g, b});
    double v = maxc;
    if (maxc == minc) return {0.0, 0.0, v};

    double delta = maxc - minc;
    double s = delta / maxc;
    double h;
    if (maxc == r) {
        h = (g - b) / delta;
    } else if (maxc == g) {
        h = 2.0 + (b - r) / delta;
    } else {
        h = 4.0 + (r - g) / delta;
    }
    h = std::fmod(h / 6.0, 1.0);
    if (h < 0.0) h += 1.0;
    return {h * 360.0, s, v};
}

Triple hsv_to_rgb(const Triple& hsv) {
    double h = hsv.x / 360.0, s = hsv.y, v = hsv.z;
    if (s == 0.0) return {v * 255.0, v * 255.0, v * 255.0};

    double sector = std::floor(h * 6.0);
    double f = h * 6.0 - sector;
    double p = v * (1.0 - s);
    double q = v * (1.0 - s * f);
    double t = v * (1.0 - s * (1.0 - f));
    double r, g, b;
    switch (static_cast<int>(sector) % 6) {
        case 0: r = v; g = t; b = p; break;
        case 1: r = q; g = v; b = p; break;
        case 2: r = p; g = v; b = t; break;
        case 3: r = p; g = q; b = v; break;
        case 4: r = t; g = p; b = v; break;
        default: r = v; g = p; b = q; break;
    }
    return {r * 255.0, g * 255.0, b * 255.0};
}

// =============================================================================
// CIE LAB (sRGB, D65)
// =============================================================================

using Matrix3 = std::array<std::array<double, 3>, 3>;

// Linear sRGB to XYZ; the reverse direction is its computed inverse so a
// round trip reproduces the input
constexpr Matrix3 RGB_TO_XYZ = {{
    {0.4124564, 0.3575761, 0.1804375},
    {0.2126729, 0.7151522, 0.0721750},
    {0.0193339, 0.1191920, 0.9503041},
}};

constexpr double WHITE_X = 0.95047;
constexpr double WHITE_Y = 1.00000;
constexpr double WHITE_Z = 1.08883;

Matrix3 invert(const Matrix3& m) {
    double c00 = m[1][1] * m[2][2] - m[1][2] * m[2][1];
    double c01 = m[1][2] * m[2][0] - m[1][0] * m[2][2];
    double c02 = m[1][0] * m[2][1] - m[1][1] * m[2][0];
    double det = m[0][0] * c00 + m[0][1] * c01 + m[0][2] * c02;

    Matrix3 inv;
    inv[0][0] = c00 / det;
    inv[0][1] = (m[0][2] * m[2][1] - m[0][1] * m[2][2]) / det;
    inv[0][2] = (m[0][1] * m[1][2] - m[0][2] * m[1][1]) / det;
    inv[1][0] = c01 / det;
    inv[1][1] = (m[0][0] * m[2][2] - m[0][2] * m[2][0]) / det;
    inv[1][2] = (m[0][2] * m[1][0] - m[0][0] * m[1][2]) / det;
    inv[2][0] = c02 / det;
    inv[2][1] = (m[0][1] * m[2][0] - m[0][0] * m[2][1]) / det;
    inv[2][2] = (m[0][0] * m[1][1] - m[0][1] * m[1][0]) / det;
    return inv;
}

const Matrix3& xyz_to_rgb_matrix() {
    static const Matrix3 inverse = invert(RGB_TO_XYZ);
    return inverse;
}

double srgb_to_linear(double c) {
    return c > 0.04045 ? std::pow((c + 0.055) / 1.055, 2.4) : c / 12.92;
}

double linear_to_srgb(double c) {
    return c > 0.0031308 ? 1.055 * std::pow(c, 1.0 / 2.4) - 0.055 : 12.92 * c;
}

double lab_f(double t) {
    return t > 0.008856 ? std::cbrt(t) : 7.787 * t + 16.0 / 116.0;
}

double lab_f_inv(double t) {
    double cubed = t * t * t;
    return cubed > 0.008856 ? cubed : (t - 16.0 / 116.0) / 7.787;
}

Triple rgb_to_lab(const Color& c) {
    double r = srgb_to_linear(c.r() / 255.0);
    double g = srgb_to_linear(c.g() / 255.0);
    double b = srgb_to_linear(c.b() / 255.0);

    const Matrix3& m = RGB_TO_XYZ;
    double x = (m[0][0] * r + m[0][1] * g + m[0][2] * b) / WHITE_X;
    double y = (m[1][0] * r + m[1][1] * g + m[1][2] * b) / WHITE_Y;
    double z = (m[2][0] * r + m[2][1] * g + m[2][2] * b) / WHITE_Z;

    double fx = lab_f(x), fy = lab_f(y), fz = lab_f(z);
    return {116.0 * fy - 16.0, 500.0 * (fx - fy), 200.0 * (fy - fz)};
}

Triple lab_to_rgb(const Triple& lab) {
    double fy = (lab.x + 16.0) / 116.0;
    double fx = lab.y / 500.0 + fy;
    double fz = fy - lab.z / 200.0;

    double x = WHITE_X * lab_f_inv(fx);
    double y = WHITE_Y * lab_f_inv(fy);
    double z = WHITE_Z * lab_f_inv(fz);

    const Matrix3& m = xyz_to_rgb_matrix();
    double r = m[0][0] * x + m[0][1] * y + m[0][2] * z;
    double g = m[1][0] * x + m[1][1] * y + m[1][2] * z;
    double b = m[2][0] * x + m[2][1] * y + m[2][2] * z;

    return {clamp_channel(linear_to_srgb(r) * 255.0),
            clamp_channel(linear_to_srgb(g) * 255.0),
            clamp_channel(linear_to_srgb(b) * 255.0)};
}

Triple lab_to_lch(const Triple& lab) {
    double c = std::hypot(lab.y, lab.z);
    double h = radians_to_degrees(std::atan2(lab.z, lab.y));
    if (h < 0.0) h += 360.0;
    return {lab.x, c, h};
}

Triple lch_to_lab(const Triple& lch) {
    double rad = degrees_to_radians(lch.z);
    return {lch.x, lch.y * std::cos(rad), lch.y * std::sin(rad)};
}

} // anonymous namespace

// =============================================================================
// Color
// =============================================================================

Color Color::from_hex(const std::string& hex) {
    if (hex == "none") return none();

    std::string digits = (!hex.empty() && hex[0] == '#') ? hex.substr(1) : hex;
    if (digits.size() == 3) {
        digits = {digits[0], digits[0], digits[1], digits[1], digits[2], digits[2]};
    }
    if (digits.size() != 6 && digits.size() != 8) {
        throw std::invalid_argument("Invalid hex color: '" + hex + "'");
    }

    int channels[4] = {0, 0, 0, 255};
    for (std::size_t i = 0; i < digits.size(); i += 2) {
        int hi = hex_digit(digits[i]);
        int lo = hex_digit(digits[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex color: '" + hex + "'");
        }
        channels[i / 2] = hi * 16 + lo;
    }
    return Color(channels[0], channels[1], channels[2], channels[3] / 255.0);
}

std::string Color::to_hex() const {
    if (is_none_) return "none";

    auto byte = [](double v) { return static_cast<int>(std::lround(clamp_channel(v))); };
    char buffer[16];
    if (a_ >= 1.0) {
        snprintf(buffer, sizeof(buffer), "#%02x%02x%02x", byte(r_), byte(g_), byte(b_));
    } else {
        snprintf(buffer, sizeof(buffer), "#%02x%02x%02x%02x",
                 byte(r_), byte(g_), byte(b_), byte(a_ * 255.0));
    }
    return buffer;
}

Color Color::interpolate(const Color& other, double t, ColorSpace space) const {
    if (is_none_) return other;
    if (other.is_none_) return *this;
    if (t <= 0.0) return *this;
    if (t >= 1.0) return other;

    double alpha = lerp(a_, other.a_, t);

    switch (space) {
        case ColorSpace::HSV: {
            Triple from = rgb_to_hsv(*this);
            Triple to = rgb_to_hsv(other);
            Triple rgb = hsv_to_rgb({blend_hue(from.x, to.x, t),
                                     lerp(from.y, to.y, t),
                                     lerp(from.z, to.z, t)});
            return Color(rgb.x, rgb.y, rgb.z, alpha);
        }
        case ColorSpace::LAB: {
            Triple from = rgb_to_lab(*this);
            Triple to = rgb_to_lab(other);
            Triple rgb = lab_to_rgb({lerp(from.x, to.x, t),
                                     lerp(from.y, to.y, t),
                                     lerp(from.z, to.z, t)});
            return Color(rgb.x, rgb.y, rgb.z, alpha);
        }
        case ColorSpace::LCH: {
            Triple from = lab_to_lch(rgb_to_lab(*this));
            Triple to = lab_to_lch(rgb_to_lab(other));
            Triple rgb = lab_to_rgb(lch_to_lab({lerp(from.x, to.x, t),
                                                lerp(from.y, to.y, t),
                                                blend_hue(from.z, to.z, t)}));
            return Color(rgb.x, rgb.y, rgb.z, alpha);
        }
        case ColorSpace::RGB:
            break;
    }
    return Color(lerp(r_, other.r_, t), lerp(g_, other.g_, t), lerp(b_, other.b_, t), alpha);
}

std::size_t Color::hash() const {
    if (is_none_) return 0x6e6f6e65;
    std::size_t h = hash_double(r_);
    hash_mix(h, hash_double(g_));
    hash_mix(h, hash_double(b_));
    hash_mix(h, hash_double(a_));
    return h;
}

const char* color_space_name(ColorSpace space) {
    switch (space) {
        case ColorSpace::RGB: return "rgb";
        case ColorSpace::HSV: return "hsv";
        case ColorSpace::LAB: return "lab";
        case ColorSpace::LCH: return "lch";
    }
    return "unknown";
}

} // namespace keymorph
