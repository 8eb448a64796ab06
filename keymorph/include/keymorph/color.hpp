#ifndef KEYMORPH_COLOR_HPP
#define KEYMORPH_COLOR_HPP

#include <string>
#include <cstddef>

namespace keymorph {

enum class ColorSpace {
    RGB,   // Component-wise, the default
    HSV,   // Hue along the shortest arc of the color wheel
    LAB,   // CIE L*a*b*, D65 white point
    LCH    // Polar LAB with shortest-arc hue
};

/**
 * RGBA color. Channels r, g, b are in [0, 255], alpha in [0, 1].
 * Channels are kept as doubles so interpolated values are exact.
 */
class Color {
private:
    double r_ = 0.0;
    double g_ = 0.0;
    double b_ = 0.0;
    double a_ = 1.0;
    bool is_none_ = false;

public:
    constexpr Color() = default;
    constexpr Color(double r, double g, double b, double a = 1.0)
        : r_(r), g_(g), b_(b), a_(a) {}

    // Sentinel for "no paint"
    static Color none() {
        Color c;
        c.is_none_ = true;
        c.a_ = 0.0;
        return c;
    }

    /**
     * Parse "#rgb", "#rrggbb" or "#rrggbbaa" (leading '#' optional) or the
     * literal "none". Throws std::invalid_argument on anything else.
     */
    static Color from_hex(const std::string& hex);

    double r() const { return r_; }
    double g() const { return g_; }
    double b() const { return b_; }
    double a() const { return a_; }
    bool is_none() const { return is_none_; }

    Color with_alpha(double alpha) const {
        Color c = *this;
        c.a_ = alpha;
        return c;
    }

    // "#rrggbb", "#rrggbbaa" when alpha is not 1, or "none"
    std::string to_hex() const;

    /**
     * Blend toward `other`. A none endpoint switches immediately to the
     * real color. Alpha always interpolates linearly. t <= 0 and t >= 1
     * return the endpoints unchanged in every space.
     */
    Color interpolate(const Color& other, double t, ColorSpace space = ColorSpace::RGB) const;

    bool operator==(const Color& other) const {
        if (is_none_ || other.is_none_) return is_none_ == other.is_none_;
        return r_ == other.r_ && g_ == other.g_ && b_ == other.b_ && a_ == other.a_;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }

    std::size_t hash() const;
};

const char* color_space_name(ColorSpace space);

} // namespace keymorph

#endif // KEYMORPH_COLOR_HPP
