#ifndef KEYMORPH_TYPES_HPP
#define KEYMORPH_TYPES_HPP

#include <cstddef>
#include <cstring>
#include <cstdint>
#include <functional>
#include <numbers>

namespace keymorph {

constexpr double PI = std::numbers::pi;
constexpr double TWO_PI = 2.0 * std::numbers::pi;

// Below this magnitude a signed area is treated as zero
constexpr double AREA_EPSILON = 1e-10;

// Default outline resolution for generated geometry
constexpr std::size_t DEFAULT_NUM_VERTICES = 128;

// Reserved attribute holding generated or explicit outline geometry
constexpr const char* CONTOURS_ATTRIBUTE = "contours";

inline double degrees_to_radians(double degrees) {
    return degrees * PI / 180.0;
}

inline double radians_to_degrees(double radians) {
    return radians * 180.0 / PI;
}

inline double lerp(double a, double b, double t) {
    return a + (b - a) * t;
}

inline double clamp_unit(double t) {
    return t < 0.0 ? 0.0 : (t > 1.0 ? 1.0 : t);
}

struct Point2D {
    double x = 0.0;
    double y = 0.0;

    constexpr Point2D() = default;
    constexpr Point2D(double px, double py) : x(px), y(py) {}

    constexpr Point2D operator+(const Point2D& o) const { return {x + o.x, y + o.y}; }
    constexpr Point2D operator-(const Point2D& o) const { return {x - o.x, y - o.y}; }
    constexpr Point2D operator*(double s) const { return {x * s, y * s}; }
    constexpr bool operator==(const Point2D& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point2D& o) const { return !(*this == o); }
};

inline Point2D lerp(const Point2D& a, const Point2D& b, double t) {
    return {lerp(a.x, b.x, t), lerp(a.y, b.y, t)};
}

// Mixes `value` into `seed`
inline void hash_mix(std::size_t& seed, std::size_t value) {
    seed ^= value + 0x9e3779b9 + (seed << 6) + (seed >> 2);
}

// Bitwise hash of a double, with -0.0 folded onto 0.0
inline std::size_t hash_double(double value) {
    if (value == 0.0) value = 0.0;
    std::uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return std::hash<std::uint64_t>{}(bits);
}

} // namespace keymorph

namespace std {
    template<>
    struct hash<keymorph::Point2D> {
        std::size_t operator()(const keymorph::Point2D& p) const {
            std::size_t h = keymorph::hash_double(p.x);
            keymorph::hash_mix(h, keymorph::hash_double(p.y));
            return h;
        }
    };
}

#endif // KEYMORPH_TYPES_HPP
