#ifndef KEYMORPH_SNAPSHOT_HPP
#define KEYMORPH_SNAPSHOT_HPP

#include <keymorph/color.hpp>
#include <keymorph/geometry.hpp>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace keymorph {

// Angle in degrees. Interpolates along the shortest signed arc, unlike a plain number.
struct Angle {
    double degrees = 0.0;

    constexpr Angle() = default;
    constexpr explicit Angle(double deg) : degrees(deg) {}

    constexpr bool operator==(const Angle& other) const { return degrees == other.degrees; }
    constexpr bool operator!=(const Angle& other) const { return !(*this == other); }
};

/**
 * Attribute value variants:
 *   double      - numeric, interpolated linearly
 *   Angle       - degrees, interpolated along the shortest arc
 *   Color       - RGBA, interpolated per component
 *   bool        - switches at progress 0.5
 *   std::string - enum-like token, switches at progress 0.5
 *   ContourSet  - outline geometry, morphed through alignment and hole matching
 */
using AttributeValue = std::variant<double, Angle, Color, bool, std::string, ContourSet>;

enum class AttributeKind {
    NUMBER,
    ANGLE,
    COLOR,
    BOOLEAN,
    TOKEN,
    CONTOURS
};

AttributeKind kind_of(const AttributeValue& value);

const char* attribute_kind_name(AttributeKind kind);

// Short human-readable rendering for logs and test failure messages
std::string describe(const AttributeValue& value);

std::size_t hash_value(const AttributeValue& value);

using AttributeMap = std::map<std::string, AttributeValue>;

/**
 * Immutable attribute record tagged with the variant identifier of the
 * entity kind it describes ("circle", "rectangle", ...).
 * Modifiers return new snapshots.
 */
class Snapshot {
private:
    std::string variant_;
    AttributeMap attributes_;

public:
    Snapshot() = default;
    explicit Snapshot(std::string variant, AttributeMap attributes = {})
        : variant_(std::move(variant)), attributes_(std::move(attributes)) {}

    const std::string& variant() const { return variant_; }
    const AttributeMap& attributes() const { return attributes_; }
    std::size_t size() const { return attributes_.size(); }

    bool has(const std::string& name) const {
        return attributes_.find(name) != attributes_.end();
    }

    const AttributeValue* find(const std::string& name) const {
        auto it = attributes_.find(name);
        return it == attributes_.end() ? nullptr : &it->second;
    }

    template<typename T>
    std::optional<T> get(const std::string& name) const {
        const AttributeValue* value = find(name);
        if (!value) return std::nullopt;
        if (const T* typed = std::get_if<T>(value)) return *typed;
        return std::nullopt;
    }

    /**
     * Numeric view of a number or angle attribute, `fallback` otherwise.
     */
    double number_or(const std::string& name, double fallback) const;

    Snapshot with(const std::string& name, AttributeValue value) const;
    Snapshot with_variant(std::string variant) const;
    Snapshot without(const std::string& name) const;

    bool operator==(const Snapshot& other) const {
        return variant_ == other.variant_ && attributes_ == other.attributes_;
    }
    bool operator!=(const Snapshot& other) const { return !(*this == other); }

    std::size_t hash() const;
};

} // namespace keymorph

#endif // KEYMORPH_SNAPSHOT_HPP
