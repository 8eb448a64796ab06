// snapshot.cpp - Attribute values and immutable snapshots

#include "keymorph/snapshot.hpp"

#include <sstream>

namespace keymorph {

AttributeKind kind_of(const AttributeValue& value) {
    return static_cast<AttributeKind>(value.index());
}

const char* attribute_kind_name(AttributeKind kind) {
    switch (kind) {
        case AttributeKind::NUMBER: return "number";
        case AttributeKind::ANGLE: return "angle";
        case AttributeKind::COLOR: return "color";
        case AttributeKind::BOOLEAN: return "boolean";
        case AttributeKind::TOKEN: return "token";
        case AttributeKind::CONTOURS: return "contours";
    }
    return "unknown";
}

std::string describe(const AttributeValue& value) {
    std::ostringstream oss;
    switch (kind_of(value)) {
        case AttributeKind::NUMBER:
            oss << std::get<double>(value);
            break;
        case AttributeKind::ANGLE:
            oss << std::get<Angle>(value).degrees << "deg";
            break;
        case AttributeKind::COLOR:
            oss << std::get<Color>(value).to_hex();
            break;
        case AttributeKind::BOOLEAN:
            oss << (std::get<bool>(value) ? "true" : "false");
            break;
        case AttributeKind::TOKEN:
            oss << '"' << std::get<std::string>(value) << '"';
            break;
        case AttributeKind::CONTOURS: {
            const auto& contours = std::get<ContourSet>(value);
            oss << "contours(" << contours.outer.size() << " pts, "
                << contours.holes.size() << " holes)";
            break;
        }
    }
    return oss.str();
}

std::size_t hash_value(const AttributeValue& value) {
    std::size_t h = value.index();
    switch (kind_of(value)) {
        case AttributeKind::NUMBER:
            hash_mix(h, hash_double(std::get<double>(value)));
            break;
        case AttributeKind::ANGLE:
            hash_mix(h, hash_double(std::get<Angle>(value).degrees));
            break;
        case AttributeKind::COLOR:
            hash_mix(h, std::get<Color>(value).hash());
            break;
        case AttributeKind::BOOLEAN:
            hash_mix(h, std::get<bool>(value) ? 1u : 0u);
            break;
        case AttributeKind::TOKEN:
            hash_mix(h, std::hash<std::string>{}(std::get<std::string>(value)));
            break;
        case AttributeKind::CONTOURS:
            hash_mix(h, hash_contours(std::get<ContourSet>(value)));
            break;
    }
    return h;
}

// =============================================================================
// Snapshot
// =============================================================================

double Snapshot::number_or(const std::string& name, double fallback) const {
    const AttributeValue* value = find(name);
    if (!value) return fallback;
    if (const double* number = std::get_if<double>(value)) return *number;
    if (const Angle* angle = std::get_if<Angle>(value)) return angle->degrees;
    return fallback;
}

Snapshot Snapshot::with(const std::string& name, AttributeValue value) const {
    AttributeMap attributes = attributes_;
    attributes.insert_or_assign(name, std::move(value));
    return Snapshot(variant_, std::move(attributes));
}

Snapshot Snapshot::with_variant(std::string variant) const {
    return Snapshot(std::move(variant), attributes_);
}

Snapshot Snapshot::without(const std::string& name) const {
    AttributeMap attributes = attributes_;
    attributes.erase(name);
    return Snapshot(variant_, std::move(attributes));
}

std::size_t Snapshot::hash() const {
    std::size_t h = std::hash<std::string>{}(variant_);
    for (const auto& [name, value] : attributes_) {
        hash_mix(h, std::hash<std::string>{}(name));
        hash_mix(h, hash_value(value));
    }
    return h;
}

} // namespace keymorph
