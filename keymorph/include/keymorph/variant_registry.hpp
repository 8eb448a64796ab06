#ifndef KEYMORPH_VARIANT_REGISTRY_HPP
#define KEYMORPH_VARIANT_REGISTRY_HPP

#include <keymorph/easing.hpp>
#include <keymorph/geometry.hpp>
#include <keymorph/snapshot.hpp>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace keymorph {

// Builds the outline of a snapshot from its size attributes
using GeometryGenerator = std::function<ContourSet(const Snapshot&)>;

struct VariantTraits {
    std::map<std::string, EasingFunction> default_easing;
    GeometryGenerator geometry;  // Empty for variants without an outline
};

/**
 * Per-variant behavior table: default easing per attribute and the geometry
 * generator. Populated once at startup and handed to the engine explicitly.
 * Lookups are read-only and safe to share across threads.
 */
class VariantRegistry {
private:
    std::map<std::string, VariantTraits> traits_;

public:
    VariantRegistry() = default;

    // Replaces any previous registration under `variant`
    void register_variant(const std::string& variant, VariantTraits traits);

    void set_default_easing(const std::string& variant, const std::string& attribute,
                            EasingFunction easing);

    void set_geometry(const std::string& variant, GeometryGenerator generator);

    bool contains(const std::string& variant) const {
        return traits_.find(variant) != traits_.end();
    }

    const VariantTraits* find(const std::string& variant) const;

    // Null when neither the variant nor the attribute is registered
    const EasingFunction* default_easing(const std::string& variant,
                                         const std::string& attribute) const;

    bool has_geometry(const std::string& variant) const;

    /**
     * Outline for `snapshot` from its variant's generator, nullopt when the
     * variant has none.
     */
    std::optional<ContourSet> generate(const Snapshot& snapshot) const;

    std::vector<std::string> variants() const;

    std::size_t size() const { return traits_.size(); }
};

} // namespace keymorph

#endif // KEYMORPH_VARIANT_REGISTRY_HPP
