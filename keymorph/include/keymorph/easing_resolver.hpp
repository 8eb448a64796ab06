#ifndef KEYMORPH_EASING_RESOLVER_HPP
#define KEYMORPH_EASING_RESOLVER_HPP

#include <keymorph/easing.hpp>
#include <keymorph/timeline.hpp>
#include <keymorph/variant_registry.hpp>
#include <map>
#include <memory>
#include <string>

namespace keymorph {

// Which priority level produced an easing
enum class EasingSource {
    SEGMENT_OVERRIDE,   // Declared on the destination keystate
    ENTITY_OVERRIDE,    // Animation-wide per-attribute override
    VARIANT_DEFAULT,    // Registry table of the segment's start variant
    LINEAR_FALLBACK
};

const char* easing_source_name(EasingSource source);

struct ResolvedEasing {
    EasingFunction function;
    EasingSource source;
};

/**
 * Picks the easing for one attribute over one timeline segment.
 * Pure; callers resolve once per attribute per frame.
 */
class EasingResolver {
private:
    std::shared_ptr<const VariantRegistry> registry_;
    std::map<std::string, EasingFunction> entity_overrides_;

public:
    explicit EasingResolver(std::shared_ptr<const VariantRegistry> registry = nullptr,
                            std::map<std::string, EasingFunction> entity_overrides = {})
        : registry_(std::move(registry)), entity_overrides_(std::move(entity_overrides)) {}

    ResolvedEasing resolve_with_source(const std::string& attribute,
                                       const KeyState& from, const KeyState& to) const;

    EasingFunction resolve(const std::string& attribute,
                           const KeyState& from, const KeyState& to) const {
        return resolve_with_source(attribute, from, to).function;
    }

    /**
     * Levels 2 to 4 only; used by property timelines, which carry no
     * keystate overrides.
     */
    ResolvedEasing resolve_for_property(const std::string& attribute,
                                        const std::string& variant) const;

    const std::map<std::string, EasingFunction>& entity_overrides() const {
        return entity_overrides_;
    }
};

} // namespace keymorph

#endif // KEYMORPH_EASING_RESOLVER_HPP
