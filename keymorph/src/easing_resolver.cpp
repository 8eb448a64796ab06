// easing_resolver.cpp - Four-level easing priority

#include "keymorph/easing_resolver.hpp"

namespace keymorph {

const char* easing_source_name(EasingSource source) {
    switch (source) {
        case EasingSource::SEGMENT_OVERRIDE: return "segment";
        case EasingSource::ENTITY_OVERRIDE: return "entity";
        case EasingSource::VARIANT_DEFAULT: return "variant";
        case EasingSource::LINEAR_FALLBACK: return "linear";
    }
    return "unknown";
}

ResolvedEasing EasingResolver::resolve_with_source(const std::string& attribute,
                                                   const KeyState& from, const KeyState& to) const {
    auto it = to.easing.find(attribute);
    if (it != to.easing.end() && it->second) {
        return {it->second, EasingSource::SEGMENT_OVERRIDE};
    }
    return resolve_for_property(attribute, from.snapshot.variant());
}

ResolvedEasing EasingResolver::resolve_for_property(const std::string& attribute,
                                                    const std::string& variant) const {
    auto it = entity_overrides_.find(attribute);
    if (it != entity_overrides_.end() && it->second) {
        return {it->second, EasingSource::ENTITY_OVERRIDE};
    }

    if (registry_) {
        const EasingFunction* fallback = registry_->default_easing(variant, attribute);
        if (fallback && *fallback) {
            return {*fallback, EasingSource::VARIANT_DEFAULT};
        }
    }

    return {&easing::linear, EasingSource::LINEAR_FALLBACK};
}

} // namespace keymorph
