// variant_registry.cpp - Variant id -> easing table and geometry generator

#include "keymorph/variant_registry.hpp"
#include "keymorph/debug_log.hpp"

namespace keymorph {

void VariantRegistry::register_variant(const std::string& variant, VariantTraits traits) {
    KEYMORPH_DEBUG_LOG("Registering variant '%s' (%zu easing defaults, geometry=%d)",
                       variant.c_str(), traits.default_easing.size(),
                       traits.geometry ? 1 : 0);
    traits_.insert_or_assign(variant, std::move(traits));
}

void VariantRegistry::set_default_easing(const std::string& variant, const std::string& attribute,
                                         EasingFunction easing) {
    traits_[variant].default_easing.insert_or_assign(attribute, std::move(easing));
}

void VariantRegistry::set_geometry(const std::string& variant, GeometryGenerator generator) {
    traits_[variant].geometry = std::move(generator);
}

const VariantTraits* VariantRegistry::find(const std::string& variant) const {
    auto it = traits_.find(variant);
    return it == traits_.end() ? nullptr : &it->second;
}

const EasingFunction* VariantRegistry::default_easing(const std::string& variant,
                                                      const std::string& attribute) const {
    const VariantTraits* traits = find(variant);
    if (!traits) return nullptr;
    auto it = traits->default_easing.find(attribute);
    return it == traits->default_easing.end() ? nullptr : &it->second;
}

bool VariantRegistry::has_geometry(const std::string& variant) const {
    const VariantTraits* traits = find(variant);
    return traits && static_cast<bool>(traits->geometry);
}

std::optional<ContourSet> VariantRegistry::generate(const Snapshot& snapshot) const {
    const VariantTraits* traits = find(snapshot.variant());
    if (!traits || !traits->geometry) return std::nullopt;
    return traits->geometry(snapshot);
}

std::vector<std::string> VariantRegistry::variants() const {
    std::vector<std::string> result;
    result.reserve(traits_.size());
    for (const auto& [name, traits] : traits_) {
        result.push_back(name);
    }
    return result;
}

} // namespace keymorph
