#ifndef KEYMORPH_INTERPOLATION_ENGINE_HPP
#define KEYMORPH_INTERPOLATION_ENGINE_HPP

#include <keymorph/contour_morph.hpp>
#include <keymorph/easing_resolver.hpp>
#include <keymorph/morph_cache.hpp>
#include <keymorph/morphing_config.hpp>
#include <keymorph/snapshot.hpp>
#include <keymorph/timeline.hpp>
#include <keymorph/variant_registry.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace keymorph {

// Shortest signed arc from `from` to `to`, degrees, eased progress `t`
double interpolate_angle(double from, double to, double t);

/**
 * Evaluates a timeline at an instant.
 *
 * Stateless apart from the optional shared MorphCache; one engine may serve
 * any number of threads. Shared attributes are interpolated with the easing
 * picked by the EasingResolver. Attributes present on one side only, or
 * whose kinds differ, are taken from the endpoint that currently supplies
 * the output variant.
 */
class InterpolationEngine {
private:
    std::shared_ptr<const VariantRegistry> registry_;
    EasingResolver easing_;
    MorphingConfig config_;
    HoleMatcherPtr hole_matcher_;
    std::shared_ptr<MorphCache> cache_;

public:
    explicit InterpolationEngine(std::shared_ptr<const VariantRegistry> registry = nullptr,
                                 std::map<std::string, EasingFunction> entity_easing = {},
                                 MorphingConfig config = {},
                                 std::shared_ptr<MorphCache> cache = nullptr);

    /**
     * Snapshot at normalized time `t`. At or before the first keystate the
     * first snapshot is returned unchanged, likewise at or after the last.
     */
    Snapshot evaluate(const Timeline& timeline, double t) const;

    /**
     * Interpolate across one segment at local progress `t_local` in [0, 1].
     * With differing variants the output variant switches to the end
     * snapshot's from t_local >= 0.5.
     */
    Snapshot interpolate_segment(const KeyState& from, const KeyState& to, double t_local) const;

    /**
     * Outline of `snapshot`: its explicit `contours` attribute, otherwise the
     * registry's generated geometry, otherwise nullopt.
     */
    std::optional<ContourSet> contours_of(const Snapshot& snapshot) const;

    // `snapshot` with its generated outline stored under `contours`
    Snapshot with_geometry(const Snapshot& snapshot) const;

    /**
     * Morph between two outlines. `to` supplies the segment's morphing
     * override; rotations come from the endpoints' `rotation` attributes.
     */
    ContourSet morph_contours(const ContourSet& start, const ContourSet& end, double t,
                              const Snapshot& from_snapshot, const Snapshot& to_snapshot,
                              const MorphingOverride& overrides) const;

    /**
     * Blend two values of the same kind at eased progress `eased`.
     * Returns nullopt when the kinds differ.
     */
    std::optional<AttributeValue> blend(const AttributeValue& a, const AttributeValue& b, double eased,
                                        const Snapshot& from_snapshot, const Snapshot& to_snapshot,
                                        const MorphingOverride& overrides = {}) const;

    const MorphingConfig& config() const { return config_; }
    const EasingResolver& easing() const { return easing_; }
    const std::shared_ptr<const VariantRegistry>& registry() const { return registry_; }
    const std::shared_ptr<MorphCache>& cache() const { return cache_; }
};

} // namespace keymorph

#endif // KEYMORPH_INTERPOLATION_ENGINE_HPP
