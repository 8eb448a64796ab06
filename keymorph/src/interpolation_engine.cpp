// interpolation_engine.cpp - Per-frame evaluation of keystate timelines

#include "keymorph/interpolation_engine.hpp"
#include "keymorph/debug_log.hpp"

#include <cmath>

namespace keymorph {

double interpolate_angle(double from, double to, double t) {
    double delta = std::fmod(to - from, 360.0);
    if (delta > 180.0) {
        delta -= 360.0;
    } else if (delta <= -180.0) {
        delta += 360.0;
    }
    return from + delta * t;
}

InterpolationEngine::InterpolationEngine(std::shared_ptr<const VariantRegistry> registry,
                                         std::map<std::string, EasingFunction> entity_easing,
                                         MorphingConfig config,
                                         std::shared_ptr<MorphCache> cache)
    : registry_(registry),
      easing_(std::move(registry), std::move(entity_easing)),
      config_(config),
      hole_matcher_(make_hole_matcher(config)),
      cache_(std::move(cache)) {}

// =============================================================================
// Timeline evaluation
// =============================================================================

Snapshot InterpolationEngine::evaluate(const Timeline& timeline, double t) const {
    if (t <= timeline.start_time()) return timeline.front().snapshot;
    if (t >= timeline.end_time()) return timeline.back().snapshot;

    std::size_t i = timeline.segment_index(t);
    double t0 = timeline.time(i);
    double t1 = timeline.time(i + 1);
    double t_local = clamp_unit((t - t0) / (t1 - t0));

    return interpolate_segment(timeline[i], timeline[i + 1], t_local);
}

Snapshot InterpolationEngine::interpolate_segment(const KeyState& from, const KeyState& to,
                                                  double t_local) const {
    const Snapshot& a = from.snapshot;
    const Snapshot& b = to.snapshot;
    t_local = clamp_unit(t_local);

    bool switched = a.variant() != b.variant() && t_local >= 0.5;
    const Snapshot& base = switched ? b : a;
    AttributeMap attributes = base.attributes();

    for (const auto& [name, value_a] : a.attributes()) {
        if (name == CONTOURS_ATTRIBUTE) continue;

        const AttributeValue* value_b = b.find(name);
        if (!value_b) continue;
        if (value_a == *value_b) continue;
        if (kind_of(value_a) != kind_of(*value_b)) {
            KEYMORPH_DEBUG_LOG("Attribute '%s' changes kind (%s -> %s), not interpolated", name.c_str(),
                               attribute_kind_name(kind_of(value_a)), attribute_kind_name(kind_of(*value_b)));
            continue;
        }

        double eased = easing_.resolve(name, from, to)(t_local);
        if (auto value = blend(value_a, *value_b, eased, a, b, to.morphing)) {
            attributes.insert_or_assign(name, std::move(*value));
        }
    }

    // Outline geometry, explicit or generated
    std::optional<ContourSet> start_contours = contours_of(a);
    std::optional<ContourSet> end_contours = contours_of(b);
    if (start_contours && end_contours) {
        if (*start_contours == *end_contours) {
            attributes.insert_or_assign(CONTOURS_ATTRIBUTE, std::move(*start_contours));
        } else {
            double eased = easing_.resolve(CONTOURS_ATTRIBUTE, from, to)(t_local);
            attributes.insert_or_assign(CONTOURS_ATTRIBUTE,
                                        morph_contours(*start_contours, *end_contours, eased,
                                                       a, b, to.morphing));
        }
    } else if (switched ? end_contours : start_contours) {
        attributes.insert_or_assign(CONTOURS_ATTRIBUTE, switched ? *end_contours : *start_contours);
    }

    return Snapshot(base.variant(), std::move(attributes));
}

std::optional<AttributeValue> InterpolationEngine::blend(const AttributeValue& a, const AttributeValue& b,
                                                         double eased,
                                                         const Snapshot& from_snapshot,
                                                         const Snapshot& to_snapshot,
                                                         const MorphingOverride& overrides) const {
    if (kind_of(a) != kind_of(b)) return std::nullopt;

    switch (kind_of(a)) {
        case AttributeKind::NUMBER:
            return AttributeValue(lerp(std::get<double>(a), std::get<double>(b), eased));
        case AttributeKind::ANGLE:
            return AttributeValue(Angle(interpolate_angle(std::get<Angle>(a).degrees,
                                                          std::get<Angle>(b).degrees, eased)));
        case AttributeKind::COLOR:
            return AttributeValue(std::get<Color>(a).interpolate(std::get<Color>(b), eased,
                                                                 config_.color_space));
        case AttributeKind::BOOLEAN:
        case AttributeKind::TOKEN:
            return eased >= 0.5 ? b : a;
        case AttributeKind::CONTOURS:
            return AttributeValue(morph_contours(std::get<ContourSet>(a), std::get<ContourSet>(b), eased,
                                                 from_snapshot, to_snapshot, overrides));
    }
    return std::nullopt;
}

// =============================================================================
// Geometry
// =============================================================================

std::optional<ContourSet> InterpolationEngine::contours_of(const Snapshot& snapshot) const {
    if (auto explicit_contours = snapshot.get<ContourSet>(CONTOURS_ATTRIBUTE)) {
        return explicit_contours;
    }
    if (registry_) {
        return registry_->generate(snapshot);
    }
    return std::nullopt;
}

Snapshot InterpolationEngine::with_geometry(const Snapshot& snapshot) const {
    if (snapshot.has(CONTOURS_ATTRIBUTE)) return snapshot;
    if (auto generated = contours_of(snapshot)) {
        return snapshot.with(CONTOURS_ATTRIBUTE, std::move(*generated));
    }
    return snapshot;
}

ContourSet InterpolationEngine::morph_contours(const ContourSet& start, const ContourSet& end, double t,
                                               const Snapshot& from_snapshot, const Snapshot& to_snapshot,
                                               const MorphingOverride& overrides) const {
    MorphRequest request;
    request.rotation1 = from_snapshot.number_or("rotation", 0.0);
    request.rotation2 = to_snapshot.number_or("rotation", 0.0);
    request.resolution = config_.resolution;
    request.norm = config_.alignment_norm;
    request.open_pair = config_.open_alignment;
    request.aligner = overrides.vertex_aligner
        ? overrides.vertex_aligner
        : make_default_aligner(config_, start.outer.closed(), end.outer.closed());
    request.hole_aligner = overrides.vertex_aligner;
    request.hole_matcher = overrides.hole_matcher ? overrides.hole_matcher : hole_matcher_;

    PreparedMorphPtr prepared = cache_
        ? cache_->prepared(start, end, request)
        : std::make_shared<const PreparedMorph>(prepare_morph(start, end, request));
    return interpolate_morph(*prepared, t);
}

} // namespace keymorph
