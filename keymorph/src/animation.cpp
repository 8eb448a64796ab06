// animation.cpp - Entity-level animation and property timelines

#include "keymorph/animation.hpp"
#include "keymorph/debug_log.hpp"
#include "keymorph/errors.hpp"

#include <algorithm>

namespace keymorph {

// =============================================================================
// PropertyTimeline
// =============================================================================

PropertyTimeline::PropertyTimeline(std::string attribute, std::vector<PropertyKeyframe> keyframes)
    : attribute_(std::move(attribute)), keyframes_(std::move(keyframes)) {
    if (keyframes_.empty()) {
        throw InvalidTimelineError("property timeline '" + attribute_ + "' has no keyframes");
    }

    if (!keyframes_.front().time) keyframes_.front().time = 0.0;
    if (!keyframes_.back().time) keyframes_.back().time = 1.0;

    std::size_t prev = 0;
    for (std::size_t i = 1; i < keyframes_.size(); ++i) {
        if (!keyframes_[i].time) continue;
        std::size_t gap = i - prev;
        double t_prev = *keyframes_[prev].time;
        double t_next = *keyframes_[i].time;
        for (std::size_t k = prev + 1; k < i; ++k) {
            keyframes_[k].time = t_prev + (t_next - t_prev) *
                static_cast<double>(k - prev) / static_cast<double>(gap);
        }
        prev = i;
    }

    for (std::size_t i = 0; i < keyframes_.size(); ++i) {
        double t = *keyframes_[i].time;
        if (!(t >= 0.0 && t <= 1.0)) {
            throw InvalidTimelineError("property '" + attribute_ + "' keyframe " + std::to_string(i) +
                                       " has time " + std::to_string(t) + " outside [0, 1]", i);
        }
        if (i > 0 && !(t > *keyframes_[i - 1].time)) {
            throw InvalidTimelineError("property '" + attribute_ + "' keyframe times must strictly "
                                       "increase at keyframe " + std::to_string(i), i);
        }
    }
}

AttributeValue PropertyTimeline::value_at(double t, const InterpolationEngine& engine,
                                          const Snapshot& context) const {
    if (keyframes_.size() == 1 || t <= *keyframes_.front().time) return keyframes_.front().value;
    if (t >= *keyframes_.back().time) return keyframes_.back().value;

    auto it = std::upper_bound(keyframes_.begin(), keyframes_.end(), t,
        [](double value, const PropertyKeyframe& kf) { return value < *kf.time; });
    std::size_t i = static_cast<std::size_t>(it - keyframes_.begin()) - 1;

    const PropertyKeyframe& from = keyframes_[i];
    const PropertyKeyframe& to = keyframes_[i + 1];
    double t_local = clamp_unit((t - *from.time) / (*to.time - *from.time));

    EasingFunction easing = to.easing
        ? to.easing
        : engine.easing().resolve_for_property(attribute_, context.variant()).function;
    double eased = easing(t_local);

    if (from.value == to.value) return from.value;
    if (auto blended = engine.blend(from.value, to.value, eased, context, context)) {
        return *blended;
    }
    return eased >= 0.5 ? to.value : from.value;
}

// =============================================================================
// Animation
// =============================================================================

Animation::Animation(Timeline timeline,
                     std::shared_ptr<const VariantRegistry> registry,
                     std::map<std::string, EasingFunction> entity_easing,
                     MorphingConfig config,
                     std::shared_ptr<MorphCache> cache)
    : timeline_(std::move(timeline)),
      engine_(std::move(registry), std::move(entity_easing), config, std::move(cache)) {}

void Animation::add_property_timeline(PropertyTimeline property) {
    std::string attribute = property.attribute();
    KEYMORPH_DEBUG_LOG("Property timeline for '%s' with %zu keyframes", attribute.c_str(), property.size());
    properties_.insert_or_assign(std::move(attribute), std::move(property));
}

Snapshot Animation::state_at(double t) const {
    Snapshot frame = engine_.evaluate(timeline_, t);
    for (const auto& [attribute, property] : properties_) {
        frame = frame.with(attribute, property.value_at(t, engine_, frame));
    }
    return frame;
}

bool Animation::is_animated() const {
    return !timeline_.is_static() || !properties_.empty();
}

} // namespace keymorph
