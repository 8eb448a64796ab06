#ifndef KEYMORPH_ANIMATION_HPP
#define KEYMORPH_ANIMATION_HPP

#include <keymorph/interpolation_engine.hpp>
#include <keymorph/timeline.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace keymorph {

struct PropertyKeyframe {
    std::optional<double> time;
    AttributeValue value;
    EasingFunction easing;   // Empty: resolved through the engine's EasingResolver
};

/**
 * Timeline of a single attribute, overriding the keystate-derived value.
 * Always covers [0, 1]: the first value holds back to 0.0 and the last
 * forward to 1.0. An untimed first keyframe sits at 0.0, an untimed last one
 * at 1.0 and untimed interior keyframes are spread between their neighbors.
 */
class PropertyTimeline {
private:
    std::string attribute_;
    std::vector<PropertyKeyframe> keyframes_;

public:
    /**
     * Throws InvalidTimelineError when `keyframes` is empty, a time lies
     * outside [0, 1] or times do not strictly increase.
     */
    PropertyTimeline(std::string attribute, std::vector<PropertyKeyframe> keyframes);

    const std::string& attribute() const { return attribute_; }
    std::size_t size() const { return keyframes_.size(); }
    const PropertyKeyframe& operator[](std::size_t i) const { return keyframes_[i]; }

    /**
     * Value at `t`. `context` is the keystate-derived frame the value lands
     * in; its variant picks default easing and its rotation feeds outline
     * morphs.
     */
    AttributeValue value_at(double t, const InterpolationEngine& engine, const Snapshot& context) const;
};

/**
 * One animated entity: its keystate timeline, the engine configured for it
 * and any property timelines layered on top.
 */
class Animation {
private:
    Timeline timeline_;
    InterpolationEngine engine_;
    std::map<std::string, PropertyTimeline> properties_;

public:
    explicit Animation(Timeline timeline,
                       std::shared_ptr<const VariantRegistry> registry = nullptr,
                       std::map<std::string, EasingFunction> entity_easing = {},
                       MorphingConfig config = {},
                       std::shared_ptr<MorphCache> cache = nullptr);

    // Replaces any property timeline for the same attribute
    void add_property_timeline(PropertyTimeline property);

    bool has_property_timeline(const std::string& attribute) const {
        return properties_.find(attribute) != properties_.end();
    }

    /**
     * Frame at normalized time `t`: the keystate interpolation with every
     * property timeline applied on top.
     */
    Snapshot state_at(double t) const;

    // More than one distinct keystate, or any property timeline
    bool is_animated() const;

    const Timeline& timeline() const { return timeline_; }
    const InterpolationEngine& engine() const { return engine_; }
};

} // namespace keymorph

#endif // KEYMORPH_ANIMATION_HPP
