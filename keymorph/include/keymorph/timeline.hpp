#ifndef KEYMORPH_TIMELINE_HPP
#define KEYMORPH_TIMELINE_HPP

#include <keymorph/easing.hpp>
#include <keymorph/snapshot.hpp>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace keymorph {

class HoleMatcher;
class VertexAligner;

/**
 * Strategy choice for the segment that ends at a keystate.
 * Null members fall back to the animation's configured strategies.
 */
struct MorphingOverride {
    std::shared_ptr<const HoleMatcher> hole_matcher;
    std::shared_ptr<const VertexAligner> vertex_aligner;

    bool empty() const { return !hole_matcher && !vertex_aligner; }
};

/**
 * Snapshot anchored in normalized time.
 * `easing` and `morphing` apply to the segment arriving at this keystate.
 * Inside a resolved Timeline `time` is always engaged.
 */
struct KeyState {
    Snapshot snapshot;
    std::optional<double> time;
    std::map<std::string, EasingFunction> easing;
    MorphingOverride morphing;
};

// Explicit (time, snapshot) pair
struct TimedSnapshot {
    double time = 0.0;
    Snapshot snapshot;
};

// Dynamically typed tuple as produced by loaders and layout helpers
using RawElement = std::variant<double, Snapshot>;
using RawTuple = std::vector<RawElement>;

using KeystateEntry = std::variant<Snapshot, TimedSnapshot, KeyState, RawTuple>;

enum class KeystateForm {
    VALUE_ONLY,  // Bare snapshot, time to be filled in
    TIMED,       // (time, snapshot) pair
    ANNOTATED    // Full KeyState record, time optional
};

/**
 * Single discriminated representation every entry is parsed into before
 * any ordering logic runs.
 */
struct ParsedKeystate {
    KeystateForm form = KeystateForm::VALUE_ONLY;
    KeyState keystate;
    std::size_t source_index = 0;
};

/**
 * Parse one raw entry. Throws InvalidTimelineError for tuples that are not
 * exactly (number, snapshot), for (number, number) tuples, and for times
 * outside [0, 1].
 */
ParsedKeystate parse_keystate(const KeystateEntry& entry, std::size_t index);

/**
 * Ordered, fully timed sequence of keystates. Immutable once built.
 */
class Timeline {
private:
    std::vector<KeyState> keystates_;

public:
    /**
     * Validates that there are at least two keystates, that every time is
     * set and inside [0, 1], and that times strictly increase.
     * Throws InvalidTimelineError otherwise.
     */
    explicit Timeline(std::vector<KeyState> keystates);

    std::size_t size() const { return keystates_.size(); }
    const KeyState& operator[](std::size_t i) const { return keystates_[i]; }
    const KeyState& front() const { return keystates_.front(); }
    const KeyState& back() const { return keystates_.back(); }
    auto begin() const { return keystates_.begin(); }
    auto end() const { return keystates_.end(); }

    double time(std::size_t i) const { return *keystates_[i].time; }
    double start_time() const { return time(0); }
    double end_time() const { return time(keystates_.size() - 1); }

    /**
     * Index i such that time(i) <= t < time(i + 1), clamped to the first and
     * last segment.
     */
    std::size_t segment_index(double t) const;

    // True when every keystate holds the same snapshot
    bool is_static() const;
};

/**
 * Normalize mixed keystate input into a Timeline.
 *
 * An untimed first entry anchors at 0.0 and an untimed last entry at 1.0.
 * Runs of untimed entries in between are spread evenly between their timed
 * neighbors, so n bare snapshots land on 0, 1/(n-1), ..., 1.
 * Entries keep their input order; nothing is sorted.
 */
Timeline resolve_timeline(const std::vector<KeystateEntry>& entries);

} // namespace keymorph

#endif // KEYMORPH_TIMELINE_HPP
