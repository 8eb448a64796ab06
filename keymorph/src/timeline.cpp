// timeline.cpp - Keystate parsing and timeline resolution

#include "keymorph/timeline.hpp"
#include "keymorph/debug_log.hpp"
#include "keymorph/errors.hpp"

#include <algorithm>
#include <string>

namespace keymorph {

namespace {

bool in_unit_range(double t) {
    return t >= 0.0 && t <= 1.0;  // false for NaN
}

void check_time(double t, std::size_t index) {
    if (!in_unit_range(t)) {
        throw InvalidTimelineError(
            "keystate " + std::to_string(index) + " has time " + std::to_string(t) +
            " outside [0, 1]", index);
    }
}

ParsedKeystate parse_raw_tuple(const RawTuple& tuple, std::size_t index) {
    if (tuple.size() != 2) {
        throw InvalidTimelineError(
            "keystate " + std::to_string(index) + " is a tuple of " + std::to_string(tuple.size()) +
            " elements; expected (time, snapshot)", index);
    }

    const double* time = std::get_if<double>(&tuple[0]);
    if (!time) {
        throw InvalidTimelineError(
            "keystate " + std::to_string(index) + " tuple must start with a numeric time", index);
    }

    const Snapshot* snapshot = std::get_if<Snapshot>(&tuple[1]);
    if (!snapshot) {
        throw InvalidTimelineError(
            "keystate " + std::to_string(index) + " is an ambiguous (number, number) tuple; "
            "wrap the value in a snapshot", index);
    }

    check_time(*time, index);
    ParsedKeystate parsed;
    parsed.form = KeystateForm::TIMED;
    parsed.keystate.snapshot = *snapshot;
    parsed.keystate.time = *time;
    parsed.source_index = index;
    return parsed;
}

} // anonymous namespace

// =============================================================================
// Parsing
// =============================================================================

ParsedKeystate parse_keystate(const KeystateEntry& entry, std::size_t index) {
    ParsedKeystate parsed;
    parsed.source_index = index;

    if (const Snapshot* snapshot = std::get_if<Snapshot>(&entry)) {
        parsed.form = KeystateForm::VALUE_ONLY;
        parsed.keystate.snapshot = *snapshot;
    } else if (const TimedSnapshot* timed = std::get_if<TimedSnapshot>(&entry)) {
        check_time(timed->time, index);
        parsed.form = KeystateForm::TIMED;
        parsed.keystate.snapshot = timed->snapshot;
        parsed.keystate.time = timed->time;
    } else if (const KeyState* keystate = std::get_if<KeyState>(&entry)) {
        if (keystate->time) check_time(*keystate->time, index);
        parsed.form = KeystateForm::ANNOTATED;
        parsed.keystate = *keystate;
    } else {
        return parse_raw_tuple(std::get<RawTuple>(entry), index);
    }
    return parsed;
}

// =============================================================================
// Timeline
// =============================================================================

Timeline::Timeline(std::vector<KeyState> keystates)
    : keystates_(std::move(keystates)) {
    if (keystates_.size() < 2) {
        throw InvalidTimelineError("at least two keystates are required, got " +
                                   std::to_string(keystates_.size()));
    }

    for (std::size_t i = 0; i < keystates_.size(); ++i) {
        if (!keystates_[i].time) {
            throw InvalidTimelineError("keystate " + std::to_string(i) + " has no time", i);
        }
        check_time(*keystates_[i].time, i);
        if (i > 0 && !(*keystates_[i].time > *keystates_[i - 1].time)) {
            throw InvalidTimelineError(
                "times must strictly increase: keystate " + std::to_string(i) + " at " +
                std::to_string(*keystates_[i].time) + " follows " +
                std::to_string(*keystates_[i - 1].time), i);
        }
    }
}

std::size_t Timeline::segment_index(double t) const {
    auto it = std::upper_bound(keystates_.begin(), keystates_.end(), t,
        [](double value, const KeyState& ks) { return value < *ks.time; });
    std::size_t upper = static_cast<std::size_t>(it - keystates_.begin());
    if (upper == 0) return 0;
    return std::min(upper - 1, keystates_.size() - 2);
}

bool Timeline::is_static() const {
    for (std::size_t i = 1; i < keystates_.size(); ++i) {
        if (keystates_[i].snapshot != keystates_[0].snapshot) return false;
    }
    return true;
}

// =============================================================================
// Resolution
// =============================================================================

Timeline resolve_timeline(const std::vector<KeystateEntry>& entries) {
    std::vector<ParsedKeystate> parsed;
    parsed.reserve(entries.size());
    for (std::size_t i = 0; i < entries.size(); ++i) {
        parsed.push_back(parse_keystate(entries[i], i));
    }

    if (parsed.size() < 2) {
        throw InvalidTimelineError("at least two keystates are required, got " +
                                   std::to_string(parsed.size()));
    }

    std::vector<KeyState> keystates;
    keystates.reserve(parsed.size());
    for (auto& p : parsed) {
        keystates.push_back(std::move(p.keystate));
    }

    if (!keystates.front().time) keystates.front().time = 0.0;
    if (!keystates.back().time) keystates.back().time = 1.0;

    // Fill each run of untimed entries between its timed neighbors
    std::size_t prev = 0;
    for (std::size_t i = 1; i < keystates.size(); ++i) {
        if (!keystates[i].time) continue;
        std::size_t gap = i - prev;
        if (gap > 1) {
            double t_prev = *keystates[prev].time;
            double t_next = *keystates[i].time;
            for (std::size_t k = prev + 1; k < i; ++k) {
                double fraction = static_cast<double>(k - prev) / static_cast<double>(gap);
                keystates[k].time = t_prev + (t_next - t_prev) * fraction;
            }
        }
        prev = i;
    }

    KEYMORPH_DEBUG_LOG("Resolved timeline with %zu keystates [%.4f .. %.4f]",
                       keystates.size(), *keystates.front().time, *keystates.back().time);

    return Timeline(std::move(keystates));
}

} // namespace keymorph
