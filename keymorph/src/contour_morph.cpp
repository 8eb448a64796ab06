// contour_morph.cpp - Structural reconciliation and interpolation of contour sets

#include "keymorph/contour_morph.hpp"
#include "keymorph/debug_log.hpp"

#include <algorithm>

namespace keymorph {

namespace {

// An empty loop is stood in for by the other loop collapsed onto its centroid
void fill_empty(VertexLoop& a, VertexLoop& b) {
    if (a.empty() && !b.empty()) a = collapse_loop(b);
    if (b.empty() && !a.empty()) b = collapse_loop(a);
}

VertexLoop interpolate_loop(const VertexLoop& a, const VertexLoop& b, double t) {
    const std::size_t n = std::min(a.size(), b.size());
    std::vector<Point2D> points;
    points.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        points.push_back(lerp(a[i], b[i], t));
    }
    return VertexLoop(std::move(points), a.closed() && b.closed());
}

} // anonymous namespace

PreparedMorph prepare_morph(const ContourSet& start, const ContourSet& end, const MorphRequest& request) {
    PreparedMorph result;

    VertexLoop outer1 = start.outer;
    VertexLoop outer2 = end.outer;
    fill_empty(outer1, outer2);

    AlignmentContext context;
    context.rotation1 = request.rotation1;
    context.rotation2 = request.rotation2;
    context.closed1 = outer1.closed();
    context.closed2 = outer2.closed();

    VertexAlignerPtr aligner = request.aligner
        ? request.aligner
        : select_default_aligner(context.closed1, context.closed2, request.norm, request.open_pair);
    AlignedLoops outer = aligner->align(outer1, outer2, context, request.resolution);

    result.start.outer = std::move(outer.first);
    result.end.outer = std::move(outer.second);
    result.outer_alignment = outer.result;

    // ---- holes ----
    HoleMatcherPtr matcher = request.hole_matcher
        ? request.hole_matcher
        : std::make_shared<ClusteringHoleMatcher>();
    result.holes = matcher->match(start.holes, end.holes);

    for (const auto& pair : result.holes.pairs) {
        VertexLoop a = start.holes[pair.source];
        VertexLoop b = end.holes[pair.destination];
        fill_empty(a, b);

        AlignmentContext hole_context;
        hole_context.closed1 = a.closed();
        hole_context.closed2 = b.closed();
        VertexAlignerPtr hole_aligner = request.hole_aligner
            ? request.hole_aligner
            : select_default_aligner(a.closed(), b.closed(), request.norm, request.open_pair);
        AlignedLoops aligned = hole_aligner->align(a, b, hole_context, request.resolution);

        result.start.holes.push_back(std::move(aligned.first));
        result.end.holes.push_back(std::move(aligned.second));
    }

    for (std::size_t index : result.holes.shrink) {
        const VertexLoop& hole = start.holes[index];
        VertexLoop sized = request.resolution > 0 ? resample_loop(hole, request.resolution) : hole;
        result.end.holes.push_back(collapse_loop(sized));
        result.start.holes.push_back(std::move(sized));
    }

    for (std::size_t index : result.holes.grow) {
        const VertexLoop& hole = end.holes[index];
        VertexLoop sized = request.resolution > 0 ? resample_loop(hole, request.resolution) : hole;
        result.start.holes.push_back(collapse_loop(sized));
        result.end.holes.push_back(std::move(sized));
    }

    KEYMORPH_DEBUG_LOG("Prepared morph: outer %zu points via %s, holes %zu -> %zu via %s "
                       "(%zu pairs, %zu shrink, %zu grow)",
                       result.start.outer.size(), aligner->name(), start.holes.size(), end.holes.size(),
                       matcher->name(), result.holes.pairs.size(), result.holes.shrink.size(),
                       result.holes.grow.size());
    return result;
}

ContourSet interpolate_morph(const PreparedMorph& morph, double t) {
    ContourSet result;
    result.outer = interpolate_loop(morph.start.outer, morph.end.outer, t);

    const std::size_t holes = std::min(morph.start.holes.size(), morph.end.holes.size());
    result.holes.reserve(holes);
    for (std::size_t i = 0; i < holes; ++i) {
        result.holes.push_back(interpolate_loop(morph.start.holes[i], morph.end.holes[i], t));
    }
    return result;
}

} // namespace keymorph
