#ifndef KEYMORPH_CONTOUR_MORPH_HPP
#define KEYMORPH_CONTOUR_MORPH_HPP

#include <keymorph/geometry.hpp>
#include <keymorph/hole_matching.hpp>
#include <keymorph/vertex_alignment.hpp>
#include <cstddef>
#include <memory>

namespace keymorph {

/**
 * Everything that decides how two contour sets are put into correspondence.
 * A null aligner selects the default for the outer loops' closedness under
 * `norm` and `open_pair`; a null hole aligner does the same for each matched
 * hole pair. A null hole matcher selects clustering with default parameters.
 */
struct MorphRequest {
    double rotation1 = 0.0;
    double rotation2 = 0.0;
    std::size_t resolution = 0;   // 0: the larger point count of each pair
    AlignmentNorm norm = AlignmentNorm::L1;
    OpenPairAlignment open_pair = OpenPairAlignment::SEQUENTIAL;
    VertexAlignerPtr aligner;
    VertexAlignerPtr hole_aligner;
    HoleMatcherPtr hole_matcher;
};

/**
 * Two structurally identical contour sets: same hole count and, loop by
 * loop, the same point count with corresponding points at equal indices.
 * Interpolating between them is a per-point lerp.
 */
struct PreparedMorph {
    ContourSet start;
    ContourSet end;
    AlignmentResult outer_alignment;
    HoleCorrespondence holes;
};

using PreparedMorphPtr = std::shared_ptr<const PreparedMorph>;

/**
 * Align the outer loops, match the holes and realize the correspondence as
 * equal-length hole lists. Matched holes are resampled to a common count and
 * aligned like the outer loop; shrinking holes end as a point at their own centroid,
 * growing holes start as one.
 */
PreparedMorph prepare_morph(const ContourSet& start, const ContourSet& end, const MorphRequest& request);

/**
 * Per-point interpolation of a prepared pair at eased progress `t`.
 * The outer loop is closed only when both endpoints are closed.
 */
ContourSet interpolate_morph(const PreparedMorph& morph, double t);

} // namespace keymorph

#endif // KEYMORPH_CONTOUR_MORPH_HPP
