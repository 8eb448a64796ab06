#ifndef KEYMORPH_VERTEX_ALIGNMENT_HPP
#define KEYMORPH_VERTEX_ALIGNMENT_HPP

#include <keymorph/geometry.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace keymorph {

// How per-point distances are folded into one alignment cost
enum class AlignmentNorm {
    L1,    // Sum
    L2,    // Root of the sum of squares
    LINF   // Maximum
};

const char* alignment_norm_name(AlignmentNorm norm);

// Accepts "l1", "l2", "linf" (case-insensitive)
std::optional<AlignmentNorm> parse_alignment_norm(const std::string& name);

/**
 * Closedness and declared rotation (degrees) of the two shapes being aligned.
 */
struct AlignmentContext {
    double rotation1 = 0.0;
    double rotation2 = 0.0;
    bool closed1 = true;
    bool closed2 = true;
};

enum class AlignedSide {
    FIRST,
    SECOND
};

/**
 * Correspondence chosen by an aligner: the loop named by `shifted` is
 * reversed first (when `reversed`) and then cyclically shifted left by
 * `offset`. The other loop is left untouched.
 */
struct AlignmentResult {
    std::size_t offset = 0;
    bool reversed = false;
    AlignedSide shifted = AlignedSide::SECOND;
    double cost = 0.0;

    bool operator==(const AlignmentResult& other) const {
        return offset == other.offset && reversed == other.reversed && shifted == other.shifted;
    }
};

struct AlignedLoops {
    VertexLoop first;
    VertexLoop second;
    AlignmentResult result;
};

// Applies `result` to the points it names
std::vector<Point2D> apply_alignment(const std::vector<Point2D>& points, const AlignmentResult& result);

/**
 * Strategy for putting the points of two outlines into one-to-one
 * correspondence.
 */
class VertexAligner {
public:
    virtual ~VertexAligner() = default;

    /**
     * Pick the correspondence for two equal-length point lists.
     * Lists shorter than two points yield a zero offset.
     */
    virtual AlignmentResult compute(const std::vector<Point2D>& first,
                                    const std::vector<Point2D>& second,
                                    const AlignmentContext& context) const = 0;

    virtual const char* name() const = 0;

    // Identifies the strategy and its parameters in cache keys
    virtual std::size_t parameter_hash() const;

    /**
     * Resample both loops to `resolution` points (the larger point count when
     * 0), compute the correspondence and apply it to the resampled,
     * unrotated points.
     */
    AlignedLoops align(const VertexLoop& first, const VertexLoop& second,
                       const AlignmentContext& context, std::size_t resolution = 0) const;
};

using VertexAlignerPtr = std::shared_ptr<const VertexAligner>;

/**
 * Closed <-> closed alignment. Both loops are rotated by their declared
 * rotation, each point is converted to its angle around its loop's mean
 * point, and the cyclic offset of the second loop with the lowest total
 * angular distance wins.
 */
class AngularAligner : public VertexAligner {
private:
    AlignmentNorm norm_;

public:
    explicit AngularAligner(AlignmentNorm norm = AlignmentNorm::L1) : norm_(norm) {}

    AlignmentResult compute(const std::vector<Point2D>& first,
                            const std::vector<Point2D>& second,
                            const AlignmentContext& context) const override;

    const char* name() const override { return "angular"; }
    std::size_t parameter_hash() const override;
    AlignmentNorm norm() const { return norm_; }
};

/**
 * Point-to-point distance alignment for open shapes. Each loop is rotated by
 * its own declared rotation; every cyclic offset of the closed side is tried.
 * When both sides are open, only the reversal of the second loop is tried.
 * When both are closed, offsets of the second loop are searched.
 */
class EuclideanAligner : public VertexAligner {
private:
    AlignmentNorm norm_;

public:
    explicit EuclideanAligner(AlignmentNorm norm = AlignmentNorm::L1) : norm_(norm) {}

    AlignmentResult compute(const std::vector<Point2D>& first,
                            const std::vector<Point2D>& second,
                            const AlignmentContext& context) const override;

    const char* name() const override { return "euclidean"; }
    std::size_t parameter_hash() const override;
    AlignmentNorm norm() const { return norm_; }
};

/**
 * Open <-> open: keep index order, reversing the second loop when that
 * lowers the summed distance. Rotation is ignored.
 */
class SequentialAligner : public VertexAligner {
public:
    AlignmentResult compute(const std::vector<Point2D>& first,
                            const std::vector<Point2D>& second,
                            const AlignmentContext& context) const override;

    const char* name() const override { return "sequential"; }
};

// Identity correspondence
class NullAligner : public VertexAligner {
public:
    AlignmentResult compute(const std::vector<Point2D>& first,
                            const std::vector<Point2D>& second,
                            const AlignmentContext& context) const override;

    const char* name() const override { return "none"; }
};

// Policy for pairs of open outlines
enum class OpenPairAlignment {
    SEQUENTIAL,
    EUCLIDEAN
};

/**
 * closed/closed -> angular, mixed -> Euclidean, open/open -> `open_pair`.
 */
VertexAlignerPtr select_default_aligner(bool closed1, bool closed2,
                                        AlignmentNorm norm = AlignmentNorm::L1,
                                        OpenPairAlignment open_pair = OpenPairAlignment::SEQUENTIAL);

} // namespace keymorph

#endif // KEYMORPH_VERTEX_ALIGNMENT_HPP
