// vertex_alignment.cpp - Outline correspondence strategies

#include "keymorph/vertex_alignment.hpp"
#include "keymorph/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <functional>
#include <limits>

namespace keymorph {

namespace {

// Folds per-point distances produced by `term(i)` according to `norm`
template<typename Term>
double fold_cost(std::size_t n, AlignmentNorm norm, Term&& term) {
    double acc = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        double d = term(i);
        switch (norm) {
            case AlignmentNorm::L1: acc += d; break;
            case AlignmentNorm::L2: acc += d * d; break;
            case AlignmentNorm::LINF: acc = std::max(acc, d); break;
        }
    }
    return norm == AlignmentNorm::L2 ? std::sqrt(acc) : acc;
}

// Lowest-cost offset in [0, n); the first one wins ties
template<typename Cost>
std::pair<std::size_t, double> best_offset(std::size_t n, Cost&& cost) {
    std::size_t best = 0;
    double best_cost = std::numeric_limits<double>::infinity();
    for (std::size_t offset = 0; offset < n; ++offset) {
        double c = cost(offset);
        if (c < best_cost) {
            best_cost = c;
            best = offset;
        }
    }
    return {best, best_cost};
}

bool comparable(const std::vector<Point2D>& first, const std::vector<Point2D>& second) {
    return first.size() == second.size() && first.size() >= 2;
}

} // anonymous namespace

const char* alignment_norm_name(AlignmentNorm norm) {
    switch (norm) {
        case AlignmentNorm::L1: return "l1";
        case AlignmentNorm::L2: return "l2";
        case AlignmentNorm::LINF: return "linf";
    }
    return "unknown";
}

std::optional<AlignmentNorm> parse_alignment_norm(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "l1") return AlignmentNorm::L1;
    if (lower == "l2") return AlignmentNorm::L2;
    if (lower == "linf") return AlignmentNorm::LINF;
    return std::nullopt;
}

std::vector<Point2D> apply_alignment(const std::vector<Point2D>& points, const AlignmentResult& result) {
    if (!result.reversed) {
        return rotate_list(points, result.offset);
    }
    std::vector<Point2D> reversed(points.rbegin(), points.rend());
    return rotate_list(reversed, result.offset);
}

// =============================================================================
// VertexAligner
// =============================================================================

std::size_t VertexAligner::parameter_hash() const {
    return std::hash<std::string>{}(name());
}

AlignedLoops VertexAligner::align(const VertexLoop& first, const VertexLoop& second,
                                  const AlignmentContext& context, std::size_t resolution) const {
    std::size_t count = resolution > 0 ? resolution : std::max(first.size(), second.size());
    VertexLoop a = first.size() == count ? first : resample_loop(first, count);
    VertexLoop b = second.size() == count ? second : resample_loop(second, count);

    if (count < 2) {
        return {std::move(a), std::move(b), AlignmentResult{}};
    }

    AlignmentResult result = compute(a.points(), b.points(), context);
    KEYMORPH_DEBUG_LOG("%s alignment: %zu points, offset=%zu reversed=%d side=%s cost=%.4f",
                       name(), count, result.offset, result.reversed ? 1 : 0,
                       result.shifted == AlignedSide::FIRST ? "first" : "second", result.cost);

    if (result.shifted == AlignedSide::FIRST) {
        a = a.with_points(apply_alignment(a.points(), result));
    } else {
        b = b.with_points(apply_alignment(b.points(), result));
    }
    return {std::move(a), std::move(b), result};
}

// =============================================================================
// AngularAligner
// =============================================================================

AlignmentResult AngularAligner::compute(const std::vector<Point2D>& first,
                                        const std::vector<Point2D>& second,
                                        const AlignmentContext& context) const {
    if (!comparable(first, second)) return {};

    std::vector<Point2D> work1 = rotate_points(first, context.rotation1);
    std::vector<Point2D> work2 = rotate_points(second, context.rotation2);
    Point2D c1 = mean_point(work1);
    Point2D c2 = mean_point(work2);

    const std::size_t n = first.size();
    std::vector<double> angles1(n);
    std::vector<double> angles2(n);
    for (std::size_t i = 0; i < n; ++i) {
        angles1[i] = angle_from_centroid(work1[i], c1);
        angles2[i] = angle_from_centroid(work2[i], c2);
    }

    auto [offset, cost] = best_offset(n, [&](std::size_t off) {
        return fold_cost(n, norm_, [&](std::size_t i) {
            return angle_distance(angles1[i], angles2[(i + off) % n]);
        });
    });

    AlignmentResult result;
    result.offset = offset;
    result.shifted = AlignedSide::SECOND;
    result.cost = cost;
    return result;
}

std::size_t AngularAligner::parameter_hash() const {
    std::size_t h = VertexAligner::parameter_hash();
    hash_mix(h, static_cast<std::size_t>(norm_));
    return h;
}

// =============================================================================
// EuclideanAligner
// =============================================================================

AlignmentResult EuclideanAligner::compute(const std::vector<Point2D>& first,
                                          const std::vector<Point2D>& second,
                                          const AlignmentContext& context) const {
    if (!comparable(first, second)) return {};

    std::vector<Point2D> work1 = rotate_points(first, context.rotation1);
    std::vector<Point2D> work2 = rotate_points(second, context.rotation2);
    const std::size_t n = first.size();
    AlignmentResult result;

    if (!context.closed1 && !context.closed2) {
        double forward = fold_cost(n, norm_, [&](std::size_t i) {
            return distance(work1[i], work2[i]);
        });
        double backward = fold_cost(n, norm_, [&](std::size_t i) {
            return distance(work1[i], work2[n - 1 - i]);
        });
        result.reversed = backward < forward;
        result.cost = result.reversed ? backward : forward;
        result.shifted = AlignedSide::SECOND;
        return result;
    }

    // The closed side slides under the other one
    bool shift_first = context.closed1 && !context.closed2;
    const std::vector<Point2D>& fixed = shift_first ? work2 : work1;
    const std::vector<Point2D>& sliding = shift_first ? work1 : work2;

    auto [offset, cost] = best_offset(n, [&](std::size_t off) {
        return fold_cost(n, norm_, [&](std::size_t i) {
            return distance(fixed[i], sliding[(i + off) % n]);
        });
    });

    result.offset = offset;
    result.cost = cost;
    result.shifted = shift_first ? AlignedSide::FIRST : AlignedSide::SECOND;
    return result;
}

std::size_t EuclideanAligner::parameter_hash() const {
    std::size_t h = VertexAligner::parameter_hash();
    hash_mix(h, static_cast<std::size_t>(norm_));
    return h;
}

// =============================================================================
// SequentialAligner / NullAligner
// =============================================================================

AlignmentResult SequentialAligner::compute(const std::vector<Point2D>& first,
                                           const std::vector<Point2D>& second,
                                           const AlignmentContext& /*context*/) const {
    if (!comparable(first, second)) return {};

    const std::size_t n = first.size();
    double forward = 0.0;
    double backward = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        forward += distance(first[i], second[i]);
        backward += distance(first[i], second[n - 1 - i]);
    }

    AlignmentResult result;
    result.reversed = backward < forward;
    result.cost = result.reversed ? backward : forward;
    return result;
}

AlignmentResult NullAligner::compute(const std::vector<Point2D>& /*first*/,
                                     const std::vector<Point2D>& /*second*/,
                                     const AlignmentContext& /*context*/) const {
    return {};
}

// =============================================================================
// Default selection
// =============================================================================

VertexAlignerPtr select_default_aligner(bool closed1, bool closed2, AlignmentNorm norm,
                                        OpenPairAlignment open_pair) {
    if (closed1 && closed2) {
        return std::make_shared<AngularAligner>(norm);
    }
    if (closed1 != closed2) {
        return std::make_shared<EuclideanAligner>(norm);
    }
    if (open_pair == OpenPairAlignment::EUCLIDEAN) {
        return std::make_shared<EuclideanAligner>(norm);
    }
    return std::make_shared<SequentialAligner>();
}

} // namespace keymorph
