#ifndef KEYMORPH_HOLE_MATCHING_HPP
#define KEYMORPH_HOLE_MATCHING_HPP

#include <keymorph/geometry.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace keymorph {

struct HolePair {
    std::size_t source = 0;
    std::size_t destination = 0;

    bool operator==(const HolePair& other) const {
        return source == other.source && destination == other.destination;
    }
};

// Holes that travel together: a cluster, or the holes sharing one partner
struct HoleGroup {
    std::vector<std::size_t> sources;
    std::vector<std::size_t> destinations;
};

/**
 * Which source hole morphs into which destination hole.
 * A hole index may appear in several pairs when holes merge or split.
 * `shrink` lists source holes that collapse to a point at their own
 * centroid, `grow` lists destination holes that expand from a point at
 * theirs.
 */
struct HoleCorrespondence {
    std::vector<HolePair> pairs;
    std::vector<HoleGroup> groups;
    std::vector<std::size_t> shrink;
    std::vector<std::size_t> grow;

    std::size_t matched_count() const { return pairs.size(); }

    // Number of hole loops each side needs once every pair, shrink and grow is realized
    std::size_t morph_count() const { return pairs.size() + shrink.size() + grow.size(); }
};

/**
 * Strategy reconciling two hole lists.
 * match() handles empty sides itself (everything grows or shrinks) and
 * hands non-empty centroid lists to the strategy.
 */
class HoleMatcher {
public:
    virtual ~HoleMatcher() = default;

    HoleCorrespondence match(const std::vector<VertexLoop>& sources,
                             const std::vector<VertexLoop>& destinations) const;

    virtual const char* name() const = 0;

    // Identifies the strategy and its parameters in cache keys
    virtual std::size_t parameter_hash() const;

protected:
    // Both lists are non-empty
    virtual HoleCorrespondence match_centroids(const std::vector<Point2D>& sources,
                                               const std::vector<Point2D>& destinations) const = 0;
};

using HoleMatcherPtr = std::shared_ptr<const HoleMatcher>;

/**
 * Nearest centroid. With more sources every source picks its nearest
 * destination, with more destinations every destination picks its nearest
 * source. Equal counts pair one-to-one.
 */
class GreedyHoleMatcher : public HoleMatcher {
public:
    const char* name() const override { return "greedy"; }

protected:
    HoleCorrespondence match_centroids(const std::vector<Point2D>& sources,
                                       const std::vector<Point2D>& destinations) const override;
};

struct ClusteringParams {
    std::size_t max_iterations = 50;
    std::uint64_t random_seed = 42;
    bool balance_clusters = true;
};

/**
 * k-means over the centroids of the larger side with one cluster per hole on
 * the smaller side (k-means++ seeding, deterministic seed). Optional
 * rebalancing keeps cluster sizes within one of each other. Each cluster is
 * then given the nearest unused hole of the smaller side.
 */
class ClusteringHoleMatcher : public HoleMatcher {
private:
    ClusteringParams params_;

public:
    explicit ClusteringHoleMatcher(ClusteringParams params = {}) : params_(params) {}

    const char* name() const override { return "clustering"; }
    std::size_t parameter_hash() const override;
    const ClusteringParams& params() const { return params_; }

protected:
    HoleCorrespondence match_centroids(const std::vector<Point2D>& sources,
                                       const std::vector<Point2D>& destinations) const override;
};

/**
 * min(N, M) holes of the larger side closest to the smaller side are paired
 * one-to-one; the rest shrink or grow in place.
 */
class DiscreteHoleMatcher : public HoleMatcher {
public:
    const char* name() const override { return "discrete"; }

protected:
    HoleCorrespondence match_centroids(const std::vector<Point2D>& sources,
                                       const std::vector<Point2D>& destinations) const override;
};

// No pairs: every source shrinks and every destination grows
class SimpleHoleMatcher : public HoleMatcher {
public:
    const char* name() const override { return "simple"; }

protected:
    HoleCorrespondence match_centroids(const std::vector<Point2D>& sources,
                                       const std::vector<Point2D>& destinations) const override;
};

/**
 * Globally distance-minimizing assignment (Hungarian algorithm). With
 * unequal counts the smaller side is replicated so every hole of the larger
 * side gets a partner.
 */
class OptimalAssignmentHoleMatcher : public HoleMatcher {
public:
    const char* name() const override { return "optimal-assignment"; }

protected:
    HoleCorrespondence match_centroids(const std::vector<Point2D>& sources,
                                       const std::vector<Point2D>& destinations) const override;
};

// =============================================================================
// Building blocks
// =============================================================================

/**
 * Each destination in order takes its nearest unused source.
 * Requires sources.size() >= destinations.size(); returns one source index
 * per destination.
 */
std::vector<std::size_t> nearest_unused_assignment(const std::vector<Point2D>& sources,
                                                   const std::vector<Point2D>& destinations);

struct KMeansResult {
    std::vector<std::size_t> assignment;   // Cluster index per point
    std::vector<Point2D> centroids;        // One per cluster
    std::size_t iterations = 0;
};

/**
 * Lloyd's k-means with k-means++ seeding drawn from a 64-bit Mersenne
 * Twister seeded with `params.random_seed`. Stops when no centroid moves more
 * than 1e-6 or after `params.max_iterations` rounds. An empty cluster keeps
 * its previous centroid. With k >= points.size() every point is its own
 * cluster.
 */
KMeansResult kmeans(const std::vector<Point2D>& points, std::size_t k, const ClusteringParams& params);

/**
 * Moves points from the largest to the smallest cluster, picking the point
 * closest to the smallest cluster's centroid, until sizes differ by at most one.
 */
void balance_clusters(const std::vector<Point2D>& points, KMeansResult& clusters);

/**
 * Minimum-cost assignment of rows to distinct columns for a rows x cols cost
 * matrix with rows <= cols. Returns the column chosen for each row.
 */
std::vector<std::size_t> solve_assignment(const std::vector<std::vector<double>>& cost);

} // namespace keymorph

#endif // KEYMORPH_HOLE_MATCHING_HPP
