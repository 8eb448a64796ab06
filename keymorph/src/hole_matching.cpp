// hole_matching.cpp - Hole correspondence strategies

#include "keymorph/hole_matching.hpp"
#include "keymorph/debug_log.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <random>
#include <string>

namespace keymorph {

namespace {

constexpr double KMEANS_EPSILON = 1e-6;

std::size_t nearest_index(const Point2D& p, const std::vector<Point2D>& candidates) {
    std::size_t best = 0;
    double best_dist = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        double d = distance(p, candidates[i]);
        if (d < best_dist) {
            best_dist = d;
            best = i;
        }
    }
    return best;
}

// [0, 1) from the top 53 bits
double unit_double(std::mt19937_64& rng) {
    return static_cast<double>(rng() >> 11) * 0x1.0p-53;
}

HoleCorrespondence one_to_one(const std::vector<Point2D>& sources,
                              const std::vector<Point2D>& destinations) {
    HoleCorrespondence result;
    std::vector<std::size_t> assignment = nearest_unused_assignment(sources, destinations);
    for (std::size_t j = 0; j < destinations.size(); ++j) {
        result.pairs.push_back({assignment[j], j});
        result.groups.push_back({{assignment[j]}, {j}});
    }
    return result;
}

// Indices in [0, count) absent from `used`
std::vector<std::size_t> unused_indices(std::size_t count, const std::vector<bool>& used) {
    std::vector<std::size_t> result;
    for (std::size_t i = 0; i < count; ++i) {
        if (!used[i]) result.push_back(i);
    }
    return result;
}

/**
 * Shared by clustering and optimal assignment: `partner[i]` names the hole of
 * the smaller side chosen for hole i of the larger side. Builds pairs in
 * larger-side order, one group per used smaller-side hole, and flags unused
 * smaller-side holes to grow or shrink.
 */
HoleCorrespondence from_partner_map(const std::vector<std::size_t>& partner,
                                    std::size_t smaller_count, bool sources_larger) {
    HoleCorrespondence result;
    std::vector<bool> used(smaller_count, false);
    std::vector<HoleGroup> by_partner(smaller_count);

    for (std::size_t i = 0; i < partner.size(); ++i) {
        std::size_t p = partner[i];
        used[p] = true;
        if (sources_larger) {
            result.pairs.push_back({i, p});
            by_partner[p].sources.push_back(i);
        } else {
            result.pairs.push_back({p, i});
            by_partner[p].destinations.push_back(i);
        }
    }

    for (std::size_t p = 0; p < smaller_count; ++p) {
        if (!used[p]) continue;
        if (sources_larger) {
            by_partner[p].destinations.push_back(p);
        } else {
            by_partner[p].sources.push_back(p);
        }
        result.groups.push_back(std::move(by_partner[p]));
    }

    auto leftovers = unused_indices(smaller_count, used);
    if (sources_larger) {
        result.grow = std::move(leftovers);
    } else {
        result.shrink = std::move(leftovers);
    }
    return result;
}

} // anonymous namespace

// =============================================================================
// HoleMatcher
// =============================================================================

HoleCorrespondence HoleMatcher::match(const std::vector<VertexLoop>& sources,
                                      const std::vector<VertexLoop>& destinations) const {
    HoleCorrespondence result;
    if (sources.empty() || destinations.empty()) {
        for (std::size_t i = 0; i < sources.size(); ++i) result.shrink.push_back(i);
        for (std::size_t j = 0; j < destinations.size(); ++j) result.grow.push_back(j);
        return result;
    }

    std::vector<Point2D> src_centroids;
    std::vector<Point2D> dst_centroids;
    src_centroids.reserve(sources.size());
    dst_centroids.reserve(destinations.size());
    for (const auto& hole : sources) src_centroids.push_back(hole.centroid());
    for (const auto& hole : destinations) dst_centroids.push_back(hole.centroid());

    result = match_centroids(src_centroids, dst_centroids);
    KEYMORPH_DEBUG_LOG("%s hole matching %zu -> %zu: %zu pairs, %zu groups, %zu shrink, %zu grow",
                       name(), sources.size(), destinations.size(), result.pairs.size(),
                       result.groups.size(), result.shrink.size(), result.grow.size());
    return result;
}

std::size_t HoleMatcher::parameter_hash() const {
    return std::hash<std::string>{}(name());
}

// =============================================================================
// Greedy
// =============================================================================

HoleCorrespondence GreedyHoleMatcher::match_centroids(const std::vector<Point2D>& sources,
                                                      const std::vector<Point2D>& destinations) const {
    if (sources.size() == destinations.size()) {
        return one_to_one(sources, destinations);
    }

    bool sources_larger = sources.size() > destinations.size();
    const auto& larger = sources_larger ? sources : destinations;
    const auto& smaller = sources_larger ? destinations : sources;

    std::vector<std::size_t> partner;
    partner.reserve(larger.size());
    for (const auto& c : larger) {
        partner.push_back(nearest_index(c, smaller));
    }
    return from_partner_map(partner, smaller.size(), sources_larger);
}

// =============================================================================
// Clustering
// =============================================================================

std::size_t ClusteringHoleMatcher::parameter_hash() const {
    std::size_t h = HoleMatcher::parameter_hash();
    hash_mix(h, params_.max_iterations);
    hash_mix(h, static_cast<std::size_t>(params_.random_seed));
    hash_mix(h, params_.balance_clusters ? 1u : 0u);
    return h;
}

HoleCorrespondence ClusteringHoleMatcher::match_centroids(const std::vector<Point2D>& sources,
                                                          const std::vector<Point2D>& destinations) const {
    if (sources.size() == destinations.size()) {
        return one_to_one(sources, destinations);
    }

    bool sources_larger = sources.size() > destinations.size();
    const auto& larger = sources_larger ? sources : destinations;
    const auto& smaller = sources_larger ? destinations : sources;
    const std::size_t k = smaller.size();

    KMeansResult clusters = kmeans(larger, k, params_);
    if (params_.balance_clusters) {
        balance_clusters(larger, clusters);
    }

    // Members and mean point per cluster
    std::vector<std::vector<std::size_t>> members(k);
    for (std::size_t i = 0; i < larger.size(); ++i) {
        members[clusters.assignment[i]].push_back(i);
    }

    std::vector<std::size_t> partner(larger.size(), 0);
    std::vector<bool> taken(k, false);
    for (std::size_t c = 0; c < k; ++c) {
        if (members[c].empty()) continue;

        std::vector<Point2D> member_points;
        for (std::size_t i : members[c]) member_points.push_back(larger[i]);
        Point2D center = mean_point(member_points);

        std::size_t best = k;
        double best_dist = std::numeric_limits<double>::infinity();
        for (std::size_t j = 0; j < k; ++j) {
            if (taken[j]) continue;
            double d = distance(center, smaller[j]);
            if (d < best_dist) {
                best_dist = d;
                best = j;
            }
        }
        taken[best] = true;
        for (std::size_t i : members[c]) partner[i] = best;

        KEYMORPH_DEBUG_LOG("Cluster %zu: %zu holes -> hole %zu", c, members[c].size(), best);
    }

    return from_partner_map(partner, k, sources_larger);
}

// =============================================================================
// Discrete
// =============================================================================

HoleCorrespondence DiscreteHoleMatcher::match_centroids(const std::vector<Point2D>& sources,
                                                        const std::vector<Point2D>& destinations) const {
    if (sources.size() == destinations.size()) {
        return one_to_one(sources, destinations);
    }

    bool sources_larger = sources.size() > destinations.size();
    const auto& larger = sources_larger ? sources : destinations;
    const auto& smaller = sources_larger ? destinations : sources;

    // Repeatedly take the larger-side hole closest to any smaller-side hole
    std::vector<double> reach(larger.size());
    for (std::size_t i = 0; i < larger.size(); ++i) {
        reach[i] = distance(larger[i], smaller[nearest_index(larger[i], smaller)]);
    }
    std::vector<bool> selected(larger.size(), false);
    std::vector<std::size_t> chosen;
    for (std::size_t n = 0; n < smaller.size(); ++n) {
        std::size_t best = larger.size();
        double best_reach = std::numeric_limits<double>::infinity();
        for (std::size_t i = 0; i < larger.size(); ++i) {
            if (!selected[i] && reach[i] < best_reach) {
                best_reach = reach[i];
                best = i;
            }
        }
        selected[best] = true;
        chosen.push_back(best);
    }

    HoleCorrespondence result;
    if (sources_larger) {
        std::vector<Point2D> chosen_points;
        for (std::size_t i : chosen) chosen_points.push_back(larger[i]);
        std::vector<std::size_t> assignment = nearest_unused_assignment(chosen_points, destinations);
        for (std::size_t j = 0; j < destinations.size(); ++j) {
            std::size_t src = chosen[assignment[j]];
            result.pairs.push_back({src, j});
            result.groups.push_back({{src}, {j}});
        }
        result.shrink = unused_indices(larger.size(), selected);
    } else {
        std::vector<Point2D> chosen_points;
        for (std::size_t j : chosen) chosen_points.push_back(larger[j]);
        std::vector<std::size_t> assignment = nearest_unused_assignment(sources, chosen_points);
        for (std::size_t c = 0; c < chosen.size(); ++c) {
            result.pairs.push_back({assignment[c], chosen[c]});
            result.groups.push_back({{assignment[c]}, {chosen[c]}});
        }
        result.grow = unused_indices(larger.size(), selected);
    }
    return result;
}

// =============================================================================
// Simple
// =============================================================================

HoleCorrespondence SimpleHoleMatcher::match_centroids(const std::vector<Point2D>& sources,
                                                      const std::vector<Point2D>& destinations) const {
    HoleCorrespondence result;
    for (std::size_t i = 0; i < sources.size(); ++i) result.shrink.push_back(i);
    for (std::size_t j = 0; j < destinations.size(); ++j) result.grow.push_back(j);
    return result;
}

// =============================================================================
// Optimal assignment
// =============================================================================

HoleCorrespondence OptimalAssignmentHoleMatcher::match_centroids(
        const std::vector<Point2D>& sources, const std::vector<Point2D>& destinations) const {
    bool sources_larger = sources.size() >= destinations.size();
    const auto& larger = sources_larger ? sources : destinations;
    const auto& smaller = sources_larger ? destinations : sources;

    std::size_t copies = (larger.size() + smaller.size() - 1) / smaller.size();
    std::size_t cols = smaller.size() * copies;
    std::vector<std::vector<double>> cost(larger.size(), std::vector<double>(cols));
    for (std::size_t i = 0; i < larger.size(); ++i) {
        for (std::size_t c = 0; c < cols; ++c) {
            cost[i][c] = distance(larger[i], smaller[c % smaller.size()]);
        }
    }

    std::vector<std::size_t> columns = solve_assignment(cost);
    std::vector<std::size_t> partner(larger.size());
    for (std::size_t i = 0; i < larger.size(); ++i) {
        partner[i] = columns[i] % smaller.size();
    }

    if (sources.size() == destinations.size()) {
        HoleCorrespondence result;
        for (std::size_t i = 0; i < partner.size(); ++i) {
            result.pairs.push_back({i, partner[i]});
            result.groups.push_back({{i}, {partner[i]}});
        }
        return result;
    }
    return from_partner_map(partner, smaller.size(), sources_larger);
}

// =============================================================================
// Building blocks
// =============================================================================

std::vector<std::size_t> nearest_unused_assignment(const std::vector<Point2D>& sources,
                                                   const std::vector<Point2D>& destinations) {
    std::vector<std::size_t> assignment;
    assignment.reserve(destinations.size());
    std::vector<bool> used(sources.size(), false);

    for (const auto& dst : destinations) {
        std::size_t best = sources.size();
        double best_dist = std::numeric_limits<double>::infinity();
        for (std::size_t i = 0; i < sources.size(); ++i) {
            if (used[i]) continue;
            double d = distance(sources[i], dst);
            if (d < best_dist) {
                best_dist = d;
                best = i;
            }
        }
        if (best == sources.size()) break;
        used[best] = true;
        assignment.push_back(best);
    }
    return assignment;
}

KMeansResult kmeans(const std::vector<Point2D>& points, std::size_t k, const ClusteringParams& params) {
    KMeansResult result;
    const std::size_t n = points.size();
    if (n == 0 || k == 0) {
        result.assignment.assign(n, 0);
        return result;
    }
    if (k >= n) {
        for (std::size_t i = 0; i < n; ++i) result.assignment.push_back(i);
        result.centroids = points;
        return result;
    }

    // k-means++ seeding
    std::mt19937_64 rng(params.random_seed);
    result.centroids.push_back(points[rng() % n]);
    std::vector<double> weights(n);
    while (result.centroids.size() < k) {
        double total = 0.0;
        for (std::size_t i = 0; i < n; ++i) {
            double best = std::numeric_limits<double>::infinity();
            for (const auto& c : result.centroids) {
                best = std::min(best, squared_distance(points[i], c));
            }
            weights[i] = best;
            total += best;
        }

        if (total <= 0.0) {
            result.centroids.push_back(points[rng() % n]);
            continue;
        }

        double r = unit_double(rng) * total;
        double cumulative = 0.0;
        std::size_t pick = n;
        for (std::size_t i = 0; i < n; ++i) {
            if (weights[i] <= 0.0) continue;
            cumulative += weights[i];
            pick = i;
            if (cumulative >= r) break;
        }
        result.centroids.push_back(points[pick]);
    }

    auto assign = [&]() {
        result.assignment.resize(n);
        for (std::size_t i = 0; i < n; ++i) {
            result.assignment[i] = nearest_index(points[i], result.centroids);
        }
    };

    // Lloyd iterations
    assign();
    for (std::size_t iter = 0; iter < params.max_iterations; ++iter) {
        std::vector<Point2D> sums(k);
        std::vector<std::size_t> counts(k, 0);
        for (std::size_t i = 0; i < n; ++i) {
            std::size_t c = result.assignment[i];
            sums[c] = sums[c] + points[i];
            ++counts[c];
        }

        double shift = 0.0;
        for (std::size_t c = 0; c < k; ++c) {
            if (counts[c] == 0) continue;
            Point2D updated = sums[c] * (1.0 / static_cast<double>(counts[c]));
            shift = std::max(shift, distance(updated, result.centroids[c]));
            result.centroids[c] = updated;
        }

        assign();
        result.iterations = iter + 1;
        if (shift <= KMEANS_EPSILON) break;
    }

    KEYMORPH_DEBUG_LOG("k-means: %zu points, k=%zu, %zu iterations", n, k, result.iterations);
    return result;
}

void balance_clusters(const std::vector<Point2D>& points, KMeansResult& clusters) {
    const std::size_t k = clusters.centroids.size();
    const std::size_t n = points.size();
    if (k < 2 || n <= k) return;

    auto cluster_mean = [&](std::size_t c) {
        std::vector<Point2D> members;
        for (std::size_t i = 0; i < n; ++i) {
            if (clusters.assignment[i] == c) members.push_back(points[i]);
        }
        return members.empty() ? clusters.centroids[c] : mean_point(members);
    };

    for (std::size_t round = 0; round < n * k; ++round) {
        std::vector<std::size_t> sizes(k, 0);
        for (std::size_t c : clusters.assignment) ++sizes[c];

        auto largest = static_cast<std::size_t>(std::max_element(sizes.begin(), sizes.end()) - sizes.begin());
        auto smallest = static_cast<std::size_t>(std::min_element(sizes.begin(), sizes.end()) - sizes.begin());
        if (sizes[largest] - sizes[smallest] <= 1) break;

        Point2D target = cluster_mean(smallest);
        std::size_t move = n;
        double best_dist = std::numeric_limits<double>::infinity();
        for (std::size_t i = 0; i < n; ++i) {
            if (clusters.assignment[i] != largest) continue;
            double d = distance(points[i], target);
            if (d < best_dist) {
                best_dist = d;
                move = i;
            }
        }

        clusters.assignment[move] = smallest;
        clusters.centroids[largest] = cluster_mean(largest);
        clusters.centroids[smallest] = cluster_mean(smallest);
    }
}

std::vector<std::size_t> solve_assignment(const std::vector<std::vector<double>>& cost) {
    const std::size_t n = cost.size();
    if (n == 0) return {};
    const std::size_t m = cost[0].size();
    const double inf = std::numeric_limits<double>::infinity();

    // Potentials and matching over 1-based rows/columns; column 0 is virtual
    std::vector<double> u(n + 1, 0.0);
    std::vector<double> v(m + 1, 0.0);
    std::vector<std::size_t> p(m + 1, 0);
    std::vector<std::size_t> way(m + 1, 0);

    for (std::size_t i = 1; i <= n; ++i) {
        p[0] = i;
        std::size_t j0 = 0;
        std::vector<double> minv(m + 1, inf);
        std::vector<bool> used(m + 1, false);
        do {
            used[j0] = true;
            std::size_t i0 = p[j0];
            std::size_t j1 = 0;
            double delta = inf;
            for (std::size_t j = 1; j <= m; ++j) {
                if (used[j]) continue;
                double cur = cost[i0 - 1][j - 1] - u[i0] - v[j];
                if (cur < minv[j]) {
                    minv[j] = cur;
                    way[j] = j0;
                }
                if (minv[j] < delta) {
                    delta = minv[j];
                    j1 = j;
                }
            }
            for (std::size_t j = 0; j <= m; ++j) {
                if (used[j]) {
                    u[p[j]] += delta;
                    v[j] -= delta;
                } else {
                    minv[j] -= delta;
                }
            }
            j0 = j1;
        } while (p[j0] != 0);

        do {
            std::size_t j1 = way[j0];
            p[j0] = p[j1];
            j0 = j1;
        } while (j0 != 0);
    }

    std::vector<std::size_t> row_to_col(n, 0);
    for (std::size_t j = 1; j <= m; ++j) {
        if (p[j] != 0) row_to_col[p[j] - 1] = j - 1;
    }
    return row_to_col;
}

} // namespace keymorph
