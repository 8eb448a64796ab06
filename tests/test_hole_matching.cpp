#include <gtest/gtest.h>
#include <keymorph/hole_matching.hpp>
#include "test_helpers.hpp"
#include <algorithm>

using namespace keymorph;
using test_utils::holes_at;

class HoleMatchingTest : public ::testing::Test {
protected:
    static std::vector<std::size_t> group_source_sizes(const HoleCorrespondence& corr) {
        std::vector<std::size_t> sizes;
        for (const auto& group : corr.groups) {
            sizes.push_back(group.sources.size());
        }
        std::sort(sizes.begin(), sizes.end());
        return sizes;
    }

    // Every source index appears in exactly one pair or in shrink
    static void expect_sources_covered(const HoleCorrespondence& corr, std::size_t count) {
        std::vector<int> seen(count, 0);
        for (const auto& pair : corr.pairs) ++seen[pair.source];
        for (std::size_t s : corr.shrink) ++seen[s];
        for (std::size_t i = 0; i < count; ++i) {
            EXPECT_GE(seen[i], 1) << "source " << i << " unused";
        }
    }
};

// ============================================================================
// Empty sides and Simple
// ============================================================================

TEST_F(HoleMatchingTest, EmptySidesGrowOrShrink) {
    ClusteringHoleMatcher matcher;
    auto holes = holes_at({{0, 0}, {10, 0}});

    HoleCorrespondence grow_only = matcher.match({}, holes);
    EXPECT_TRUE(grow_only.pairs.empty());
    EXPECT_EQ(grow_only.grow, (std::vector<std::size_t>{0, 1}));

    HoleCorrespondence shrink_only = matcher.match(holes, {});
    EXPECT_EQ(shrink_only.shrink, (std::vector<std::size_t>{0, 1}));
    EXPECT_TRUE(shrink_only.grow.empty());

    HoleCorrespondence nothing = matcher.match({}, {});
    EXPECT_EQ(nothing.morph_count(), 0u);
}

TEST_F(HoleMatchingTest, SimpleNeverPairs) {
    SimpleHoleMatcher matcher;
    HoleCorrespondence corr = matcher.match(holes_at({{0, 0}, {5, 0}, {10, 0}}),
                                            holes_at({{0, 0}, {10, 0}}));
    EXPECT_TRUE(corr.pairs.empty());
    EXPECT_EQ(corr.shrink.size(), 3u);
    EXPECT_EQ(corr.grow.size(), 2u);
    EXPECT_EQ(corr.morph_count(), 5u);
}

// ============================================================================
// Greedy
// ============================================================================

TEST_F(HoleMatchingTest, GreedyEqualCountsPairByNearestUnused) {
    GreedyHoleMatcher matcher;
    HoleCorrespondence corr = matcher.match(holes_at({{0, 0}, {10, 0}}),
                                            holes_at({{10, 1}, {0, 1}}));
    EXPECT_EQ(corr.pairs, (std::vector<HolePair>{{1, 0}, {0, 1}}));
    EXPECT_EQ(corr.groups.size(), 2u);
    EXPECT_TRUE(corr.shrink.empty());
    EXPECT_TRUE(corr.grow.empty());
}

TEST_F(HoleMatchingTest, GreedyMoreSourcesMerge) {
    GreedyHoleMatcher matcher;
    HoleCorrespondence corr = matcher.match(holes_at({{0, 0}, {1, 0}, {10, 0}}),
                                            holes_at({{0, 0}, {10, 0}}));
    EXPECT_EQ(corr.pairs, (std::vector<HolePair>{{0, 0}, {1, 0}, {2, 1}}));
    ASSERT_EQ(corr.groups.size(), 2u);
    EXPECT_EQ(corr.groups[0].sources, (std::vector<std::size_t>{0, 1}));
    EXPECT_EQ(corr.groups[0].destinations, (std::vector<std::size_t>{0}));
    EXPECT_TRUE(corr.grow.empty());
}

TEST_F(HoleMatchingTest, GreedyMoreDestinationsSplit) {
    GreedyHoleMatcher matcher;
    HoleCorrespondence corr = matcher.match(holes_at({{0, 0}, {50, 0}}),
                                            holes_at({{1, 0}, {-1, 0}, {2, 0}}));
    EXPECT_EQ(corr.pairs, (std::vector<HolePair>{{0, 0}, {0, 1}, {0, 2}}));
    // Nobody picked the far source
    EXPECT_EQ(corr.shrink, (std::vector<std::size_t>{1}));
}

// ============================================================================
// Clustering
// ============================================================================

TEST_F(HoleMatchingTest, ClusteringBalancedFiveIntoTwo) {
    ClusteringHoleMatcher matcher;
    auto sources = holes_at({{0, 0}, {1, 0}, {0, 1}, {1, 1}, {100, 0}});
    auto destinations = holes_at({{0, 0}, {100, 0}});

    HoleCorrespondence corr = matcher.match(sources, destinations);
    EXPECT_EQ(group_source_sizes(corr), (std::vector<std::size_t>{2, 3}));
    EXPECT_EQ(corr.pairs.size(), 5u);
    EXPECT_TRUE(corr.grow.empty());
    expect_sources_covered(corr, sources.size());
}

TEST_F(HoleMatchingTest, ClusteringWithoutBalance) {
    ClusteringParams params;
    params.balance_clusters = false;
    ClusteringHoleMatcher matcher(params);
    auto sources = holes_at({{0, 0}, {1, 0}, {0, 1}, {1, 1}, {100, 0}});
    auto destinations = holes_at({{0, 0}, {100, 0}});

    HoleCorrespondence corr = matcher.match(sources, destinations);
    EXPECT_EQ(group_source_sizes(corr), (std::vector<std::size_t>{1, 4}));

    // The far hole travels alone to the far destination
    auto far = std::find(corr.pairs.begin(), corr.pairs.end(), HolePair{4, 1});
    EXPECT_NE(far, corr.pairs.end());
}

TEST_F(HoleMatchingTest, ClusteringIsDeterministic) {
    ClusteringHoleMatcher matcher;
    auto sources = holes_at({{0, 0}, {3, 1}, {7, 2}, {12, 0}, {20, 5}, {21, 9}, {30, 3}});
    auto destinations = holes_at({{5, 0}, {25, 5}, {15, 15}});

    HoleCorrespondence first = matcher.match(sources, destinations);
    HoleCorrespondence second = matcher.match(sources, destinations);
    EXPECT_EQ(first.pairs, second.pairs);
    EXPECT_EQ(first.groups.size(), 3u);
    expect_sources_covered(first, sources.size());
}

TEST_F(HoleMatchingTest, ClusteringMoreDestinations) {
    ClusteringHoleMatcher matcher;
    HoleCorrespondence corr = matcher.match(holes_at({{0, 0}}),
                                            holes_at({{1, 0}, {-1, 0}, {0, 2}}));
    EXPECT_EQ(corr.pairs.size(), 3u);
    for (const auto& pair : corr.pairs) {
        EXPECT_EQ(pair.source, 0u);
    }
    ASSERT_EQ(corr.groups.size(), 1u);
    EXPECT_EQ(corr.groups[0].destinations.size(), 3u);
}

TEST_F(HoleMatchingTest, ClusteringParameterHash) {
    ClusteringParams other;
    other.random_seed = 7;
    EXPECT_NE(ClusteringHoleMatcher().parameter_hash(), ClusteringHoleMatcher(other).parameter_hash());
    EXPECT_EQ(ClusteringHoleMatcher().parameter_hash(), ClusteringHoleMatcher().parameter_hash());
    EXPECT_NE(GreedyHoleMatcher().parameter_hash(), SimpleHoleMatcher().parameter_hash());
}

// ============================================================================
// Discrete
// ============================================================================

TEST_F(HoleMatchingTest, DiscreteExcessSourcesShrink) {
    DiscreteHoleMatcher matcher;
    HoleCorrespondence corr = matcher.match(holes_at({{0, 0}, {5, 0}, {50, 0}}),
                                            holes_at({{4, 0}}));
    EXPECT_EQ(corr.pairs, (std::vector<HolePair>{{1, 0}}));
    EXPECT_EQ(corr.shrink, (std::vector<std::size_t>{0, 2}));
    EXPECT_TRUE(corr.grow.empty());
}

TEST_F(HoleMatchingTest, DiscreteExcessDestinationsGrow) {
    DiscreteHoleMatcher matcher;
    HoleCorrespondence corr = matcher.match(holes_at({{0, 0}}),
                                            holes_at({{100, 0}, {1, 0}}));
    EXPECT_EQ(corr.pairs, (std::vector<HolePair>{{0, 1}}));
    EXPECT_EQ(corr.grow, (std::vector<std::size_t>{0}));
}

// ============================================================================
// Optimal assignment
// ============================================================================

TEST_F(HoleMatchingTest, OptimalBeatsGreedyOnCrossing) {
    auto sources = holes_at({{0, 0}, {2, 0}});
    auto destinations = holes_at({{1, 0}, {-5, 0}});

    HoleCorrespondence greedy = GreedyHoleMatcher().match(sources, destinations);
    HoleCorrespondence optimal = OptimalAssignmentHoleMatcher().match(sources, destinations);

    EXPECT_EQ(greedy.pairs, (std::vector<HolePair>{{0, 0}, {1, 1}}));
    EXPECT_EQ(optimal.pairs, (std::vector<HolePair>{{0, 1}, {1, 0}}));
}

TEST_F(HoleMatchingTest, OptimalReplicatesSmallerSide) {
    OptimalAssignmentHoleMatcher matcher;
    HoleCorrespondence corr = matcher.match(holes_at({{0, 0}, {1, 0}, {10, 0}}),
                                            holes_at({{0.5, 0}, {10, 0}}));
    EXPECT_EQ(corr.pairs, (std::vector<HolePair>{{0, 0}, {1, 0}, {2, 1}}));
    EXPECT_TRUE(corr.grow.empty());
    EXPECT_EQ(corr.groups.size(), 2u);
}

// ============================================================================
// Building blocks
// ============================================================================

TEST_F(HoleMatchingTest, SolveAssignment) {
    std::vector<std::vector<double>> cost = {
        {4, 1, 3},
        {2, 0, 5},
        {3, 2, 2},
    };
    EXPECT_EQ(solve_assignment(cost), (std::vector<std::size_t>{1, 0, 2}));
    EXPECT_TRUE(solve_assignment({}).empty());
}

TEST_F(HoleMatchingTest, SolveAssignmentRectangular) {
    std::vector<std::vector<double>> cost = {
        {9, 1, 9, 9},
        {9, 9, 9, 2},
    };
    EXPECT_EQ(solve_assignment(cost), (std::vector<std::size_t>{1, 3}));
}

TEST_F(HoleMatchingTest, KMeansSeparatesGroups) {
    std::vector<Point2D> points = {{0, 0}, {1, 0}, {0, 1}, {50, 50}, {51, 50}, {50, 51}};
    KMeansResult result = kmeans(points, 2, ClusteringParams{});
    ASSERT_EQ(result.assignment.size(), 6u);
    ASSERT_EQ(result.centroids.size(), 2u);
    EXPECT_EQ(result.assignment[0], result.assignment[1]);
    EXPECT_EQ(result.assignment[0], result.assignment[2]);
    EXPECT_EQ(result.assignment[3], result.assignment[4]);
    EXPECT_NE(result.assignment[0], result.assignment[3]);
    EXPECT_GE(result.iterations, 1u);
}

TEST_F(HoleMatchingTest, KMeansWithEnoughClustersIsIdentity) {
    std::vector<Point2D> points = {{0, 0}, {1, 0}};
    KMeansResult result = kmeans(points, 5, ClusteringParams{});
    EXPECT_EQ(result.assignment, (std::vector<std::size_t>{0, 1}));
    EXPECT_EQ(result.centroids, points);
}

TEST_F(HoleMatchingTest, BalanceClustersEvensSizes) {
    std::vector<Point2D> points = {{0, 0}, {1, 0}, {2, 0}, {3, 0}, {4, 0}, {100, 0}};
    KMeansResult clusters;
    clusters.assignment = {0, 0, 0, 0, 0, 1};
    clusters.centroids = {{2, 0}, {100, 0}};

    balance_clusters(points, clusters);
    std::size_t in_first = std::count(clusters.assignment.begin(), clusters.assignment.end(), 0u);
    EXPECT_EQ(in_first, 3u);
    // Points nearest the far cluster move first
    EXPECT_EQ(clusters.assignment[4], 1u);
    EXPECT_EQ(clusters.assignment[3], 1u);
}

TEST_F(HoleMatchingTest, NearestUnusedAssignment) {
    std::vector<Point2D> sources = {{0, 0}, {10, 0}, {20, 0}};
    std::vector<Point2D> destinations = {{19, 0}, {18, 0}};
    EXPECT_EQ(nearest_unused_assignment(sources, destinations), (std::vector<std::size_t>{2, 1}));
}
