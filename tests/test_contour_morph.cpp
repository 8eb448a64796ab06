#include <gtest/gtest.h>
#include <keymorph/contour_morph.hpp>
#include <keymorph/morph_cache.hpp>
#include <keymorph/shapes.hpp>
#include "test_helpers.hpp"
#include <thread>
#include <vector>

using namespace keymorph;
using test_utils::expect_loop_near;
using test_utils::expect_point_near;
using test_utils::holes_at;
using test_utils::is_collapsed;
using test_utils::square;

class ContourMorphTest : public ::testing::Test {
protected:
    ContourSet plate(const std::vector<Point2D>& hole_centers) {
        return ContourSet(square(20.0), holes_at(hole_centers));
    }

    static void expect_structurally_equal(const PreparedMorph& morph) {
        ASSERT_EQ(morph.start.holes.size(), morph.end.holes.size());
        EXPECT_EQ(morph.start.outer.size(), morph.end.outer.size());
        for (std::size_t i = 0; i < morph.start.holes.size(); ++i) {
            EXPECT_EQ(morph.start.holes[i].size(), morph.end.holes[i].size()) << "hole " << i;
        }
    }
};

// ============================================================================
// Outer loops
// ============================================================================

TEST_F(ContourMorphTest, MismatchedPointCountsMeetAtLarger) {
    PreparedMorph morph = prepare_morph(ContourSet(square(10.0)), ContourSet(shapes::circle(10.0, 8)), {});
    EXPECT_EQ(morph.start.outer.size(), 8u);
    EXPECT_EQ(morph.end.outer.size(), 8u);
}

TEST_F(ContourMorphTest, ExplicitResolution) {
    MorphRequest request;
    request.resolution = 32;
    PreparedMorph morph = prepare_morph(plate({{5, 5}}), plate({{-5, -5}}), request);
    EXPECT_EQ(morph.start.outer.size(), 32u);
    EXPECT_EQ(morph.end.outer.size(), 32u);
    ASSERT_EQ(morph.start.holes.size(), 1u);
    EXPECT_EQ(morph.start.holes[0].size(), 32u);
    EXPECT_EQ(morph.end.holes[0].size(), 32u);
}

TEST_F(ContourMorphTest, EndpointsReproducePreparedLoops) {
    PreparedMorph morph = prepare_morph(ContourSet(square(10.0)), ContourSet(shapes::circle(15.0, 8)), {});
    expect_loop_near(interpolate_morph(morph, 0.0).outer, morph.start.outer);
    expect_loop_near(interpolate_morph(morph, 1.0).outer, morph.end.outer);
}

TEST_F(ContourMorphTest, MidpointIsPerPointAverage) {
    PreparedMorph morph = prepare_morph(ContourSet(square(10.0)), ContourSet(square(20.0)), {});
    ContourSet middle = interpolate_morph(morph, 0.5);
    ASSERT_EQ(middle.outer.size(), 4u);
    for (std::size_t i = 0; i < 4; ++i) {
        expect_point_near(middle.outer[i], lerp(morph.start.outer[i], morph.end.outer[i], 0.5));
    }
    // Same orientation on both sides, so corners stay corners
    EXPECT_NEAR(middle.outer.signed_area(), 30.0 * 30.0, 1e-9);
}

TEST_F(ContourMorphTest, ClosedToOpenIsOpen) {
    PreparedMorph morph = prepare_morph(ContourSet(shapes::circle(10.0, 8)), ContourSet(shapes::line(20.0, 8)), {});
    EXPECT_EQ(morph.outer_alignment.shifted, AlignedSide::FIRST);
    EXPECT_FALSE(interpolate_morph(morph, 0.5).outer.closed());
    EXPECT_TRUE(interpolate_morph(morph, 0.0).outer.points() == morph.start.outer.points());
}

TEST_F(ContourMorphTest, EmptyOuterGrowsFromCentroid) {
    PreparedMorph morph = prepare_morph(ContourSet(), ContourSet(square(10.0, {3, 4})), {});
    ASSERT_EQ(morph.start.outer.size(), 4u);
    EXPECT_TRUE(is_collapsed(morph.start.outer));
    expect_point_near(morph.start.outer[0], {3, 4});
}

TEST_F(ContourMorphTest, ExplicitAlignerIsUsed) {
    MorphRequest request;
    request.aligner = std::make_shared<NullAligner>();
    VertexLoop shifted(rotate_list(square(10.0).points(), 2));
    PreparedMorph morph = prepare_morph(ContourSet(square(10.0)), ContourSet(shifted), request);
    EXPECT_EQ(morph.end.outer, shifted);
}

// ============================================================================
// Holes
// ============================================================================

TEST_F(ContourMorphTest, HoleAlignerIsUsed) {
    VertexLoop hole = square(1.0);
    VertexLoop turned(rotate_list(hole.points(), 2), true);
    ContourSet start(square(20.0), {hole});
    ContourSet end(square(20.0), {turned});

    PreparedMorph aligned = prepare_morph(start, end, {});
    ASSERT_EQ(aligned.end.holes.size(), 1u);
    expect_loop_near(aligned.end.holes[0], hole);

    MorphRequest request;
    request.hole_aligner = std::make_shared<NullAligner>();
    PreparedMorph unaligned = prepare_morph(start, end, request);
    ASSERT_EQ(unaligned.end.holes.size(), 1u);
    EXPECT_EQ(unaligned.end.holes[0], turned);
}

TEST_F(ContourMorphTest, EqualHoleCountsPairByPosition) {
    PreparedMorph morph = prepare_morph(plate({{-5, 0}, {5, 0}}), plate({{5, 1}, {-5, 1}}), {});
    expect_structurally_equal(morph);
    ASSERT_EQ(morph.start.holes.size(), 2u);
    for (std::size_t i = 0; i < 2; ++i) {
        Point2D a = morph.start.holes[i].centroid();
        Point2D b = morph.end.holes[i].centroid();
        EXPECT_NEAR(a.x, b.x, 1e-9) << "hole " << i << " crosses the plate";
    }
}

TEST_F(ContourMorphTest, HolesShrinkWhenDestinationHasNone) {
    PreparedMorph morph = prepare_morph(plate({{-5, 0}, {5, 0}}), ContourSet(square(20.0)), {});
    expect_structurally_equal(morph);
    ASSERT_EQ(morph.end.holes.size(), 2u);
    for (std::size_t i = 0; i < 2; ++i) {
        EXPECT_TRUE(is_collapsed(morph.end.holes[i]));
        expect_point_near(morph.end.holes[i][0], morph.start.holes[i].centroid());
    }
    EXPECT_EQ(interpolate_morph(morph, 1.0).holes.size(), 2u);
}

TEST_F(ContourMorphTest, HolesGrowWhenSourceHasNone) {
    PreparedMorph morph = prepare_morph(ContourSet(square(20.0)), plate({{0, 5}}), {});
    expect_structurally_equal(morph);
    ASSERT_EQ(morph.start.holes.size(), 1u);
    EXPECT_TRUE(is_collapsed(morph.start.holes[0]));
    expect_point_near(morph.start.holes[0][0], {0, 5});
    EXPECT_EQ(morph.holes.grow, (std::vector<std::size_t>{0}));
}

TEST_F(ContourMorphTest, MergingHolesShareDestination) {
    MorphRequest request;
    request.hole_matcher = std::make_shared<GreedyHoleMatcher>();
    PreparedMorph morph = prepare_morph(plate({{-5, 0}, {-4, 0}, {5, 0}}), plate({{-4.5, 0}, {5, 0}}), request);
    expect_structurally_equal(morph);
    EXPECT_EQ(morph.start.holes.size(), 3u);
    EXPECT_EQ(morph.holes.pairs.size(), 3u);
    EXPECT_TRUE(morph.holes.grow.empty());
    expect_point_near(morph.end.holes[0].centroid(), morph.end.holes[1].centroid());
}

TEST_F(ContourMorphTest, SimpleMatcherShrinksAndGrowsEverything) {
    MorphRequest request;
    request.hole_matcher = std::make_shared<SimpleHoleMatcher>();
    PreparedMorph morph = prepare_morph(plate({{-5, 0}}), plate({{5, 0}}), request);
    expect_structurally_equal(morph);
    EXPECT_EQ(morph.start.holes.size(), 2u);
    EXPECT_TRUE(is_collapsed(morph.end.holes[0]));
    EXPECT_TRUE(is_collapsed(morph.start.holes[1]));
}

// ============================================================================
// MorphCache
// ============================================================================

class MorphCacheTest : public ContourMorphTest {};

TEST_F(MorphCacheTest, SecondRequestHits) {
    MorphCache cache;
    ContourSet a = plate({{-5, 0}});
    ContourSet b = ContourSet(shapes::circle(20.0, 16));

    PreparedMorphPtr first = cache.prepared(a, b, {});
    PreparedMorphPtr second = cache.prepared(a, b, {});
    EXPECT_EQ(first, second);
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 1u);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(first->start, prepare_morph(a, b, {}).start);
}

TEST_F(MorphCacheTest, RotationIsPartOfTheKey) {
    MorphCache cache;
    ContourSet a(square(10.0));
    ContourSet b(shapes::circle(10.0, 8));

    MorphRequest turned;
    turned.rotation2 = 45.0;
    cache.prepared(a, b, {});
    cache.prepared(a, b, turned);
    EXPECT_EQ(cache.misses(), 2u);
    EXPECT_EQ(cache.size(), 2u);
}

TEST_F(MorphCacheTest, EqualStrategiesShareEntries) {
    MorphCache cache;
    ContourSet a = plate({{-5, 0}, {5, 0}});
    ContourSet b = plate({{0, 0}});

    MorphRequest first;
    first.hole_matcher = std::make_shared<ClusteringHoleMatcher>();
    MorphRequest second;
    second.hole_matcher = std::make_shared<ClusteringHoleMatcher>();
    MorphRequest other;
    other.hole_matcher = std::make_shared<DiscreteHoleMatcher>();

    cache.prepared(a, b, first);
    cache.prepared(a, b, second);
    cache.prepared(a, b, other);
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.size(), 2u);
}

TEST_F(MorphCacheTest, AlignmentSettingsArePartOfTheKey) {
    MorphCache cache;
    ContourSet a = plate({{-5, 0}});
    ContourSet b = plate({{5, 0}});

    MorphRequest linf;
    linf.norm = AlignmentNorm::LINF;
    MorphRequest unaligned_holes;
    unaligned_holes.hole_aligner = std::make_shared<NullAligner>();

    cache.prepared(a, b, {});
    cache.prepared(a, b, linf);
    cache.prepared(a, b, unaligned_holes);
    EXPECT_EQ(cache.misses(), 3u);
    EXPECT_EQ(cache.hits(), 0u);
    EXPECT_NE(make_morph_key(a, b, {}), make_morph_key(a, b, linf));
}

TEST_F(MorphCacheTest, FindAndClear) {
    MorphCache cache;
    ContourSet a(square(10.0));
    ContourSet b(square(5.0));

    EXPECT_EQ(cache.find(make_morph_key(a, b, {})), nullptr);
    PreparedMorphPtr stored = cache.prepared(a, b, {});
    EXPECT_EQ(cache.find(make_morph_key(a, b, {})), stored);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.misses(), 0u);
    EXPECT_EQ(cache.find(make_morph_key(a, b, {})), nullptr);
}

TEST_F(MorphCacheTest, ConcurrentRequestsAgree) {
    MorphCache cache(16);
    ContourSet a = plate({{-5, 0}, {5, 0}, {0, 5}});
    ContourSet b = ContourSet(shapes::circle(25.0, 64), holes_at({{0, 0}}));

    constexpr std::size_t THREADS = 8;
    constexpr std::size_t REPEATS = 25;
    std::vector<PreparedMorphPtr> results(THREADS);
    std::vector<std::thread> threads;
    for (std::size_t t = 0; t < THREADS; ++t) {
        threads.emplace_back([&, t]() {
            for (std::size_t r = 0; r < REPEATS; ++r) {
                results[t] = cache.prepared(a, b, {});
            }
        });
    }
    for (auto& thread : threads) thread.join();

    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.hits() + cache.misses(), THREADS * REPEATS);
    for (const auto& result : results) {
        EXPECT_EQ(result, results[0]);
    }
}
