#include <gtest/gtest.h>
#include <keymorph/frame_batch.hpp>
#include <keymorph/shapes.hpp>
#include "test_helpers.hpp"
#include <stdexcept>

using namespace keymorph;
using test_utils::make_snapshot;

class FrameBatchTest : public ::testing::Test {
protected:
    std::shared_ptr<VariantRegistry> registry;

    void SetUp() override {
        registry = std::make_shared<VariantRegistry>();
        register_builtin_shapes(*registry);
    }

    Animation morphing_animation(std::shared_ptr<MorphCache> cache = nullptr) {
        Timeline timeline = resolve_timeline({
            make_snapshot("circle", {{"radius", 20.0}, {"num_vertices", 24.0}, {"x", 0.0}}),
            make_snapshot("star", {{"outer_radius", 30.0}, {"inner_radius", 12.0},
                                   {"num_vertices", 24.0}, {"x", 50.0}}),
            make_snapshot("rectangle", {{"width", 40.0}, {"height", 20.0},
                                        {"num_vertices", 24.0}, {"x", 100.0}}),
        });
        return Animation(std::move(timeline), registry, {}, {}, std::move(cache));
    }
};

TEST_F(FrameBatchTest, FrameTimes) {
    EXPECT_THROW(FrameBatch::frame_times(0), std::invalid_argument);
    EXPECT_EQ(FrameBatch::frame_times(1), (std::vector<double>{0.0}));
    EXPECT_EQ(FrameBatch::frame_times(2), (std::vector<double>{0.0, 1.0}));
    EXPECT_EQ(FrameBatch::frame_times(5), (std::vector<double>{0.0, 0.25, 0.5, 0.75, 1.0}));
}

TEST_F(FrameBatchTest, RenderMatchesSequentialEvaluation) {
    Animation animation = morphing_animation();
    FrameBatch batch(4);
    EXPECT_EQ(batch.num_workers(), 4u);

    std::vector<Snapshot> frames = batch.render(animation, 21);
    ASSERT_EQ(frames.size(), 21u);
    std::vector<double> times = FrameBatch::frame_times(21);
    for (std::size_t i = 0; i < frames.size(); ++i) {
        EXPECT_EQ(frames[i], animation.state_at(times[i])) << "frame " << i;
    }
}

TEST_F(FrameBatchTest, RenderWithSharedCache) {
    auto cache = std::make_shared<MorphCache>();
    Animation animation = morphing_animation(cache);
    FrameBatch batch(4);

    std::vector<Snapshot> frames = batch.render(animation, 40);
    ASSERT_EQ(frames.size(), 40u);
    EXPECT_EQ(frames.front().variant(), "circle");
    EXPECT_EQ(frames.back().variant(), "rectangle");
    // One prepared morph per segment
    EXPECT_EQ(cache->size(), 2u);
    EXPECT_GT(cache->hits(), 0u);
}

TEST_F(FrameBatchTest, RenderTimesKeepsOrder) {
    Animation animation = morphing_animation();
    FrameBatch batch(2);

    std::vector<double> times = {0.9, 0.1, 0.5};
    std::vector<Snapshot> frames = batch.render_times(animation, times);
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(frames[0], animation.state_at(0.9));
    EXPECT_EQ(frames[1], animation.state_at(0.1));
    EXPECT_EQ(frames[2], animation.state_at(0.5));
}

TEST_F(FrameBatchTest, FrameErrorsPropagate) {
    EasingFunction failing = [](double t) -> double {
        if (t > 0.5) throw std::domain_error("easing failed");
        return t;
    };
    Animation animation(resolve_timeline({make_snapshot("dot", {{"x", 0.0}}),
                                          make_snapshot("dot", {{"x", 1.0}})}),
                        nullptr, {{"x", failing}});
    FrameBatch batch(2);

    EXPECT_THROW(batch.render(animation, 10), std::domain_error);

    // The batch recovers for the next render
    std::vector<Snapshot> frames = batch.render_times(animation, {0.0, 0.25, 0.5});
    EXPECT_EQ(frames.size(), 3u);
}
