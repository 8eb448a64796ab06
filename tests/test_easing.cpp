#include <gtest/gtest.h>
#include <keymorph/easing.hpp>
#include <cmath>

using namespace keymorph;

TEST(EasingTest, CatalogEndpoints) {
    auto all = easing::names();
    EXPECT_EQ(all.size(), 33u);
    for (const auto& name : all) {
        SCOPED_TRACE(name);
        auto fn = easing::find(name);
        ASSERT_TRUE(fn.has_value());
        EXPECT_NEAR((*fn)(0.0), 0.0, 1e-9);
        EXPECT_NEAR((*fn)(1.0), 1.0, 1e-9);
    }
}

TEST(EasingTest, InputIsClamped) {
    EXPECT_DOUBLE_EQ(easing::linear(-0.5), 0.0);
    EXPECT_DOUBLE_EQ(easing::linear(1.5), 1.0);
    EXPECT_DOUBLE_EQ(easing::in_cubic(2.0), 1.0);
}

TEST(EasingTest, KnownMidpoints) {
    EXPECT_DOUBLE_EQ(easing::in_out(0.5), 0.5);
    EXPECT_DOUBLE_EQ(easing::in_quad(0.5), 0.25);
    EXPECT_DOUBLE_EQ(easing::out_quad(0.5), 0.75);
    EXPECT_DOUBLE_EQ(easing::in_out_cubic(0.5), 0.5);
    EXPECT_NEAR(easing::in_out_sine(0.5), 0.5, 1e-12);
}

TEST(EasingTest, StepSwitchesAtHalf) {
    EXPECT_DOUBLE_EQ(easing::step(0.0), 0.0);
    EXPECT_DOUBLE_EQ(easing::step(0.49), 0.0);
    EXPECT_DOUBLE_EQ(easing::step(0.5), 1.0);
    EXPECT_DOUBLE_EQ(easing::step(1.0), 1.0);
}

TEST(EasingTest, BackOvershoots) {
    EXPECT_LT(easing::in_back(0.2), 0.0);
    EXPECT_GT(easing::out_back(0.8), 1.0);
}

TEST(EasingTest, BounceStaysInRange) {
    for (int i = 0; i <= 100; ++i) {
        double t = i / 100.0;
        double v = easing::out_bounce(t);
        EXPECT_GE(v, -1e-12);
        EXPECT_LE(v, 1.0 + 1e-12);
    }
}

TEST(EasingTest, UnknownNameIsNotFound) {
    EXPECT_FALSE(easing::find("wobble").has_value());
    EXPECT_TRUE(easing::find("in_out_elastic").has_value());
}

TEST(EasingTest, Composition) {
    EasingFunction rev = easing::reversed(&easing::in_quad);
    EXPECT_DOUBLE_EQ(rev(0.5), 0.75);

    EasingFunction there_and_back = easing::mirrored(&easing::linear);
    EXPECT_DOUBLE_EQ(there_and_back(0.25), 0.5);
    EXPECT_DOUBLE_EQ(there_and_back(0.5), 1.0);
    EXPECT_DOUBLE_EQ(there_and_back(1.0), 0.0);

    EasingFunction twice = easing::chained(&easing::in_quad, &easing::in_quad);
    EXPECT_DOUBLE_EQ(twice(0.5), 0.0625);
}
