#include <gtest/gtest.h>
#include <keymorph/animation.hpp>
#include <keymorph/errors.hpp>
#include <keymorph/shapes.hpp>
#include "test_helpers.hpp"

using namespace keymorph;
using test_utils::make_snapshot;

class AnimationTest : public ::testing::Test {
protected:
    std::shared_ptr<VariantRegistry> registry;

    void SetUp() override {
        registry = std::make_shared<VariantRegistry>();
        register_builtin_shapes(*registry);
    }

    static Timeline slide() {
        return resolve_timeline({make_snapshot("dot", {{"x", 0.0}, {"y", 0.0}}),
                                 make_snapshot("dot", {{"x", 100.0}, {"y", 0.0}})});
    }

    static double number(const Snapshot& s, const std::string& name) {
        return s.get<double>(name).value_or(-1.0);
    }
};

// ============================================================================
// PropertyTimeline
// ============================================================================

TEST_F(AnimationTest, PropertyTimelineFillsTimes) {
    PropertyTimeline property("y", {
        {std::nullopt, 0.0, {}},
        {std::nullopt, 10.0, {}},
        {std::nullopt, 20.0, {}},
        {0.9, 30.0, {}},
        {std::nullopt, 40.0, {}},
    });

    ASSERT_EQ(property.size(), 5u);
    EXPECT_DOUBLE_EQ(*property[0].time, 0.0);
    EXPECT_DOUBLE_EQ(*property[1].time, 0.3);
    EXPECT_DOUBLE_EQ(*property[2].time, 0.6);
    EXPECT_DOUBLE_EQ(*property[3].time, 0.9);
    EXPECT_DOUBLE_EQ(*property[4].time, 1.0);
}

TEST_F(AnimationTest, PropertyTimelineRejectsBadInput) {
    EXPECT_THROW(PropertyTimeline("y", {}), InvalidTimelineError);
    EXPECT_THROW(PropertyTimeline("y", {{1.5, 0.0, {}}, {std::nullopt, 1.0, {}}}), InvalidTimelineError);

    try {
        PropertyTimeline("y", {{0.0, 0.0, {}}, {0.6, 1.0, {}}, {0.4, 2.0, {}}});
        FAIL() << "Expected InvalidTimelineError";
    } catch (const InvalidTimelineError& e) {
        EXPECT_EQ(e.entry_index(), 2u);
    }
}

TEST_F(AnimationTest, PropertyValueHoldsOutsideKeyframes) {
    InterpolationEngine engine;
    Snapshot context = make_snapshot("dot");
    PropertyTimeline property("y", {{0.2, 5.0, {}}, {0.8, 15.0, {}}});

    EXPECT_EQ(property.value_at(0.0, engine, context), AttributeValue(5.0));
    EXPECT_EQ(property.value_at(0.2, engine, context), AttributeValue(5.0));
    EXPECT_EQ(property.value_at(1.0, engine, context), AttributeValue(15.0));
    EXPECT_NEAR(std::get<double>(property.value_at(0.5, engine, context)), 10.0, 1e-9);

    PropertyTimeline single("y", {{std::nullopt, 7.0, {}}});
    EXPECT_EQ(single.value_at(0.75, engine, context), AttributeValue(7.0));
}

TEST_F(AnimationTest, PropertyKeyframeEasing) {
    InterpolationEngine engine(registry);
    Snapshot context = make_snapshot("circle");

    PropertyTimeline defaulted("x", {{0.0, 0.0, {}}, {1.0, 100.0, {}}});
    auto eased = std::get<double>(defaulted.value_at(0.25, engine, context));
    EXPECT_NEAR(eased, 100.0 * easing::in_out(0.25), 1e-9);

    PropertyTimeline stepped("x", {{0.0, 0.0, {}}, {1.0, 100.0, &easing::step}});
    EXPECT_EQ(stepped.value_at(0.4, engine, context), AttributeValue(0.0));
    EXPECT_EQ(stepped.value_at(0.6, engine, context), AttributeValue(100.0));
}

TEST_F(AnimationTest, PropertyMixedKindsSwitch) {
    InterpolationEngine engine;
    Snapshot context = make_snapshot("dot");
    PropertyTimeline property("label", {{0.0, 1.0, {}}, {1.0, std::string("done"), {}}});

    EXPECT_EQ(property.value_at(0.3, engine, context), AttributeValue(1.0));
    EXPECT_EQ(property.value_at(0.7, engine, context), AttributeValue(std::string("done")));
}

// ============================================================================
// Animation
// ============================================================================

TEST_F(AnimationTest, StateAtFollowsKeystates) {
    Animation animation(slide());
    EXPECT_TRUE(animation.is_animated());
    EXPECT_DOUBLE_EQ(number(animation.state_at(0.5), "x"), 50.0);
    EXPECT_EQ(animation.state_at(0.0), animation.timeline().front().snapshot);
}

TEST_F(AnimationTest, PropertyTimelineOverridesKeystates) {
    Animation animation(slide());
    animation.add_property_timeline(PropertyTimeline("y", {{0.0, 0.0, {}}, {0.5, 40.0, {}}, {1.0, 0.0, {}}}));
    ASSERT_TRUE(animation.has_property_timeline("y"));

    Snapshot quarter = animation.state_at(0.25);
    EXPECT_DOUBLE_EQ(number(quarter, "x"), 25.0);
    EXPECT_DOUBLE_EQ(number(quarter, "y"), 20.0);
    EXPECT_DOUBLE_EQ(number(animation.state_at(0.5), "y"), 40.0);
    // Also applies at the endpoints
    EXPECT_DOUBLE_EQ(number(animation.state_at(1.0), "y"), 0.0);
}

TEST_F(AnimationTest, PropertyTimelineAddsAttribute) {
    Animation animation(slide());
    animation.add_property_timeline(PropertyTimeline("opacity", {{std::nullopt, 1.0, {}}, {std::nullopt, 0.0, {}}}));
    animation.add_property_timeline(PropertyTimeline("opacity", {{std::nullopt, 0.0, {}}, {std::nullopt, 1.0, {}}}));

    EXPECT_DOUBLE_EQ(number(animation.state_at(0.25), "opacity"), 0.25);
}

TEST_F(AnimationTest, StaticAnimation) {
    Snapshot still = make_snapshot("dot", {{"x", 3.0}});
    Animation animation(resolve_timeline({still, still, still}));
    EXPECT_FALSE(animation.is_animated());
    EXPECT_EQ(animation.state_at(0.4), still);

    animation.add_property_timeline(PropertyTimeline("x", {{std::nullopt, 3.0, {}}, {std::nullopt, 4.0, {}}}));
    EXPECT_TRUE(animation.is_animated());
}

TEST_F(AnimationTest, EntityEasingReachesEngine) {
    Animation animation(slide(), registry, {{"x", &easing::step}});
    EXPECT_DOUBLE_EQ(number(animation.state_at(0.4), "x"), 0.0);
    EXPECT_DOUBLE_EQ(number(animation.state_at(0.6), "x"), 100.0);
    EXPECT_EQ(animation.engine().easing().entity_overrides().size(), 1u);
}

TEST_F(AnimationTest, MalformedKeystatesReportAsKeymorphError) {
    // Callers can handle every validation failure through the common base
    auto build = [this] {
        Animation animation(resolve_timeline({TimedSnapshot{0.6, make_snapshot("dot", {{"x", 0.0}})},
                                              TimedSnapshot{0.2, make_snapshot("dot", {{"x", 1.0}})}}),
                            registry);
        return animation.state_at(0.5);
    };
    EXPECT_THROW(build(), KeymorphError);

    try {
        build();
        FAIL() << "Expected KeymorphError";
    } catch (const KeymorphError& e) {
        EXPECT_NE(std::string(e.what()).find("strictly increase"), std::string::npos);
    }
}
