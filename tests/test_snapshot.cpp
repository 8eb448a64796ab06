#include <gtest/gtest.h>
#include <keymorph/snapshot.hpp>
#include <keymorph/variant_registry.hpp>
#include "test_helpers.hpp"

using namespace keymorph;
using test_utils::make_snapshot;

TEST(SnapshotTest, TypedAccess) {
    Snapshot s = make_snapshot("circle", {
        {"radius", 10.0},
        {"rotation", Angle(45.0)},
        {"fill", Color(255, 0, 0)},
        {"visible", true},
        {"cap", std::string("round")},
    });

    EXPECT_EQ(s.variant(), "circle");
    EXPECT_EQ(s.size(), 5u);
    EXPECT_EQ(s.get<double>("radius"), 10.0);
    EXPECT_FALSE(s.get<double>("fill").has_value());
    EXPECT_EQ(s.get<std::string>("cap"), std::string("round"));
    EXPECT_EQ(s.get<bool>("visible"), true);
    EXPECT_FALSE(s.has("missing"));

    EXPECT_DOUBLE_EQ(s.number_or("radius", 0.0), 10.0);
    EXPECT_DOUBLE_EQ(s.number_or("rotation", 0.0), 45.0);
    EXPECT_DOUBLE_EQ(s.number_or("fill", -1.0), -1.0);
}

TEST(SnapshotTest, ModifiersReturnCopies) {
    Snapshot original = make_snapshot("circle", {{"radius", 10.0}});
    Snapshot bigger = original.with("radius", 20.0);
    Snapshot renamed = original.with_variant("ellipse");
    Snapshot stripped = original.without("radius");

    EXPECT_EQ(original.get<double>("radius"), 10.0);
    EXPECT_EQ(bigger.get<double>("radius"), 20.0);
    EXPECT_EQ(renamed.variant(), "ellipse");
    EXPECT_EQ(stripped.size(), 0u);
    EXPECT_NE(original, bigger);
    EXPECT_NE(original.hash(), bigger.hash());
    EXPECT_EQ(original.hash(), make_snapshot("circle", {{"radius", 10.0}}).hash());
}

TEST(SnapshotTest, AttributeKinds) {
    EXPECT_EQ(kind_of(AttributeValue(1.0)), AttributeKind::NUMBER);
    EXPECT_EQ(kind_of(AttributeValue(Angle(1.0))), AttributeKind::ANGLE);
    EXPECT_EQ(kind_of(AttributeValue(Color())), AttributeKind::COLOR);
    EXPECT_EQ(kind_of(AttributeValue(false)), AttributeKind::BOOLEAN);
    EXPECT_EQ(kind_of(AttributeValue(std::string("a"))), AttributeKind::TOKEN);
    EXPECT_EQ(kind_of(AttributeValue(ContourSet())), AttributeKind::CONTOURS);
    EXPECT_STREQ(attribute_kind_name(AttributeKind::CONTOURS), "contours");
}

TEST(VariantRegistryTest, DefaultEasingLookup) {
    VariantRegistry registry;
    registry.register_variant("circle", VariantTraits{{{"radius", &easing::in_quad}}, nullptr});
    registry.set_default_easing("circle", "x", &easing::step);

    ASSERT_NE(registry.default_easing("circle", "radius"), nullptr);
    EXPECT_DOUBLE_EQ((*registry.default_easing("circle", "radius"))(0.5), 0.25);
    EXPECT_DOUBLE_EQ((*registry.default_easing("circle", "x"))(0.4), 0.0);
    EXPECT_EQ(registry.default_easing("circle", "opacity"), nullptr);
    EXPECT_EQ(registry.default_easing("square", "radius"), nullptr);
    EXPECT_FALSE(registry.has_geometry("circle"));
}

TEST(VariantRegistryTest, RegistrationReplaces) {
    VariantRegistry registry;
    registry.register_variant("blob", VariantTraits{});
    registry.set_geometry("blob", [](const Snapshot&) {
        return ContourSet(test_utils::square(1.0));
    });
    EXPECT_TRUE(registry.has_geometry("blob"));

    registry.register_variant("blob", VariantTraits{});
    EXPECT_FALSE(registry.has_geometry("blob"));
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.variants(), std::vector<std::string>{"blob"});
}
