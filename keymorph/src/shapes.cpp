// shapes.cpp - Built-in geometry generators

#include "keymorph/shapes.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace keymorph {
namespace shapes {

namespace {

Point2D polar(const Point2D& center, double radius, double radians) {
    return {center.x + radius * std::sin(radians), center.y - radius * std::cos(radians)};
}

} // anonymous namespace

VertexLoop circle(double radius, std::size_t num_vertices, const Point2D& center) {
    return ellipse(radius, radius, num_vertices, center);
}

VertexLoop ellipse(double rx, double ry, std::size_t num_vertices, const Point2D& center) {
    std::vector<Point2D> points;
    points.reserve(num_vertices);
    for (std::size_t i = 0; i < num_vertices; ++i) {
        double angle = TWO_PI * static_cast<double>(i) / static_cast<double>(num_vertices);
        points.push_back({center.x + rx * std::sin(angle), center.y - ry * std::cos(angle)});
    }
    return VertexLoop(std::move(points), true);
}

VertexLoop rectangle(double width, double height, std::size_t num_vertices, const Point2D& center) {
    double hw = width / 2.0;
    double hh = height / 2.0;
    VertexLoop corners({
        {center.x - hw, center.y - hh},
        {center.x + hw, center.y - hh},
        {center.x + hw, center.y + hh},
        {center.x - hw, center.y + hh},
    }, true);
    return resample_loop(corners, num_vertices);
}

VertexLoop regular_polygon(std::size_t sides, double radius, std::size_t num_vertices,
                           const Point2D& center) {
    sides = std::max<std::size_t>(sides, 3);
    std::vector<Point2D> corners;
    corners.reserve(sides);
    for (std::size_t i = 0; i < sides; ++i) {
        corners.push_back(polar(center, radius, TWO_PI * static_cast<double>(i) / static_cast<double>(sides)));
    }
    return resample_loop(VertexLoop(std::move(corners), true), num_vertices);
}

VertexLoop star(std::size_t num_points, double outer_radius, double inner_radius,
                std::size_t num_vertices, const Point2D& center) {
    num_points = std::max<std::size_t>(num_points, 2);
    std::vector<Point2D> corners;
    corners.reserve(num_points * 2);
    for (std::size_t i = 0; i < num_points * 2; ++i) {
        double radius = (i % 2 == 0) ? outer_radius : inner_radius;
        corners.push_back(polar(center, radius, PI * static_cast<double>(i) / static_cast<double>(num_points)));
    }
    return resample_loop(VertexLoop(std::move(corners), true), num_vertices);
}

VertexLoop line(double length, std::size_t num_vertices, const Point2D& center) {
    VertexLoop segment({{center.x - length / 2.0, center.y}, {center.x + length / 2.0, center.y}}, false);
    return resample_loop(segment, std::max<std::size_t>(num_vertices, 2));
}

} // namespace shapes

// =============================================================================
// Registration
// =============================================================================

namespace {

// Rounded count attribute, never below `minimum` (NaN and negatives included)
std::size_t count_attribute(const Snapshot& s, const std::string& name, double fallback,
                            std::size_t minimum) {
    double n = std::round(s.number_or(name, fallback));
    if (!(n >= static_cast<double>(minimum))) return minimum;
    return static_cast<std::size_t>(n);
}

std::size_t vertex_count(const Snapshot& s) {
    return count_attribute(s, "num_vertices", static_cast<double>(DEFAULT_NUM_VERTICES), 3);
}

std::map<std::string, EasingFunction> base_easing() {
    return {
        {"x", &easing::in_out},
        {"y", &easing::in_out},
        {"scale", &easing::in_out},
        {"opacity", &easing::linear},
        {"rotation", &easing::in_out},
        {"num_vertices", &easing::step},
        {"closed", &easing::step},
        {CONTOURS_ATTRIBUTE, &easing::linear},
    };
}

VariantTraits make_traits(std::initializer_list<std::string> sized_attributes,
                          GeometryGenerator generator) {
    VariantTraits traits;
    traits.default_easing = base_easing();
    for (const auto& attribute : sized_attributes) {
        traits.default_easing[attribute] = &easing::in_out;
    }
    traits.geometry = std::move(generator);
    return traits;
}

std::vector<VertexLoop> holes_of(const Snapshot& s) {
    auto holes = s.get<ContourSet>("holes");
    return holes ? holes->holes : std::vector<VertexLoop>{};
}

} // anonymous namespace

void register_builtin_shapes(VariantRegistry& registry) {
    registry.register_variant("circle", make_traits({"radius"}, [](const Snapshot& s) {
        return ContourSet(shapes::circle(s.number_or("radius", 50.0), vertex_count(s)));
    }));

    registry.register_variant("ellipse", make_traits({"rx", "ry"}, [](const Snapshot& s) {
        return ContourSet(shapes::ellipse(s.number_or("rx", 50.0), s.number_or("ry", 30.0),
                                          vertex_count(s)));
    }));

    registry.register_variant("rectangle", make_traits({"width", "height"}, [](const Snapshot& s) {
        return ContourSet(shapes::rectangle(s.number_or("width", 100.0), s.number_or("height", 60.0),
                                            vertex_count(s)));
    }));

    registry.register_variant("polygon", make_traits({"radius"}, [](const Snapshot& s) {
        std::size_t sides = count_attribute(s, "sides", 6.0, 3);
        return ContourSet(shapes::regular_polygon(sides, s.number_or("radius", 50.0), vertex_count(s)));
    }));

    VariantTraits star_traits = make_traits({"outer_radius", "inner_radius"}, [](const Snapshot& s) {
        std::size_t points = count_attribute(s, "num_points_star", 5.0, 2);
        return ContourSet(shapes::star(points, s.number_or("outer_radius", 50.0),
                                       s.number_or("inner_radius", 25.0), vertex_count(s)));
    });
    star_traits.default_easing["num_points_star"] = &easing::step;
    registry.register_variant("star", std::move(star_traits));

    registry.register_variant("line", make_traits({"length"}, [](const Snapshot& s) {
        return ContourSet(shapes::line(s.number_or("length", 100.0), vertex_count(s)));
    }));

    registry.register_variant("perforated_circle", make_traits({"radius"}, [](const Snapshot& s) {
        return ContourSet(shapes::circle(s.number_or("radius", 50.0), vertex_count(s)), holes_of(s));
    }));

    registry.register_variant("perforated_rectangle", make_traits({"width", "height"}, [](const Snapshot& s) {
        return ContourSet(shapes::rectangle(s.number_or("width", 100.0), s.number_or("height", 60.0),
                                            vertex_count(s)),
                          holes_of(s));
    }));
}

} // namespace keymorph
