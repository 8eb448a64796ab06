#ifndef KEYMORPH_SHAPES_HPP
#define KEYMORPH_SHAPES_HPP

#include <keymorph/geometry.hpp>
#include <keymorph/variant_registry.hpp>
#include <cstddef>

namespace keymorph {
namespace shapes {

// Outline generators. All loops are centered on `center`, start at the top
// and run clockwise on screen (y down).

VertexLoop circle(double radius, std::size_t num_vertices = DEFAULT_NUM_VERTICES,
                  const Point2D& center = {});

VertexLoop ellipse(double rx, double ry, std::size_t num_vertices = DEFAULT_NUM_VERTICES,
                   const Point2D& center = {});

// Corners resampled to `num_vertices` points along the perimeter
VertexLoop rectangle(double width, double height, std::size_t num_vertices = DEFAULT_NUM_VERTICES,
                     const Point2D& center = {});

VertexLoop regular_polygon(std::size_t sides, double radius,
                           std::size_t num_vertices = DEFAULT_NUM_VERTICES,
                           const Point2D& center = {});

VertexLoop star(std::size_t num_points, double outer_radius, double inner_radius,
                std::size_t num_vertices = DEFAULT_NUM_VERTICES, const Point2D& center = {});

// Open horizontal polyline of `length`
VertexLoop line(double length, std::size_t num_vertices = DEFAULT_NUM_VERTICES,
                const Point2D& center = {});

} // namespace shapes

/**
 * Registers circle, ellipse, rectangle, polygon, star, line and the
 * perforated_circle / perforated_rectangle variants, together with their
 * default easing tables.
 *
 * Size attributes (numbers): radius, rx, ry, width, height, sides,
 * outer_radius, inner_radius, num_points_star, length, num_vertices.
 * Perforated variants take their holes from a ContourSet-valued "holes"
 * attribute (only its hole list is used).
 */
void register_builtin_shapes(VariantRegistry& registry);

} // namespace keymorph

#endif // KEYMORPH_SHAPES_HPP
