#ifndef KEYMORPH_GEOMETRY_HPP
#define KEYMORPH_GEOMETRY_HPP

#include <keymorph/types.hpp>
#include <vector>
#include <cstddef>
#include <initializer_list>

namespace keymorph {

/**
 * Ordered sequence of outline points.
 * A closed loop wraps implicitly from its last point back to its first; the
 * first point is never repeated at the end. An open loop is a polyline.
 */
class VertexLoop {
private:
    std::vector<Point2D> points_;
    bool closed_ = true;

public:
    VertexLoop() = default;
    explicit VertexLoop(std::vector<Point2D> points, bool closed = true)
        : points_(std::move(points)), closed_(closed) {}
    VertexLoop(std::initializer_list<Point2D> points, bool closed = true)
        : points_(points), closed_(closed) {}

    const std::vector<Point2D>& points() const { return points_; }
    bool closed() const { return closed_; }
    std::size_t size() const { return points_.size(); }
    bool empty() const { return points_.empty(); }
    const Point2D& operator[](std::size_t i) const { return points_[i]; }

    /**
     * Shoelace signed area; zero for open loops and loops under three points.
     */
    double signed_area() const;

    /**
     * Area-weighted centroid for closed loops. Falls back to the vertex mean
     * when the loop is open or its area is below AREA_EPSILON.
     */
    Point2D centroid() const;

    /**
     * Total length, including the closing edge for closed loops.
     */
    double perimeter() const;

    VertexLoop with_points(std::vector<Point2D> points) const {
        return VertexLoop(std::move(points), closed_);
    }

    bool operator==(const VertexLoop& other) const {
        return closed_ == other.closed_ && points_ == other.points_;
    }
    bool operator!=(const VertexLoop& other) const { return !(*this == other); }
};

/**
 * Outer boundary plus zero or more holes.
 * Hole order matters for matching but holes carry no identity of their own.
 */
struct ContourSet {
    VertexLoop outer;
    std::vector<VertexLoop> holes;

    ContourSet() = default;
    explicit ContourSet(VertexLoop outer_loop, std::vector<VertexLoop> hole_loops = {})
        : outer(std::move(outer_loop)), holes(std::move(hole_loops)) {}

    bool has_holes() const { return !holes.empty(); }

    bool operator==(const ContourSet& other) const {
        return outer == other.outer && holes == other.holes;
    }
    bool operator!=(const ContourSet& other) const { return !(*this == other); }
};

// =============================================================================
// Point utilities
// =============================================================================

double distance(const Point2D& a, const Point2D& b);

double squared_distance(const Point2D& a, const Point2D& b);

// rx = x cos - y sin, ry = x sin + y cos; clockwise on screen (y grows downward)
Point2D rotate_point(const Point2D& p, double degrees, const Point2D& origin = {});

std::vector<Point2D> rotate_points(const std::vector<Point2D>& points, double degrees,
                                   const Point2D& origin = {});

// Cyclic left shift: result[i] = points[(i + offset) % n]
std::vector<Point2D> rotate_list(const std::vector<Point2D>& points, std::size_t offset);

Point2D mean_point(const std::vector<Point2D>& points);

/**
 * Angular position of `p` around `center`, measured from straight up and
 * increasing clockwise in screen coordinates, normalized to [0, 2*pi).
 */
double angle_from_centroid(const Point2D& p, const Point2D& center);

// Shortest arc between two angles in radians, in [0, pi]
double angle_distance(double a, double b);

// =============================================================================
// Loop utilities
// =============================================================================

/**
 * Resample a loop to exactly `count` points spaced evenly by arc length.
 * Closed loops are walked once around including the closing edge; open loops
 * keep both endpoints. A zero-length loop replicates its first point.
 */
VertexLoop resample_loop(const VertexLoop& loop, std::size_t count);

/**
 * Loop with the same point count and closedness whose points all sit at the
 * centroid of `loop`. Used as the zero-size end of a growing or shrinking hole.
 */
VertexLoop collapse_loop(const VertexLoop& loop);

/**
 * Same as collapse_loop but collapses onto an explicit point.
 */
VertexLoop collapse_loop_at(const VertexLoop& loop, const Point2D& point);

VertexLoop reverse_loop(const VertexLoop& loop);

std::size_t hash_loop(const VertexLoop& loop);

std::size_t hash_contours(const ContourSet& contours);

} // namespace keymorph

#endif // KEYMORPH_GEOMETRY_HPP
