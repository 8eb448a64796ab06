// geometry.cpp - Point and loop utilities shared by alignment and hole matching

#include "keymorph/geometry.hpp"

#include <cmath>
#include <algorithm>

namespace keymorph {

// =============================================================================
// VertexLoop
// =============================================================================

double VertexLoop::signed_area() const {
    if (!closed_ || points_.size() < 3) return 0.0;

    double twice_area = 0.0;
    const std::size_t n = points_.size();
    for (std::size_t i = 0; i < n; ++i) {
        const Point2D& a = points_[i];
        const Point2D& b = points_[(i + 1) % n];
        twice_area += a.x * b.y - b.x * a.y;
    }
    return twice_area * 0.5;
}

Point2D VertexLoop::centroid() const {
    if (points_.empty()) return {};

    double area = signed_area();
    if (std::abs(area) < AREA_EPSILON) {
        return mean_point(points_);
    }

    double cx = 0.0;
    double cy = 0.0;
    const std::size_t n = points_.size();
    for (std::size_t i = 0; i < n; ++i) {
        const Point2D& a = points_[i];
        const Point2D& b = points_[(i + 1) % n];
        double cross = a.x * b.y - b.x * a.y;
        cx += (a.x + b.x) * cross;
        cy += (a.y + b.y) * cross;
    }
    double factor = 1.0 / (6.0 * area);
    return {cx * factor, cy * factor};
}

double VertexLoop::perimeter() const {
    if (points_.size() < 2) return 0.0;

    double total = 0.0;
    for (std::size_t i = 0; i + 1 < points_.size(); ++i) {
        total += distance(points_[i], points_[i + 1]);
    }
    if (closed_) {
        total += distance(points_.back(), points_.front());
    }
    return total;
}

// =============================================================================
// Point utilities
// =============================================================================

double distance(const Point2D& a, const Point2D& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

double squared_distance(const Point2D& a, const Point2D& b) {
    double dx = a.x - b.x;
    double dy = a.y - b.y;
    return dx * dx + dy * dy;
}

Point2D rotate_point(const Point2D& p, double degrees, const Point2D& origin) {
    if (degrees == 0.0) return p;

    double rad = degrees_to_radians(degrees);
    double cos_a = std::cos(rad);
    double sin_a = std::sin(rad);
    double x = p.x - origin.x;
    double y = p.y - origin.y;
    return {origin.x + x * cos_a - y * sin_a, origin.y + x * sin_a + y * cos_a};
}

std::vector<Point2D> rotate_points(const std::vector<Point2D>& points, double degrees,
                                   const Point2D& origin) {
    if (degrees == 0.0) return points;

    std::vector<Point2D> result;
    result.reserve(points.size());
    for (const auto& p : points) {
        result.push_back(rotate_point(p, degrees, origin));
    }
    return result;
}

std::vector<Point2D> rotate_list(const std::vector<Point2D>& points, std::size_t offset) {
    if (points.empty()) return points;

    std::vector<Point2D> result(points);
    std::rotate(result.begin(), result.begin() + (offset % points.size()), result.end());
    return result;
}

Point2D mean_point(const std::vector<Point2D>& points) {
    if (points.empty()) return {};

    double sx = 0.0;
    double sy = 0.0;
    for (const auto& p : points) {
        sx += p.x;
        sy += p.y;
    }
    double n = static_cast<double>(points.size());
    return {sx / n, sy / n};
}

double angle_from_centroid(const Point2D& p, const Point2D& center) {
    double dx = p.x - center.x;
    double dy = p.y - center.y;
    double angle = std::atan2(dx, -dy);
    if (angle < 0.0) angle += TWO_PI;
    return angle;
}

double angle_distance(double a, double b) {
    double diff = std::fmod(b - a, TWO_PI);
    if (diff < 0.0) diff += TWO_PI;
    if (diff > PI) diff = TWO_PI - diff;
    return diff;
}

// =============================================================================
// Loop utilities
// =============================================================================

VertexLoop resample_loop(const VertexLoop& loop, std::size_t count) {
    if (count == 0 || loop.empty()) {
        return VertexLoop(std::vector<Point2D>{}, loop.closed());
    }

    const auto& src = loop.points();
    double total = loop.perimeter();
    if (src.size() == 1 || total <= 0.0) {
        return VertexLoop(std::vector<Point2D>(count, src.front()), loop.closed());
    }

    // Cumulative arc length at the start of every edge
    std::vector<Point2D> path(src);
    if (loop.closed()) path.push_back(src.front());
    std::vector<double> cumulative(path.size(), 0.0);
    for (std::size_t i = 1; i < path.size(); ++i) {
        cumulative[i] = cumulative[i - 1] + distance(path[i - 1], path[i]);
    }

    double step;
    if (loop.closed()) {
        step = total / static_cast<double>(count);
    } else {
        step = count > 1 ? total / static_cast<double>(count - 1) : 0.0;
    }

    std::vector<Point2D> result;
    result.reserve(count);
    std::size_t edge = 0;
    for (std::size_t k = 0; k < count; ++k) {
        double target = step * static_cast<double>(k);
        if (!loop.closed() && k + 1 == count) {
            result.push_back(path.back());
            continue;
        }
        while (edge + 2 < path.size() && cumulative[edge + 1] <= target) {
            ++edge;
        }
        double edge_len = cumulative[edge + 1] - cumulative[edge];
        double local = edge_len > 0.0 ? (target - cumulative[edge]) / edge_len : 0.0;
        result.push_back(lerp(path[edge], path[edge + 1], clamp_unit(local)));
    }
    return VertexLoop(std::move(result), loop.closed());
}

VertexLoop collapse_loop(const VertexLoop& loop) {
    return collapse_loop_at(loop, loop.centroid());
}

VertexLoop collapse_loop_at(const VertexLoop& loop, const Point2D& point) {
    return VertexLoop(std::vector<Point2D>(loop.size(), point), loop.closed());
}

VertexLoop reverse_loop(const VertexLoop& loop) {
    std::vector<Point2D> pts(loop.points().rbegin(), loop.points().rend());
    return VertexLoop(std::move(pts), loop.closed());
}

std::size_t hash_loop(const VertexLoop& loop) {
    std::size_t h = std::hash<std::size_t>{}(loop.size());
    hash_mix(h, loop.closed() ? 1u : 0u);
    for (const auto& p : loop.points()) {
        hash_mix(h, std::hash<Point2D>{}(p));
    }
    return h;
}

std::size_t hash_contours(const ContourSet& contours) {
    std::size_t h = hash_loop(contours.outer);
    hash_mix(h, contours.holes.size());
    for (const auto& hole : contours.holes) {
        hash_mix(h, hash_loop(hole));
    }
    return h;
}

} // namespace keymorph
