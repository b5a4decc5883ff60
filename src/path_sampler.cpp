#include "path_sampler.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {

double distance(PathPoint a, PathPoint b)
{
    return std::hypot(b.x - a.x, b.y - a.y);
}

double second_difference(PathPoint a, PathPoint b, PathPoint c)
{
    return std::hypot(a.x - 2.0 * b.x + c.x, a.y - 2.0 * b.y + c.y);
}

// Wang's formula: segments needed for a degree-d Bezier to stay within tol,
// n = sqrt(d(d-1)/8 * max|second difference| / tol).
int segments_for(double max_second_difference, double degree_factor, double tol)
{
    const double max_segments = 1 << 16;
    const double n = std::ceil(std::sqrt(degree_factor * max_second_difference / tol));
    if (!(n < max_segments))   // also catches NaN and infinity
        return static_cast<int>(max_segments);
    return std::max(1, static_cast<int>(n));
}

void flatten_quad(PathPoint p0, PathPoint p1, PathPoint p2, double tol,
                  std::vector<PathPoint>& out)
{
    const int n = segments_for(second_difference(p0, p1, p2), 0.25, tol);
    for (int i = 1; i <= n; ++i) {
        const double t = static_cast<double>(i) / n, mt = 1.0 - t;
        out.push_back({mt * mt * p0.x + 2.0 * mt * t * p1.x + t * t * p2.x,
                       mt * mt * p0.y + 2.0 * mt * t * p1.y + t * t * p2.y});
    }
    out.back() = p2;
}

void flatten_cubic(PathPoint p0, PathPoint p1, PathPoint p2, PathPoint p3,
                   double tol, std::vector<PathPoint>& out)
{
    const double dd = std::max(second_difference(p0, p1, p2),
                               second_difference(p1, p2, p3));
    const int n = segments_for(dd, 0.75, tol);
    for (int i = 1; i <= n; ++i) {
        const double t = static_cast<double>(i) / n, mt = 1.0 - t;
        const double a = mt * mt * mt, b = 3.0 * mt * mt * t;
        const double c = 3.0 * mt * t * t, d = t * t * t;
        out.push_back({a * p0.x + b * p1.x + c * p2.x + d * p3.x,
                       a * p0.y + b * p1.y + c * p2.y + d * p3.y});
    }
    out.back() = p3;
}

// Calls f(from, to) for every segment, in path order.
template<typename F>
void for_each_segment(const std::vector<Polyline>& lines, F&& f)
{
    for (const auto& line : lines) {
        const auto& pts = line.points;
        for (size_t i = 1; i < pts.size(); ++i)
            f(pts[i - 1], pts[i]);
        if (line.closed && pts.size() > 1)
            f(pts.back(), pts.front());
    }
}

} // namespace

std::vector<Polyline> flatten_path(const Path& path, double tolerance)
{
    if (!(tolerance > 0.0))
        throw std::invalid_argument("path tolerance must be positive");

    std::vector<Polyline> lines;
    const auto& pts = path.points();
    size_t      pi  = 0;

    for (const PathVerb verb : path.verbs()) {
        switch (verb) {
            case PathVerb::MoveTo:
                lines.emplace_back();
                lines.back().points.push_back(pts[pi++]);
                break;
            case PathVerb::LineTo:
                lines.back().points.push_back(pts[pi++]);
                break;
            case PathVerb::QuadTo:
                flatten_quad(lines.back().points.back(), pts[pi], pts[pi + 1],
                             tolerance, lines.back().points);
                pi += 2;
                break;
            case PathVerb::CubicTo:
                flatten_cubic(lines.back().points.back(), pts[pi], pts[pi + 1],
                              pts[pi + 2], tolerance, lines.back().points);
                pi += 3;
                break;
            case PathVerb::Close:
                lines.back().closed = true;
                break;
        }
    }
    return lines;
}

double approximate_length(const Path& path, double tolerance)
{
    double length = 0.0;
    for_each_segment(flatten_path(path, tolerance),
                     [&](PathPoint a, PathPoint b) { length += distance(a, b); });
    return length;
}

std::vector<PathPoint> sample_points(const Path& path, double tolerance,
                                     double interval)
{
    if (!(interval > 0.0))
        throw std::invalid_argument("sample interval must be positive");

    const std::vector<Polyline> lines = flatten_path(path, tolerance);

    double total = 0.0;
    for_each_segment(lines, [&](PathPoint a, PathPoint b) { total += distance(a, b); });

    std::vector<PathPoint> samples;
    if (total <= 0.0) return samples;

    // The end of the path is excluded, with slack for the rounding of
    // interval = length / frames.
    const double limit     = total - interval * 1e-6;
    double       travelled = 0.0;
    size_t       k         = 0;
    double       next      = 0.0;

    for_each_segment(lines, [&](PathPoint a, PathPoint b) {
        const double len = distance(a, b);
        while (next <= travelled + len && next < limit) {
            const double t = len > 0.0 ? (next - travelled) / len : 0.0;
            samples.push_back({a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t});
            ++k;
            next = static_cast<double>(k) * interval;
        }
        travelled += len;
    });

    return samples;
}
