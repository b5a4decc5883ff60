#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

struct PathPoint {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const PathPoint& o) const { return x == o.x && y == o.y; }
    bool operator!=(const PathPoint& o) const { return !(*this == o); }
};

enum class PathVerb {
    MoveTo,   // 1 point
    LineTo,   // 1 point
    QuadTo,   // 2 points: control, end
    CubicTo,  // 3 points: control 1, control 2, end
    Close,    // 0 points
};

// Vector path in absolute coordinates. Every sub-path starts with MoveTo;
// drawing after Close (or before any MoveTo) implicitly moves to the
// current point first.
class Path {
public:
    void move_to(PathPoint p);
    void line_to(PathPoint p);
    void quad_to(PathPoint c, PathPoint p);
    void cubic_to(PathPoint c1, PathPoint c2, PathPoint p);

    // Elliptical arc from the current point, as in SVG. Stored as cubics.
    void arc_to(double rx, double ry, double x_axis_rotation_deg,
                bool large_arc, bool sweep, PathPoint p);

    void close();

    bool empty() const { return verb_list.empty(); }
    PathPoint current_point() const { return current; }

    const std::vector<PathVerb>&  verbs()  const { return verb_list; }
    const std::vector<PathPoint>& points() const { return point_list; }

private:
    void ensure_subpath();

    std::vector<PathVerb>  verb_list;
    std::vector<PathPoint> point_list;
    PathPoint current;
    PathPoint subpath_start;
    bool      in_subpath = false;
};

// Malformed SVG path data. offset is the byte position of the problem.
class PathParseError : public std::runtime_error {
public:
    PathParseError(size_t offset, const std::string& message)
        : std::runtime_error(message + " at offset " + std::to_string(offset)),
          pos(offset) {}

    size_t offset() const { return pos; }

private:
    size_t pos;
};

// Parses SVG path data ("M 0 0 L 1 1 C ..."). Supports every command of the
// SVG 1.1 path grammar, absolute and relative. Throws PathParseError.
Path parse_svg_path(const std::string& data);
