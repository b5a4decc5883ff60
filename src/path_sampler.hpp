#pragma once

#include "path.hpp"

#include <vector>

// One flattened sub-path. A closed polyline implies a final segment from the
// last point back to the first.
struct Polyline {
    std::vector<PathPoint> points;
    bool                   closed = false;
};

// Curves are replaced by line segments deviating at most `tolerance` from
// the true curve. Throws std::invalid_argument if tolerance <= 0.
std::vector<Polyline> flatten_path(const Path& path, double tolerance);

// Total length of the flattened path, closing segments included.
double approximate_length(const Path& path, double tolerance);

// Points at arc lengths 0, interval, 2*interval, ... strictly before the end
// of the path (the terminal point is never emitted). Moves between
// sub-paths add no length. Throws std::invalid_argument if interval <= 0.
std::vector<PathPoint> sample_points(const Path& path, double tolerance,
                                     double interval);
