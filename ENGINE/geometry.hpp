// === File: geometry.hpp ===
#pragma once

#include <algorithm>
#include <limits>

// Plain 2D value types shared by the contour, occluder and visibility code.
// A Segment is either in the normalized sprite frame (0..1) or in world cells;
// the type does not say which, the producing function does.

struct Point {
    double x = 0.0;
    double y = 0.0;
};

inline bool operator==(const Point& a, const Point& b) {
    return a.x == b.x && a.y == b.y;
}

struct Segment {
    double x1 = 0.0;
    double y1 = 0.0;
    double x2 = 0.0;
    double y2 = 0.0;
};

inline bool operator==(const Segment& a, const Segment& b) {
    return a.x1 == b.x1 && a.y1 == b.y1 && a.x2 == b.x2 && a.y2 == b.y2;
}

struct Bounds {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;
};

// Running bounding box; reports all zeros until the first point is added.
class BoundsAccumulator {
public:
    void add(double x, double y) {
        min_x_ = std::min(min_x_, x);
        min_y_ = std::min(min_y_, y);
        max_x_ = std::max(max_x_, x);
        max_y_ = std::max(max_y_, y);
    }

    void add(const Segment& s) {
        add(s.x1, s.y1);
        add(s.x2, s.y2);
    }

    bool empty() const { return min_x_ > max_x_; }

    Bounds bounds() const {
        if (empty()) return Bounds{};
        return Bounds{ min_x_, min_y_, max_x_, max_y_ };
    }

private:
    double min_x_ = std::numeric_limits<double>::infinity();
    double min_y_ = std::numeric_limits<double>::infinity();
    double max_x_ = -std::numeric_limits<double>::infinity();
    double max_y_ = -std::numeric_limits<double>::infinity();
};
