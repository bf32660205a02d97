#pragma once

#include <algorithm>
#include <string>

namespace drawlink {

using NodeId = std::string;
using EdgeId = std::string;

struct Point {
    double x = 0.0;
    double y = 0.0;

    constexpr Point() = default;
    constexpr Point(double x_, double y_) : x(x_), y(y_) {}

    constexpr bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point& o) const { return !(*this == o); }
};

/// Axis-aligned box: (x, y) is the top-left corner
struct Rect {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    constexpr Rect() = default;
    constexpr Rect(double x_, double y_, double w, double h)
        : x(x_), y(y_), width(w), height(h) {}

    constexpr Point center() const { return {x + width / 2, y + height / 2}; }

    constexpr double left() const { return x; }
    constexpr double top() const { return y; }
    constexpr double right() const { return x + width; }
    constexpr double bottom() const { return y + height; }

    Rect united(const Rect& other) const {
        double minX = std::min(x, other.x);
        double minY = std::min(y, other.y);
        double maxX = std::max(right(), other.right());
        double maxY = std::max(bottom(), other.bottom());

        return {minX, minY, maxX - minX, maxY - minY};
    }

    constexpr bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Rect& o) const { return !(*this == o); }
};

}  // namespace drawlink
