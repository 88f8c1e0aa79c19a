#pragma once

#include <vector>

namespace flowgraph {

/**
 * Point in canvas coordinates
 */
struct Point {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

/**
 * Axis-aligned rectangle in canvas coordinates
 */
struct Rect {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    double right() const { return x + width; }
    double bottom() const { return y + height; }

    bool operator==(const Rect& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(const Rect& other) const { return !(*this == other); }
};

struct Size {
    double width = 0.0;
    double height = 0.0;
};

// === Pure geometry helpers ===

/**
 * True when inner lies entirely within outer (edges included)
 */
bool contains(const Rect& outer, const Rect& inner);

bool contains(const Rect& outer, const Point& point);

/**
 * True when the two rectangles overlap with a non-empty area
 */
bool intersects(const Rect& a, const Rect& b);

/**
 * Grow a rectangle by `amount` on every side
 */
Rect inflate(const Rect& rect, double amount);

/**
 * Smallest rectangle containing `bounds` and `inner` grown by `padding`.
 * Never smaller than `bounds`.
 */
Rect expandToInclude(const Rect& bounds, const Rect& inner, double padding);

/**
 * Tight bounding box of all rectangles, grown by `padding`.
 * Returns an empty rect at the origin for an empty list.
 */
Rect boundingRect(const std::vector<Rect>& rects, double padding);

/**
 * Top-left position that keeps `inner` inside `outer`, as close as possible
 * to the requested position.
 */
Point clampInside(const Rect& outer, const Rect& inner);

Rect translate(const Rect& rect, double dx, double dy);

} // namespace flowgraph
