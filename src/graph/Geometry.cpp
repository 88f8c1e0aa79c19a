#include "graph/Geometry.hpp"
#include <algorithm>
#include <limits>

namespace flowgraph {

bool contains(const Rect& outer, const Rect& inner) {
    return inner.x >= outer.x && inner.y >= outer.y &&
           inner.right() <= outer.right() &&
           inner.bottom() <= outer.bottom();
}

bool contains(const Rect& outer, const Point& point) {
    return point.x >= outer.x && point.y >= outer.y &&
           point.x <= outer.right() && point.y <= outer.bottom();
}

bool intersects(const Rect& a, const Rect& b) {
    return a.x < b.right() && a.right() > b.x &&
           a.y < b.bottom() && a.bottom() > b.y;
}

Rect inflate(const Rect& rect, double amount) {
    return Rect{
        rect.x - amount,
        rect.y - amount,
        std::max(0.0, rect.width + 2 * amount),
        std::max(0.0, rect.height + 2 * amount)
    };
}

Rect expandToInclude(const Rect& bounds, const Rect& inner, double padding) {
    double minX = std::min(bounds.x, inner.x - padding);
    double minY = std::min(bounds.y, inner.y - padding);
    double maxX = std::max(bounds.right(), inner.right() + padding);
    double maxY = std::max(bounds.bottom(), inner.bottom() + padding);

    return Rect{minX, minY, std::max(0.0, maxX - minX), std::max(0.0, maxY - minY)};
}

Rect boundingRect(const std::vector<Rect>& rects, double padding) {
    if (rects.empty()) {
        return Rect{};
    }

    double minX = std::numeric_limits<double>::infinity();
    double minY = std::numeric_limits<double>::infinity();
    double maxX = -std::numeric_limits<double>::infinity();
    double maxY = -std::numeric_limits<double>::infinity();

    for (const auto& r : rects) {
        minX = std::min(minX, r.x);
        minY = std::min(minY, r.y);
        maxX = std::max(maxX, r.right());
        maxY = std::max(maxY, r.bottom());
    }

    minX -= padding;
    minY -= padding;
    maxX += padding;
    maxY += padding;

    return Rect{minX, minY, std::max(0.0, maxX - minX), std::max(0.0, maxY - minY)};
}

Point clampInside(const Rect& outer, const Rect& inner) {
    // An inner rect wider than outer sticks to the left/top edge
    double x = std::max(outer.x, std::min(inner.x, outer.right() - inner.width));
    double y = std::max(outer.y, std::min(inner.y, outer.bottom() - inner.height));
    return Point{x, y};
}

Rect translate(const Rect& rect, double dx, double dy) {
    return Rect{rect.x + dx, rect.y + dy, rect.width, rect.height};
}

} // namespace flowgraph
