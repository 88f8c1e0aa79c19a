#include <catch2/catch.hpp>
#include "graph/Geometry.hpp"

using namespace flowgraph;

TEST_CASE("Rect containment includes edges", "[Geometry]") {
    Rect outer{0, 0, 100, 100};
    REQUIRE(contains(outer, Rect{0, 0, 100, 100}));
    REQUIRE(contains(outer, Rect{10, 10, 20, 20}));
    REQUIRE_FALSE(contains(outer, Rect{90, 90, 20, 20}));
    REQUIRE(contains(outer, Point{100, 0}));
    REQUIRE_FALSE(contains(outer, Point{-1, 50}));
}

TEST_CASE("Rect intersection needs overlapping area", "[Geometry]") {
    Rect a{0, 0, 10, 10};
    REQUIRE(intersects(a, Rect{5, 5, 10, 10}));
    REQUIRE_FALSE(intersects(a, Rect{10, 0, 10, 10}));
    REQUIRE_FALSE(intersects(a, Rect{20, 20, 5, 5}));
}

TEST_CASE("Inflate and translate", "[Geometry]") {
    REQUIRE(inflate(Rect{10, 10, 20, 20}, 5) == Rect{5, 5, 30, 30});
    REQUIRE(inflate(Rect{10, 10, 4, 4}, -5) == Rect{15, 15, 0, 0});
    REQUIRE(translate(Rect{1, 2, 3, 4}, 10, 20) == Rect{11, 22, 3, 4});
}

TEST_CASE("expandToInclude never shrinks", "[Geometry]") {
    Rect bounds{0, 0, 100, 100};
    REQUIRE(expandToInclude(bounds, Rect{10, 10, 10, 10}, 8) == bounds);
    REQUIRE(expandToInclude(bounds, Rect{150, 20, 20, 20}, 10) == Rect{0, 0, 180, 100});
    REQUIRE(expandToInclude(bounds, Rect{-30, -30, 10, 10}, 0) == Rect{-30, -30, 130, 130});
}

TEST_CASE("boundingRect of several rects", "[Geometry]") {
    REQUIRE(boundingRect({}, 10) == Rect{});
    Rect r = boundingRect({Rect{0, 0, 10, 10}, Rect{20, 30, 10, 10}}, 5);
    REQUIRE(r == Rect{-5, -5, 40, 50});
}

TEST_CASE("clampInside keeps the inner rect within bounds", "[Geometry]") {
    Rect outer{0, 0, 100, 100};
    REQUIRE(clampInside(outer, Rect{150, 150, 20, 20}) == Point{80, 80});
    REQUIRE(clampInside(outer, Rect{-10, 40, 20, 20}) == Point{0, 40});
    REQUIRE(clampInside(outer, Rect{30, 30, 20, 20}) == Point{30, 30});
    // Wider than the outer rect: stick to the left edge
    REQUIRE(clampInside(outer, Rect{50, 0, 200, 10}).x == 0);
}
