#pragma once

#include "common.hpp"

#include <array>
#include <cstdint>

// Axis-aligned tile rectangle. Covers tiles [x, x+w) x [y, y+h).
struct Rect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    int x2() const { return x + w; }
    int y2() const { return y + h; }
    int cx() const { return x + w / 2; }
    int cy() const { return y + h / 2; }
    int area() const { return w * h; }
    bool empty() const { return w <= 0 || h <= 0; }

    bool contains(int px, int py) const {
        return px >= x && px < x2() && py >= y && py < y2();
    }
};

inline bool operator==(const Rect& a, const Rect& b) {
    return a.x == b.x && a.y == b.y && a.w == b.w && a.h == b.h;
}

inline bool operator!=(const Rect& a, const Rect& b) {
    return !(a == b);
}

// How two rectangles relate along each axis.
//  - Overlap:    they share tiles.
//  - Horizontal: y-ranges overlap, x-ranges do not (side by side).
//  - Vertical:   x-ranges overlap, y-ranges do not (stacked).
//  - Disjoint:   neither range overlaps (diagonal to each other).
enum class RectRelation : uint8_t {
    Overlap = 0,
    Horizontal,
    Vertical,
    Disjoint,
};

inline const char* rectRelationName(RectRelation r) {
    switch (r) {
        case RectRelation::Overlap:    return "Overlap";
        case RectRelation::Horizontal: return "Horizontal";
        case RectRelation::Vertical:   return "Vertical";
        case RectRelation::Disjoint:   return "Disjoint";
    }
    return "Unknown";
}

bool rectsOverlap(const Rect& a, const Rect& b);

// True if the rectangles overlap or share an edge (corner contact does not count).
bool rectsTouch(const Rect& a, const Rect& b);

RectRelation classifyRects(const Rect& a, const Rect& b);

// Empty tiles strictly between the two rectangles along x and along y.
// Zero on an axis where the ranges overlap or abut.
int gapX(const Rect& a, const Rect& b);
int gapY(const Rect& a, const Rect& b);

// Nearest-corner distance: gapX + gapY. For a diagonal pair this is the
// Manhattan length of the shortest L between their facing corners.
int gapDistance(const Rect& a, const Rect& b);

// Manhattan distance between the rectangles' center tiles.
int centerDistance(const Rect& a, const Rect& b);

// True if `inner` lies entirely inside `outer`.
bool rectInside(const Rect& inner, const Rect& outer);

// Intersection of `r` with `region`. Returns an empty rect if they do not meet.
Rect cropRect(const Rect& r, const Rect& region);

// Corner tiles in order: top-left, top-right, bottom-left, bottom-right.
std::array<Vec2i, 4> cornerTiles(const Rect& r);
