#include "geometry.hpp"

#include <algorithm>
#include <cstdlib>

namespace {

bool rangesOverlap(int a0, int a1, int b0, int b1) {
    return std::max(a0, b0) < std::min(a1, b1);
}

int rangeGap(int a0, int a1, int b0, int b1) {
    if (a1 <= b0) return b0 - a1;
    if (b1 <= a0) return a0 - b1;
    return 0;
}

} // namespace

bool rectsOverlap(const Rect& a, const Rect& b) {
    if (a.empty() || b.empty()) return false;
    return rangesOverlap(a.x, a.x2(), b.x, b.x2()) && rangesOverlap(a.y, a.y2(), b.y, b.y2());
}

bool rectsTouch(const Rect& a, const Rect& b) {
    if (a.empty() || b.empty()) return false;
    const int sx = std::max(a.x, b.x);
    const int ex = std::min(a.x2(), b.x2());
    const int sy = std::max(a.y, b.y);
    const int ey = std::min(a.y2(), b.y2());
    if (sx > ex || sy > ey) return false;
    // Sharing only a corner point leaves no 4-neighbour contact.
    return sx < ex || sy < ey;
}

RectRelation classifyRects(const Rect& a, const Rect& b) {
    const bool ox = rangesOverlap(a.x, a.x2(), b.x, b.x2());
    const bool oy = rangesOverlap(a.y, a.y2(), b.y, b.y2());
    if (ox && oy) return RectRelation::Overlap;
    if (oy) return RectRelation::Horizontal;
    if (ox) return RectRelation::Vertical;
    return RectRelation::Disjoint;
}

int gapX(const Rect& a, const Rect& b) {
    return rangeGap(a.x, a.x2(), b.x, b.x2());
}

int gapY(const Rect& a, const Rect& b) {
    return rangeGap(a.y, a.y2(), b.y, b.y2());
}

int gapDistance(const Rect& a, const Rect& b) {
    return gapX(a, b) + gapY(a, b);
}

int centerDistance(const Rect& a, const Rect& b) {
    return std::abs(a.cx() - b.cx()) + std::abs(a.cy() - b.cy());
}

bool rectInside(const Rect& inner, const Rect& outer) {
    return inner.x >= outer.x && inner.y >= outer.y &&
           inner.x2() <= outer.x2() && inner.y2() <= outer.y2();
}

Rect cropRect(const Rect& r, const Rect& region) {
    const int sx = std::max(r.x, region.x);
    const int sy = std::max(r.y, region.y);
    const int ex = std::min(r.x2(), region.x2());
    const int ey = std::min(r.y2(), region.y2());
    if (sx >= ex || sy >= ey) return Rect{sx, sy, 0, 0};
    return Rect{sx, sy, ex - sx, ey - sy};
}

std::array<Vec2i, 4> cornerTiles(const Rect& r) {
    return {
        Vec2i{r.x, r.y},
        Vec2i{r.x2() - 1, r.y},
        Vec2i{r.x, r.y2() - 1},
        Vec2i{r.x2() - 1, r.y2() - 1},
    };
}
