#pragma once
#include <cstdint>
#include <cstdlib>

struct Vec2i {
    int x = 0;
    int y = 0;
};

inline bool operator==(const Vec2i& a, const Vec2i& b) {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Vec2i& a, const Vec2i& b) {
    return !(a == b);
}

inline int sign(int v) {
    return (v > 0) - (v < 0);
}

inline int clampi(int v, int lo, int hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

inline int manhattan(const Vec2i& a, const Vec2i& b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

// Squared Euclidean distance; exact in integers, so safe to sort on.
inline int distSq(const Vec2i& a, const Vec2i& b) {
    const int dx = a.x - b.x;
    const int dy = a.y - b.y;
    return dx * dx + dy * dy;
}

// The eight push/neighbour directions: N, S, E, W, then the diagonals.
inline const Vec2i* eightDirections() {
    static const Vec2i dirs[8] = {
        { 0, -1}, { 0,  1}, { 1,  0}, {-1,  0},
        { 1, -1}, {-1, -1}, { 1,  1}, {-1,  1},
    };
    return dirs;
}
