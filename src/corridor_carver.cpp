#include "corridor_carver.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <utility>

namespace {

void appendH(std::vector<Vec2i>& out, int x1, int x2, int y) {
    const int step = (x2 >= x1) ? 1 : -1;
    for (int x = x1; x != x2 + step; x += step) out.push_back({x, y});
}

void appendV(std::vector<Vec2i>& out, int y1, int y2, int x) {
    const int step = (y2 >= y1) ? 1 : -1;
    for (int y = y1; y != y2 + step; y += step) out.push_back({x, y});
}

// Shared tile range [lo, hi] of the two rooms along the corridor's cross axis.
std::pair<int, int> sharedRange(const Rect& a, const Rect& b, Alignment alignment) {
    if (alignment == Alignment::Horizontal) {
        return {std::max(a.y, b.y), std::min(a.y2(), b.y2()) - 1};
    }
    return {std::max(a.x, b.x), std::min(a.x2(), b.x2()) - 1};
}

void planStraight(const Rect& a, const Rect& b, Alignment alignment, RandomSource& rng,
                  int maxAlternatives, std::vector<CorridorPath>& out) {
    const auto [lo, hi] = sharedRange(a, b, alignment);
    if (hi < lo) return;

    const int mid = lo + (hi - lo) / 2;
    const int half = (hi - lo) / 2;
    const int first = clampi(mid + rng.range(-half, half), lo, hi);
    out.push_back(straightCorridor(a, b, alignment, first));

    // Alternatives fan out from the first pick: first-1, first+1, first-2, ...
    int added = 0;
    for (int off = 1; added < maxAlternatives && (first - off >= lo || first + off <= hi); ++off) {
        if (first - off >= lo && added < maxAlternatives) {
            out.push_back(straightCorridor(a, b, alignment, first - off));
            ++added;
        }
        if (first + off <= hi && added < maxAlternatives) {
            out.push_back(straightCorridor(a, b, alignment, first + off));
            ++added;
        }
    }
}

struct CornerPair {
    Vec2i from;
    Vec2i to;
    int d2 = 0;
    int order = 0;
};

void planDiagonal(const Rect& a, const Rect& b, RandomSource& rng,
                  int maxAlternatives, std::vector<CorridorPath>& out) {
    const std::array<Vec2i, 4> ca = cornerTiles(a);
    const std::array<Vec2i, 4> cb = cornerTiles(b);

    std::vector<CornerPair> pairs;
    pairs.reserve(16);
    for (int i = 0; i < 4; ++i) {
        for (int j = 0; j < 4; ++j) {
            pairs.push_back({ca[static_cast<size_t>(i)], cb[static_cast<size_t>(j)],
                             distSq(ca[static_cast<size_t>(i)], cb[static_cast<size_t>(j)]), i * 4 + j});
        }
    }
    std::sort(pairs.begin(), pairs.end(), [](const CornerPair& p, const CornerPair& q) {
        if (p.d2 != q.d2) return p.d2 < q.d2;
        return p.order < q.order;
    });

    const bool horizontalFirst = rng.coinFlip();
    const int limit = 1 + maxAlternatives;
    for (const CornerPair& p : pairs) {
        if (static_cast<int>(out.size()) >= limit) break;
        out.push_back(lCorridor(p.from, p.to, horizontalFirst));
        if (static_cast<int>(out.size()) >= limit) break;
        out.push_back(lCorridor(p.from, p.to, !horizontalFirst));
    }
}

} // namespace

CorridorPath straightCorridor(const Rect& a, const Rect& b, Alignment alignment, int at) {
    CorridorPath path;
    if (alignment == Alignment::Horizontal) {
        const Rect& left = (a.x <= b.x) ? a : b;
        const Rect& right = (a.x <= b.x) ? b : a;
        if (left.x2() < right.x) appendH(path.tiles, left.x2(), right.x - 1, at);
    } else if (alignment == Alignment::Vertical) {
        const Rect& top = (a.y <= b.y) ? a : b;
        const Rect& bottom = (a.y <= b.y) ? b : a;
        if (top.y2() < bottom.y) appendV(path.tiles, top.y2(), bottom.y - 1, at);
    }
    return path;
}

CorridorPath lCorridor(const Vec2i& from, const Vec2i& to, bool horizontalFirst) {
    CorridorPath path;
    path.lShaped = true;
    if (horizontalFirst) {
        appendH(path.tiles, from.x, to.x, from.y);
        // The bend tile is already in the path.
        if (from.y != to.y) appendV(path.tiles, from.y + sign(to.y - from.y), to.y, to.x);
    } else {
        appendV(path.tiles, from.y, to.y, from.x);
        if (from.x != to.x) appendH(path.tiles, from.x + sign(to.x - from.x), to.x, to.y);
    }
    return path;
}

std::vector<CorridorPath> planCorridors(const Rect& a, const Rect& b, Alignment alignment,
                                        RandomSource& rng, int maxAlternatives) {
    std::vector<CorridorPath> out;
    if (maxAlternatives < 0) maxAlternatives = 0;
    if (isStraight(alignment)) {
        planStraight(a, b, alignment, rng, maxAlternatives, out);
    } else {
        planDiagonal(a, b, rng, maxAlternatives, out);
    }
    return out;
}

bool corridorClipsThirdRoom(const Level& level, const CorridorPath& path, int roomA, int roomB) {
    for (const Vec2i& p : path.tiles) {
        const int id = level.roomIdAt(p.x, p.y);
        if (id >= 0 && id != roomA && id != roomB) return true;
    }
    return false;
}

bool carveCorridor(Level& level,
                   const Room& a,
                   const Room& b,
                   Alignment alignment,
                   RandomSource& rng,
                   const GeneratorConfig& cfg,
                   std::vector<Vec2i>* outTiles,
                   CarveStats* outStats) {
    CarveStats stats;

    // Alternatives are only planned when the policy may use them, so the
    // permissive policy draws the same numbers whatever maxCorridorReroutes is.
    const int alternatives = (cfg.corridorPolicy == CorridorPolicy::Permissive) ? 0 : cfg.maxCorridorReroutes;
    const std::vector<CorridorPath> plans = planCorridors(a.rect, b.rect, alignment, rng, alternatives);

    const CorridorPath* chosen = nullptr;
    if (!plans.empty()) {
        chosen = &plans.front();
        if (cfg.corridorPolicy != CorridorPolicy::Permissive &&
            corridorClipsThirdRoom(level, plans.front(), a.id, b.id)) {
            chosen = nullptr;
            for (size_t i = 1; i < plans.size(); ++i) {
                ++stats.reroutes;
                if (!corridorClipsThirdRoom(level, plans[i], a.id, b.id)) {
                    chosen = &plans[i];
                    break;
                }
            }
            if (!chosen) {
                if (cfg.corridorPolicy == CorridorPolicy::Strict) {
                    if (outStats) *outStats = stats;
                    return false;
                }
                chosen = &plans.front();
            }
        }
    }

    if (chosen) {
        stats.lShaped = chosen->lShaped;
        stats.clipped = corridorClipsThirdRoom(level, *chosen, a.id, b.id);
        for (const Vec2i& p : chosen->tiles) {
            const int owner = level.roomIdAt(p.x, p.y);
            if (owner == a.id || owner == b.id) continue;

            // Third-room floor and tiles an earlier corridor already carved stay as they are.
            if (!level.inBounds(p.x, p.y) || level.at(p.x, p.y) != TileType::Void) continue;
            if (!level.carveCorridorTile(p.x, p.y)) continue;
            ++stats.tilesWritten;
            if (outTiles) outTiles->push_back(p);
        }
    }

    if (outStats) *outStats = stats;
    return true;
}
