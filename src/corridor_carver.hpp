#pragma once

#include "gen_config.hpp"
#include "level.hpp"
#include "rng.hpp"
#include "room_connector.hpp"

#include <vector>

// A planned corridor: the ordered tiles from room A's side to room B's side.
// Straight corridors cover only the gap between the facing walls; L corridors
// run corner tile to corner tile (their end points lie inside the rooms).
struct CorridorPath {
    std::vector<Vec2i> tiles;
    bool lShaped = false;
};

// Tiles of the straight corridor at coordinate `at` (a y for Horizontal, an x
// for Vertical) across the gap between `a` and `b`. Empty if they touch.
CorridorPath straightCorridor(const Rect& a, const Rect& b, Alignment alignment, int at);

// L from `from` to `to`. horizontalFirst picks which natural bend is used:
// (to.x, from.y) when true, (from.x, to.y) when false.
CorridorPath lCorridor(const Vec2i& from, const Vec2i& to, bool horizontalFirst);

// Candidate corridors between two rooms, the preferred one first.
//  - Straight: midpoint of the shared range plus a random offset, followed by
//    the other coordinates of the shared range, nearest first.
//  - Diagonal: the closest corner pair with a random bend, then the other bend,
//    then the remaining corner pairs by distance.
// At most 1 + maxAlternatives paths are returned.
std::vector<CorridorPath> planCorridors(const Rect& a, const Rect& b, Alignment alignment,
                                        RandomSource& rng, int maxAlternatives);

// True if any tile of `path` belongs to a room other than roomA/roomB.
bool corridorClipsThirdRoom(const Level& level, const CorridorPath& path, int roomA, int roomB);

struct CarveStats {
    int tilesWritten = 0;  // Void tiles turned into CorridorFloor
    int reroutes = 0;      // alternative paths examined after the first
    bool clipped = false;  // the carved path runs through a third room
    bool lShaped = false;
};

// Plans and carves a corridor between `a` and `b` under cfg.corridorPolicy.
// Returns false (CarvingBlocked) only under CorridorPolicy::Strict when no
// clean path exists; nothing is written in that case.
// `outTiles` receives the tiles actually turned from Void into CorridorFloor.
bool carveCorridor(Level& level,
                   const Room& a,
                   const Room& b,
                   Alignment alignment,
                   RandomSource& rng,
                   const GeneratorConfig& cfg,
                   std::vector<Vec2i>* outTiles = nullptr,
                   CarveStats* outStats = nullptr);
