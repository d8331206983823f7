#include "corridor_carver.hpp"
#include "disjoint_set.hpp"
#include "gen_config.hpp"
#include "geometry.hpp"
#include "level.hpp"
#include "level_gen.hpp"
#include "rng.hpp"
#include "room_connector.hpp"
#include "room_placer.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

bool noOverlaps(const std::vector<Room>& rooms) {
    for (size_t i = 0; i < rooms.size(); ++i) {
        for (size_t j = i + 1; j < rooms.size(); ++j) {
            if (rectsOverlap(rooms[i].rect, rooms[j].rect)) return false;
        }
    }
    return true;
}

void test_rng_reproducible() {
    RandomSource rng(123u);
    const std::vector<uint32_t> expected = {
        31682556u,
        4018661298u,
        2101636938u,
        3842487452u,
        1628673942u,
    };

    for (size_t i = 0; i < expected.size(); ++i) {
        const uint32_t v = rng.nextU32();
        expect(v == expected[i], "RandomSource sequence mismatch at index " + std::to_string(i));
    }

    for (int i = 0; i < 1000; ++i) {
        int r = rng.range(-3, 7);
        expect(r >= -3 && r <= 7, "RandomSource range() out of bounds");
    }
    expect(rng.range(5, 5) == 5, "range() with a single value");
    expect(rng.range(9, 2) == 9, "range() with an inverted range returns lo");

    for (int i = 0; i < 1000; ++i) {
        const float f = rng.next01();
        expect(f >= 0.0f && f < 1.0f, "next01() out of [0,1)");
        expect(rng.index(8) < 8u, "index() out of bounds");
    }

    // Seed 0 would lock xorshift at zero forever.
    RandomSource zero(0u);
    expect(zero.nextU32() != 0u, "zero seed must be remapped");
}

void test_rng_substreams() {
    RandomSource a = RandomSource::substream(7u, tag32("LEVEL_ATTEMPT"), 0u);
    RandomSource b = RandomSource::substream(7u, tag32("LEVEL_ATTEMPT"), 0u);
    RandomSource c = RandomSource::substream(7u, tag32("LEVEL_ATTEMPT"), 1u);

    expect(a.state() == b.state(), "same substream salts give the same stream");
    expect(a.state() != c.state(), "different attempt index gives a different stream");

    bool allEqual = true;
    for (int i = 0; i < 16; ++i) {
        if (a.nextU32() != b.nextU32()) allEqual = false;
    }
    expect(allEqual, "identical substreams stay in lockstep");

    expect(tag32("A") != tag32("B"), "tag32 distinguishes tags");
    expect(tag32("LEVEL_ATTEMPT") == fnv1a32("LEVEL_ATTEMPT", 13), "tag32 drops the terminator");
}

void test_geometry_relations() {
    const Rect a{0, 0, 4, 4};
    const Rect side{4, 0, 4, 4};
    const Rect far{10, 10, 3, 3};
    const Rect below{1, 8, 2, 2};
    const Rect corner{4, 4, 2, 2};

    expect(!rectsOverlap(a, side), "edge-adjacent rects do not overlap");
    expect(rectsTouch(a, side), "edge-adjacent rects touch");
    expect(!rectsTouch(a, corner), "corner contact is not touching");
    expect(rectsOverlap(a, Rect{3, 3, 2, 2}), "shared tile overlaps");

    expect(classifyRects(a, side) == RectRelation::Horizontal, "side by side is Horizontal");
    expect(classifyRects(a, below) == RectRelation::Vertical, "stacked is Vertical");
    expect(classifyRects(a, far) == RectRelation::Disjoint, "diagonal is Disjoint");
    expect(classifyRects(a, Rect{2, 2, 4, 4}) == RectRelation::Overlap, "overlap is Overlap");

    expect(gapX(a, side) == 0, "abutting gapX is zero");
    expect(gapX(a, far) == 6 && gapY(a, far) == 6, "diagonal gaps");
    expect(gapX(far, a) == 6, "gapX is symmetric");
    expect(gapY(a, below) == 4, "vertical gap");
    expect(gapDistance(a, far) == 12, "gap distance is gapX + gapY");
    expect(centerDistance(a, far) == 18, "center distance is Manhattan between centers");
}

void test_geometry_crop_and_corners() {
    const Rect region{0, 0, 10, 10};

    expect(cropRect(Rect{-2, -3, 5, 5}, region) == Rect{0, 0, 3, 2}, "crop at the top-left edge");
    expect(cropRect(Rect{8, 8, 5, 5}, region) == Rect{8, 8, 2, 2}, "crop at the bottom-right edge");
    expect(cropRect(Rect{20, 20, 2, 2}, region).empty(), "crop outside the region is empty");
    expect(cropRect(Rect{2, 2, 3, 3}, region) == Rect{2, 2, 3, 3}, "crop of an inside rect is identity");

    expect(rectInside(Rect{0, 0, 10, 10}, region), "region is inside itself");
    expect(!rectInside(Rect{9, 0, 2, 1}, region), "rect sticking out is not inside");

    const std::array<Vec2i, 4> c = cornerTiles(Rect{0, 0, 4, 4});
    expect(c[0] == Vec2i{0, 0}, "top-left corner");
    expect(c[1] == Vec2i{3, 0}, "top-right corner");
    expect(c[2] == Vec2i{0, 3}, "bottom-left corner");
    expect(c[3] == Vec2i{3, 3}, "bottom-right corner");
}

void test_disjoint_set() {
    DisjointSet ds(5);
    expect(ds.componentCount() == 5, "fresh set has one component per element");
    expect(!ds.fullyConnected(), "fresh set of 5 is not connected");

    expect(ds.unite(0, 1), "first union merges");
    expect(!ds.unite(1, 0), "repeated union reports no merge");
    expect(ds.componentCount() == 4, "component count after one merge");

    expect(ds.unite(2, 3), "second union merges");
    expect(ds.unite(1, 3), "joining two pairs merges");
    expect(ds.componentCount() == 2, "component count after three merges");
    expect(ds.same(0, 2), "transitive membership");
    expect(!ds.same(4, 0), "untouched element is separate");
    expect(ds.setSize(3) == 4, "merged set size");

    expect(ds.unite(4, 0), "last union merges");
    expect(ds.fullyConnected(), "everything connected");
    expect(ds.componentCount() == 1, "single component");

    ds.reset(3);
    expect(ds.size() == 3 && ds.componentCount() == 3, "reset restores singletons");

    DisjointSet empty;
    expect(empty.fullyConnected(), "empty set counts as connected");
}

void test_room_placer_invariants() {
    const Rect region{0, 0, 20, 20};
    GeneratorConfig cfg;
    cfg.minRoomSize = 5;
    cfg.maxRoomSize = 5;

    RandomSource rng(99u);
    const std::vector<Room> none;
    int placed = 0;
    for (int i = 0; i < 200; ++i) {
        Room r;
        PlacementStats st;
        if (placeRoom(region, none, rng, cfg, 7, r, &st)) {
            ++placed;
            expect(r.id == 7, "placed room takes nextId");
            expect(rectInside(r.rect, region), "placed room inside the region");
            expect(r.rect.w == 5 && r.rect.h == 5, "uncropped size kept");
            expect(st.failure == PlacementFailure::None, "success reports no failure");
        } else {
            expect(st.failure == PlacementFailure::Undersized, "empty region can only fail by cropping");
        }
    }
    expect(placed > 0, "some rooms fit in an empty region");

    // Pack rooms into one level; commits must never be refused for overlap.
    cfg.minRoomSize = 3;
    cfg.maxRoomSize = 6;
    Level level(40, 30);
    int nextId = 0;
    for (int i = 0; i < 300; ++i) {
        Room r;
        if (!placeRoom(level.region(), level.rooms(), rng, cfg, nextId, r)) continue;
        expect(r.rect.w >= cfg.minRoomSize && r.rect.h >= cfg.minRoomSize, "room meets the minimum size");
        expect(r.rect.w <= cfg.maxRoomSize && r.rect.h <= cfg.maxRoomSize, "room meets the maximum size");
        expect(level.commitRoom(r), "placed room commits");
        ++nextId;
    }
    expect(nextId > 5, "packing placed several rooms");
    expect(noOverlaps(level.rooms()), "packed rooms never overlap");
}

void test_room_placer_failures() {
    GeneratorConfig cfg;
    cfg.minRoomSize = 20;
    cfg.maxRoomSize = 20;

    RandomSource rng(5u);
    const std::vector<Room> none;
    for (int i = 0; i < 50; ++i) {
        Room r;
        PlacementStats st;
        expect(!placeRoom(Rect{0, 0, 10, 10}, none, rng, cfg, 0, r, &st), "oversized room cannot fit");
        expect(st.failure == PlacementFailure::Undersized, "oversized room fails as Undersized");
    }

    // A room covering the whole region leaves no space at all.
    cfg.minRoomSize = 4;
    cfg.maxRoomSize = 6;
    cfg.maxPushSteps = 5;
    const std::vector<Room> full = {Room{0, Rect{0, 0, 20, 20}}};
    for (int i = 0; i < 50; ++i) {
        Room r;
        PlacementStats st;
        expect(!placeRoom(Rect{0, 0, 20, 20}, full, rng, cfg, 1, r, &st), "full region rejects rooms");
        expect(st.failure == PlacementFailure::PushBudgetExhausted ||
                   st.failure == PlacementFailure::LeftRegion,
               "full region fails by pushing");
        expect(st.pushSteps <= cfg.maxPushSteps, "push budget respected");
    }
}

void test_connector_three_rooms() {
    const std::vector<Room> rooms = {
        Room{0, Rect{0, 0, 4, 4}},
        Room{1, Rect{10, 0, 4, 4}},
        Room{2, Rect{20, 20, 4, 4}},
    };
    GeneratorConfig cfg;

    DisjointSet sets;
    std::vector<RoomEdge> plan;
    ConnectStats st;
    expect(connectRooms(rooms, sets, cfg, plan, &st), "three rooms connect");
    expect(plan.size() == 2, "spanning tree has two corridors");
    expect(st.componentsLeft == 1, "one component left");

    if (plan.size() == 2) {
        expect(plan[0].roomA == 0 && plan[0].roomB == 1, "A-B is carved first");
        expect(plan[0].alignment == Alignment::Horizontal, "A-B is Horizontal");
        expect(plan[0].distance == 6, "A-B distance");
        expect(plan[1].roomA == 1 && plan[1].roomB == 2, "B-C is carved second");
        expect(plan[1].alignment == Alignment::Diagonal, "B-C is Diagonal");
        expect(plan[1].distance == 22, "B-C distance");
        expect(!plan[0].loop && !plan[1].loop, "tree edges are not loops");
    }

    // Nearest-neighbour attachment gives the same tree here.
    cfg.connector = ConnectorStyle::NearestNeighbor;
    DisjointSet sets2;
    std::vector<RoomEdge> nn;
    expect(connectRooms(rooms, sets2, cfg, nn), "nearest-neighbour connects");
    expect(nn.size() == 2, "nearest-neighbour emits two corridors");
    if (nn.size() == 2) {
        expect(nn[0].roomA == 0 && nn[0].roomB == 1, "room 1 attaches to room 0");
        expect(nn[1].roomA == 1 && nn[1].roomB == 2, "room 2 attaches to room 1");
    }
}

void test_connector_edges_and_loops() {
    const std::vector<Room> row = {
        Room{0, Rect{0, 0, 2, 2}},
        Room{1, Rect{5, 0, 2, 2}},
        Room{2, Rect{10, 0, 2, 2}},
    };
    const std::vector<RoomEdge> edges = buildRoomEdges(row, DistanceMetric::NearestCorner);
    expect(edges.size() == 3, "all pairs enumerated");
    if (edges.size() == 3) {
        expect(edges[0].roomA == 0 && edges[0].roomB == 1 && edges[0].distance == 3, "tie broken by room id (0-1)");
        expect(edges[1].roomA == 1 && edges[1].roomB == 2 && edges[1].distance == 3, "tie broken by room id (1-2)");
        expect(edges[2].roomA == 0 && edges[2].roomB == 2 && edges[2].distance == 8, "longest edge last");
    }
    expect(roomDistance(row[0].rect, row[2].rect, DistanceMetric::Center) == 10, "center metric");

    const std::vector<Room> rooms = {
        Room{0, Rect{0, 0, 4, 4}},
        Room{1, Rect{10, 0, 4, 4}},
        Room{2, Rect{20, 20, 4, 4}},
    };
    GeneratorConfig cfg;
    cfg.extraConnections = 1;
    cfg.minConnectionDistance = 3;

    DisjointSet sets;
    std::vector<RoomEdge> plan;
    ConnectStats st;
    expect(connectRooms(rooms, sets, cfg, plan, &st), "connect with loops");
    expect(plan.size() == 3, "one loop corridor added");
    expect(st.loops == 1, "loop counted");
    if (plan.size() == 3) {
        expect(plan[2].loop, "extra edge is marked as a loop");
        expect(plan[2].roomA == 0 && plan[2].roomB == 2, "loop joins the remaining pair");
    }

    cfg.minConnectionDistance = 40;
    DisjointSet sets2;
    std::vector<RoomEdge> capped;
    expect(connectRooms(rooms, sets2, cfg, capped), "connect with a high loop threshold");
    expect(capped.size() == 2, "no loop longer than the threshold");

    // Rooms already joined are not linked again.
    cfg.extraConnections = 0;
    DisjointSet pre(rooms.size());
    pre.unite(0, 1);
    std::vector<RoomEdge> rest;
    expect(connectRooms(rooms, pre, cfg, rest), "connect with pre-joined rooms");
    expect(rest.size() == 1 && rest[0].roomA == 1 && rest[0].roomB == 2, "only the missing link is emitted");

    DisjointSet none;
    std::vector<RoomEdge> nothing;
    expect(connectRooms(std::vector<Room>{}, none, cfg, nothing), "no rooms is trivially connected");
    expect(nothing.empty(), "no rooms, no corridors");
}

void test_corridor_shapes() {
    const CorridorPath h = straightCorridor(Rect{0, 0, 4, 4}, Rect{10, 0, 4, 4}, Alignment::Horizontal, 2);
    expect(h.tiles.size() == 6, "horizontal corridor spans the gap");
    if (h.tiles.size() == 6) {
        expect(h.tiles.front() == Vec2i{4, 2} && h.tiles.back() == Vec2i{9, 2}, "horizontal corridor end points");
    }
    expect(!h.lShaped, "straight corridor is not an L");

    // Argument order must not matter.
    const CorridorPath h2 = straightCorridor(Rect{10, 0, 4, 4}, Rect{0, 0, 4, 4}, Alignment::Horizontal, 2);
    expect(h2.tiles.size() == 6, "horizontal corridor with swapped rooms");

    const CorridorPath v = straightCorridor(Rect{0, 0, 4, 4}, Rect{1, 8, 2, 2}, Alignment::Vertical, 1);
    expect(v.tiles.size() == 4, "vertical corridor spans the gap");
    if (v.tiles.size() == 4) {
        expect(v.tiles.front() == Vec2i{1, 4} && v.tiles.back() == Vec2i{1, 7}, "vertical corridor end points");
    }

    expect(straightCorridor(Rect{0, 0, 4, 4}, Rect{4, 0, 4, 4}, Alignment::Horizontal, 1).tiles.empty(),
           "touching rooms need no corridor");

    const CorridorPath l = lCorridor(Vec2i{3, 3}, Vec2i{20, 20}, true);
    expect(l.lShaped, "L corridor flagged");
    expect(l.tiles.size() == 35, "L corridor includes the bend once");
    if (!l.tiles.empty()) {
        expect(l.tiles.front() == Vec2i{3, 3} && l.tiles.back() == Vec2i{20, 20}, "L corridor end points");
    }
    bool contiguous = true;
    for (size_t i = 1; i < l.tiles.size(); ++i) {
        if (manhattan(l.tiles[i - 1], l.tiles[i]) != 1) contiguous = false;
    }
    expect(contiguous, "L corridor is 4-connected");

    const CorridorPath lv = lCorridor(Vec2i{3, 3}, Vec2i{20, 20}, false);
    expect(lv.tiles.size() == 35, "vertical-first L has the same length");
    if (lv.tiles.size() > 1) expect(lv.tiles[1] == Vec2i{3, 4}, "vertical-first L starts downward");

    RandomSource r1(11u), r2(11u);
    const auto p1 = planCorridors(Rect{0, 0, 4, 4}, Rect{20, 20, 4, 4}, Alignment::Diagonal, r1, 3);
    const auto p2 = planCorridors(Rect{0, 0, 4, 4}, Rect{20, 20, 4, 4}, Alignment::Diagonal, r2, 3);
    expect(p1.size() == 4, "plan honours the alternative limit");
    bool same = p1.size() == p2.size();
    for (size_t i = 0; same && i < p1.size(); ++i) {
        same = (p1[i].tiles.size() == p2[i].tiles.size()) &&
               (p1[i].tiles.empty() || p1[i].tiles.front() == p2[i].tiles.front());
    }
    expect(same, "corridor plans are deterministic");
    if (!p1.empty()) {
        expect(p1[0].tiles.front() == Vec2i{3, 3} && p1[0].tiles.back() == Vec2i{20, 20},
               "diagonal plan starts from the closest corners");
    }
}

void test_carve_into_level() {
    const Room a{0, Rect{0, 0, 4, 4}};
    const Room b{1, Rect{10, 0, 4, 4}};
    const Room c{2, Rect{20, 20, 4, 4}};
    GeneratorConfig cfg;
    RandomSource rng(3u);

    Level level(30, 30);
    expect(level.commitRoom(a) && level.commitRoom(b) && level.commitRoom(c), "rooms commit");
    expect(!level.isFullyConnected(), "rooms start unconnected");

    CarveStats hs;
    std::vector<Vec2i> tiles;
    expect(carveCorridor(level, a, b, Alignment::Horizontal, rng, cfg, &tiles, &hs), "horizontal carve");
    expect(hs.tilesWritten == 6, "horizontal corridor writes the gap");
    expect(tiles.size() == 6, "carved tiles reported");
    expect(!hs.clipped && !hs.lShaped, "horizontal carve is clean and straight");

    CarveStats ds;
    expect(carveCorridor(level, b, c, Alignment::Diagonal, rng, cfg, nullptr, &ds), "diagonal carve");
    expect(ds.lShaped, "diagonal carve is an L");
    expect(ds.tilesWritten == 23, "L between facing corners");
    expect(level.isFullyConnected(), "corridors join all rooms");
    expect(level.countTiles(TileType::CorridorFloor) == 29, "corridor tile count");
    expect(level.countTiles(TileType::Floor) == 48, "room tiles untouched");
}

// Room 2 sits across every row shared by rooms 0 and 1.
Level blockedLevel(const Rect& blocker) {
    Level level(20, 10);
    level.commitRoom(Room{0, Rect{0, 0, 4, 4}});
    level.commitRoom(Room{1, Rect{12, 0, 4, 4}});
    level.commitRoom(Room{2, blocker});
    return level;
}

void test_corridor_policies() {
    const Room a{0, Rect{0, 0, 4, 4}};
    const Room b{1, Rect{12, 0, 4, 4}};
    const Rect fullBlock{6, 0, 3, 4};

    GeneratorConfig cfg;
    {
        cfg.corridorPolicy = CorridorPolicy::Permissive;
        Level level = blockedLevel(fullBlock);
        RandomSource rng(1u);
        CarveStats st;
        std::vector<Vec2i> written;
        expect(carveCorridor(level, a, b, Alignment::Horizontal, rng, cfg, &written, &st), "permissive carves");
        expect(st.clipped, "permissive corridor clips the blocker");
        expect(st.reroutes == 0, "permissive never reroutes");
        expect(st.tilesWritten == 5, "clipped room tiles stay Floor");
        expect(written.size() == 5, "only written tiles are reported");
        bool allCorridor = true;
        for (const Vec2i& p : written) {
            if (level.at(p.x, p.y) != TileType::CorridorFloor || level.roomIdAt(p.x, p.y) != -1) allCorridor = false;
        }
        expect(allCorridor, "reported tiles are corridor tiles outside every room");
        expect(level.countTiles(TileType::Floor) == 44, "room floors unchanged");
        expect(level.isFullyConnected(), "clipping corridor still connects");
    }
    {
        cfg.corridorPolicy = CorridorPolicy::Reroute;
        Level level = blockedLevel(fullBlock);
        RandomSource rng(1u);
        CarveStats st;
        expect(carveCorridor(level, a, b, Alignment::Horizontal, rng, cfg, nullptr, &st), "reroute falls back");
        expect(st.clipped, "reroute fallback clips");
        expect(st.reroutes == 3, "reroute tried every other row");
    }
    {
        cfg.corridorPolicy = CorridorPolicy::Strict;
        Level level = blockedLevel(fullBlock);
        RandomSource rng(1u);
        CarveStats st;
        std::vector<Vec2i> tiles;
        expect(!carveCorridor(level, a, b, Alignment::Horizontal, rng, cfg, &tiles, &st), "strict refuses to clip");
        expect(tiles.empty(), "strict failure reports no tiles");
        expect(level.countTiles(TileType::CorridorFloor) == 0, "strict failure writes nothing");
    }
    {
        // Only the top two rows are blocked; a clean row exists.
        cfg.corridorPolicy = CorridorPolicy::Strict;
        Level level = blockedLevel(Rect{6, 0, 3, 2});
        RandomSource rng(1u);
        CarveStats st;
        expect(carveCorridor(level, a, b, Alignment::Horizontal, rng, cfg, nullptr, &st), "strict finds a clean row");
        expect(!st.clipped, "strict corridor is clean");
        expect(st.tilesWritten == 8, "clean corridor fills the whole gap");
        expect(level.isFullyConnected(), "strict corridor connects");
    }
}

void test_level_basics() {
    Level level(10, 10);
    expect(level.width() == 10 && level.height() == 10, "level size");
    expect(level.countTiles(TileType::Void) == 100, "new level is all Void");
    expect(level.isFullyConnected(), "level without rooms is connected");

    expect(level.commitRoom(Room{0, Rect{2, 2, 5, 4}}), "room commits");
    expect(!level.commitRoom(Room{1, Rect{4, 4, 3, 3}}), "overlapping room rejected");
    expect(!level.commitRoom(Room{1, Rect{8, 8, 3, 3}}), "room outside the region rejected");
    expect(!level.commitRoom(Room{0, Rect{0, 8, 2, 2}}), "duplicate room id rejected");
    expect(level.rooms().size() == 1, "only the valid room is kept");

    expect(level.roomIdAt(2, 2) == 0 && level.roomIdAt(6, 5) == 0, "room mask covers the room");
    expect(level.roomIdAt(7, 2) == -1, "room mask outside the room");
    expect(level.roomIdAt(-1, 0) == -1, "room mask out of bounds");

    const double r1 = level.floorRatio();
    const double r2 = level.floorRatio();
    expect(r1 == r2 && r1 == 0.2, "floor ratio is stable");

    expect(level.carveCorridorTile(2, 2), "carving over a room tile succeeds");
    expect(level.at(2, 2) == TileType::Floor, "room tile stays Floor");
    expect(!level.carveCorridorTile(10, 0), "carving out of bounds fails");

    const int walls = level.encloseWithWalls();
    expect(walls == 7 * 6 - 20, "walls ring the room");
    expect(level.countTiles(TileType::Wall) == walls, "wall count matches");
    expect(level.floorRatio() == r1, "walls do not change the floor ratio");

    const uint64_t h = level.contentHash();
    level.seal();
    expect(level.sealed(), "seal sticks");
    expect(!level.commitRoom(Room{5, Rect{0, 8, 2, 2}}), "sealed level rejects rooms");
    expect(!level.carveCorridorTile(0, 9), "sealed level rejects corridors");
    expect(level.encloseWithWalls() == 0, "sealed level rejects walls");
    expect(level.contentHash() == h, "sealed level unchanged");

    LevelInfo info;
    info.seed = 7;
    info.success = true;
    expect(!level.setInfo(info), "sealed level rejects metadata");
    expect(level.info().seed == 0 && !level.info().success, "metadata unchanged after seal");

    Level fresh(4, 4);
    expect(fresh.setInfo(info), "unsealed level takes metadata");
    expect(fresh.info().seed == 7u && fresh.info().success, "metadata stored");
}

void test_level_connectivity_and_text() {
    Level level(8, 3);
    level.commitRoom(Room{0, Rect{0, 0, 2, 2}});
    level.commitRoom(Room{1, Rect{5, 0, 2, 2}});
    expect(!level.isFullyConnected(), "separate rooms are not connected");
    expect(level.isFullyConnected() == level.isFullyConnected(), "connectivity check is stable");

    for (int x = 2; x < 5; ++x) level.carveCorridorTile(x, 1);
    expect(level.isFullyConnected(), "corridor joins the rooms");

    expect(level.toText() == "..   .. \n..,,,.. \n        \n", "text rendering");
}

void test_config_validation() {
    GeneratorConfig cfg;
    std::string err;
    expect(validateConfig(cfg, &err), "defaults are valid");
    expect(err.empty(), "no error for valid defaults");

    GeneratorConfig bad = cfg;
    bad.targetFloorRatio = 0.0f;
    expect(!validateConfig(bad, &err) && !err.empty(), "zero ratio rejected");

    bad = cfg;
    bad.targetFloorRatio = 1.5f;
    expect(!validateConfig(bad), "ratio above one rejected");

    bad = cfg;
    bad.minRoomSize = 8;
    bad.maxRoomSize = 4;
    expect(!validateConfig(bad), "min room size above max rejected");

    bad = cfg;
    bad.regionWidth = 0;
    expect(!validateConfig(bad), "empty region rejected");

    bad = cfg;
    bad.regionWidth = 4096;
    bad.regionHeight = 4096;
    expect(validateConfig(bad), "region at the tile cap accepted");
    bad.regionWidth = 4097;
    expect(!validateConfig(bad, &err), "region above the tile cap rejected");
    expect(err.find("region_width * region_height") != std::string::npos, "tile cap described");
    bad.regionWidth = 50000;
    bad.regionHeight = 50000;
    expect(!validateConfig(bad), "region whose area overflows int rejected");

    bad = cfg;
    bad.maxRoomSize = 100;
    bad.minRoomSize = 100;
    expect(validateConfig(bad), "impossible but well-formed config is accepted");

    expect(std::string(corridorPolicyName(CorridorPolicy::Strict)) == "strict", "policy name");
    expect(std::string(connectorStyleName(ConnectorStyle::NearestNeighbor)) == "nearest", "connector name");
    expect(std::string(distanceMetricName(DistanceMetric::Center)) == "center", "metric name");
}

void test_parse_unsigned() {
    uint32_t v = 0;
    expect(parseUnsigned32("16", v) && v == 16u, "decimal value");
    expect(parseUnsigned32("0x10", v) && v == 16u, "hex value");
    expect(parseUnsigned32("0XfF", v) && v == 255u, "hex digits in either case");
    expect(parseUnsigned32("010", v) && v == 10u, "leading zero stays decimal");
    expect(parseUnsigned32(" 42 ", v) && v == 42u, "surrounding blanks ignored");
    expect(parseUnsigned32("4294967295", v) && v == 4294967295u, "largest value");
    expect(parseUnsigned32("0xFFFFFFFF", v) && v == 4294967295u, "largest hex value");

    v = 5;
    expect(!parseUnsigned32("4294967296", v), "value past 32 bits rejected");
    expect(!parseUnsigned32("0x100000000", v), "hex past 32 bits rejected");
    expect(!parseUnsigned32("-1", v), "sign rejected");
    expect(!parseUnsigned32("", v), "empty rejected");
    expect(!parseUnsigned32("0x", v), "bare prefix rejected");
    expect(!parseUnsigned32("12abc", v), "trailing junk rejected");
    expect(v == 5u, "failed parse leaves the value");
}

void test_config_load() {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "delvegen_config_load_test.ini";

    {
        std::ofstream out(path);
        out << "# test settings\n";
        out << "region_width = 50\n";
        out << "REGION_HEIGHT = 25   ; trailing comment\n";
        out << "target_floor_ratio = 0.4\n";
        out << "corridor_policy = Strict\n";
        out << "connector = nearest\n";
        out << "enclose_walls = off\n";
        out << "seed = 0x1092\n";
        out << "max_room_size = lots\n";
        out << "colour = blue\n";
        out << "not a setting\n";
    }

    GeneratorConfig cfg;
    std::string warns;
    expect(loadGeneratorConfig(path.string(), cfg, &warns), "config loads");
    expect(cfg.regionWidth == 50 && cfg.regionHeight == 25, "region parsed");
    expect(cfg.targetFloorRatio > 0.39f && cfg.targetFloorRatio < 0.41f, "ratio parsed");
    expect(cfg.corridorPolicy == CorridorPolicy::Strict, "policy parsed case-insensitively");
    expect(cfg.connector == ConnectorStyle::NearestNeighbor, "connector parsed");
    expect(!cfg.encloseWalls, "bool parsed");
    expect(cfg.seed == 4242u, "hex seed parsed");
    expect(cfg.maxRoomSize == GeneratorConfig{}.maxRoomSize, "bad value leaves the default");
    expect(warns.find("max_room_size") != std::string::npos, "bad value warned");
    expect(warns.find("colour") != std::string::npos, "unknown key warned");
    expect(warns.find("expected key = value") != std::string::npos, "malformed line warned");

    GeneratorConfig missing;
    expect(!loadGeneratorConfig((fs::temp_directory_path() / "delvegen_no_such_file.ini").string(), missing),
           "missing file fails to load");

    std::error_code ec;
    fs::remove(path, ec);
}

void test_config_default_file() {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "delvegen_default_config_test.ini";

    expect(writeDefaultGeneratorConfig(path.string()), "default config written");

    GeneratorConfig cfg;
    cfg.regionWidth = 3;
    cfg.seed = 99;
    std::string warns;
    expect(loadGeneratorConfig(path.string(), cfg, &warns), "default config loads");
    expect(warns.empty(), "default config has no warnings");

    const GeneratorConfig def;
    expect(cfg.regionWidth == def.regionWidth && cfg.regionHeight == def.regionHeight, "default region");
    expect(cfg.minRoomSize == def.minRoomSize && cfg.maxRoomSize == def.maxRoomSize, "default room sizes");
    expect(cfg.maxWholeLevelRetries == def.maxWholeLevelRetries, "default retries");
    expect(cfg.corridorPolicy == def.corridorPolicy, "default policy");
    expect(cfg.seed == def.seed, "default seed");

    std::error_code ec;
    fs::remove(path, ec);
}

void checkLevel(const Level& level, const GeneratorConfig& cfg, const std::string& what) {
    expect(level.info().success && level.sealed(), what + ": level sealed and successful");
    expect(level.width() == cfg.regionWidth && level.height() == cfg.regionHeight, what + ": level size");
    expect(static_cast<int>(level.rooms().size()) >= cfg.minRoomCount, what + ": minimum room count");
    expect(noOverlaps(level.rooms()), what + ": rooms do not overlap");
    for (const Room& r : level.rooms()) {
        expect(rectInside(r.rect, level.region()), what + ": room inside region");
        expect(r.rect.w >= cfg.minRoomSize && r.rect.h >= cfg.minRoomSize, what + ": room too small");
        expect(r.rect.w <= cfg.maxRoomSize && r.rect.h <= cfg.maxRoomSize, what + ": room too large");
    }
    expect(level.isFullyConnected(), what + ": level connected");
    const double target = static_cast<double>(cfg.targetFloorRatio);
    const double upper = target + static_cast<double>(cfg.floorRatioTolerance);
    const size_t required = static_cast<size_t>(cfg.minRoomCount > 1 ? cfg.minRoomCount : 1);
    expect(level.floorRatio() >= target, what + ": floor ratio reached");
    if (level.rooms().size() > required) {
        expect(level.floorRatio() <= upper, what + ": floor ratio within tolerance");
    }
    expect(level.info().achievedFloorRatio == level.floorRatio(), what + ": recorded ratio matches");
}

void test_generate_small_region() {
    GeneratorConfig cfg;
    cfg.regionWidth = 30;
    cfg.regionHeight = 30;
    cfg.minRoomSize = 4;
    cfg.maxRoomSize = 8;
    cfg.targetFloorRatio = 0.35f;
    cfg.minRoomCount = 1;
    cfg.seed = 42;

    Level level;
    GenerationReport rep;
    const bool ok = generateLevel(cfg, level, &rep);
    expect(ok, "30x30 level generates: " + rep.error);
    if (!ok) return;

    checkLevel(level, cfg, "30x30");
    expect(rep.failure == GenerationFailure::None, "success reports no failure");
    expect(rep.attempts == level.info().attempt + 1, "attempt count matches");
    expect(level.info().seed == 42u, "seed recorded");
    expect(level.floorRatio() >= 0.35, "30x30 ratio reaches the target");
    expect(level.floorRatio() <= 0.35 + static_cast<double>(cfg.floorRatioTolerance), "30x30 ratio within tolerance");
    expect(rep.corridorsCarved + 1 >= static_cast<int>(level.rooms().size()), "a corridor per tree edge");
}

void test_generate_small_region_seeds() {
    GeneratorConfig cfg;
    cfg.regionWidth = 30;
    cfg.regionHeight = 30;
    cfg.minRoomSize = 4;
    cfg.maxRoomSize = 8;
    cfg.targetFloorRatio = 0.35f;
    cfg.minRoomCount = 1;

    const uint32_t seeds[] = {1u, 2u, 3u, 7u, 42u, 99u};
    for (uint32_t seed : seeds) {
        cfg.seed = seed;
        Level level;
        GenerationReport rep;
        const bool ok = generateLevel(cfg, level, &rep);
        expect(ok, "30x30, seed " + std::to_string(seed) + ": " + rep.error);
        if (!ok) continue;
        checkLevel(level, cfg, "30x30 seed " + std::to_string(seed));
        expect(level.floorRatio() <= 0.35 + static_cast<double>(cfg.floorRatioTolerance),
               "30x30 seed " + std::to_string(seed) + ": ratio within tolerance");
    }
}

void test_validate_level_window() {
    GeneratorConfig cfg;
    cfg.targetFloorRatio = 0.15f;
    cfg.floorRatioTolerance = 0.05f;

    // Two touching 3x3 rooms: 18 of 100 tiles.
    Level level(10, 10);
    expect(level.commitRoom(Room{0, Rect{0, 0, 3, 3}}), "first room commits");
    expect(level.commitRoom(Room{1, Rect{3, 0, 3, 3}}), "second room commits");

    std::string detail;
    expect(validateLevel(level, cfg, &detail) == GenerationFailure::None, "ratio inside the window passes");

    GeneratorConfig low = cfg;
    low.targetFloorRatio = 0.3f;
    expect(validateLevel(level, low, &detail) == GenerationFailure::ValidationFailed, "ratio below target fails");
    expect(detail.find("below") != std::string::npos, "shortfall described");

    GeneratorConfig high = cfg;
    high.targetFloorRatio = 0.1f;
    high.floorRatioTolerance = 0.02f;
    expect(validateLevel(level, high, &detail) == GenerationFailure::ValidationFailed, "ratio above the window fails");
    expect(detail.find("above") != std::string::npos, "overshoot described");

    // Rooms the minimum count demands may push past the window.
    high.minRoomCount = 2;
    expect(validateLevel(level, high) == GenerationFailure::None, "required rooms waive the upper bound");

    Level apart(10, 10);
    expect(apart.commitRoom(Room{0, Rect{0, 0, 3, 3}}), "first apart room commits");
    expect(apart.commitRoom(Room{1, Rect{5, 5, 3, 3}}), "second apart room commits");
    expect(validateLevel(apart, cfg, &detail) == GenerationFailure::ValidationFailed, "disconnected level fails");
    expect(detail.find("flood fill") != std::string::npos, "disconnection described");
}

void test_generate_many_seeds() {
    GeneratorConfig cfg;
    for (uint32_t seed = 1; seed <= 12; ++seed) {
        cfg.seed = seed;
        Level level;
        GenerationReport rep;
        const bool ok = generateLevel(cfg, level, &rep);
        expect(ok, "default config, seed " + std::to_string(seed) + ": " + rep.error);
        if (ok) checkLevel(level, cfg, "seed " + std::to_string(seed));
        if (ok) expect(level.countTiles(TileType::Wall) > 0, "walls enclosed by default");
    }
}

void test_generate_deterministic() {
    GeneratorConfig cfg;
    cfg.seed = 2024;

    Level a, b;
    GenerationReport ra, rb;
    expect(generateLevel(cfg, a, &ra), "first run succeeds");
    expect(generateLevel(cfg, b, &rb), "second run succeeds");
    expect(a.tiles() == b.tiles(), "same seed, same tiles");
    expect(a.rooms().size() == b.rooms().size(), "same seed, same room count");
    bool sameRooms = a.rooms().size() == b.rooms().size();
    for (size_t i = 0; sameRooms && i < a.rooms().size(); ++i) {
        sameRooms = a.rooms()[i] == b.rooms()[i];
    }
    expect(sameRooms, "same seed, same rooms");
    expect(a.contentHash() == b.contentHash(), "same seed, same hash");
    expect(ra.attempts == rb.attempts && ra.corridorsCarved == rb.corridorsCarved, "same seed, same report");

    cfg.seed = 2025;
    Level c;
    expect(generateLevel(cfg, c), "other seed succeeds");
    expect(c.contentHash() != a.contentHash(), "different seed, different level");
}

void test_generate_variants() {
    GeneratorConfig cfg;
    cfg.regionWidth = 60;
    cfg.regionHeight = 30;

    {
        GeneratorConfig v = cfg;
        v.connector = ConnectorStyle::NearestNeighbor;
        v.distanceMetric = DistanceMetric::Center;
        Level level;
        GenerationReport rep;
        const bool ok = generateLevel(v, level, &rep);
        expect(ok, "nearest-neighbour generation: " + rep.error);
        if (ok) checkLevel(level, v, "nearest-neighbour");
    }
    {
        GeneratorConfig v = cfg;
        v.extraConnections = 3;
        Level level;
        GenerationReport rep;
        const bool ok = generateLevel(v, level, &rep);
        expect(ok, "loop generation: " + rep.error);
        if (ok) {
            checkLevel(level, v, "loops");
            expect(rep.loopCorridors <= 3, "loop corridors bounded");
        }
    }
    {
        GeneratorConfig v = cfg;
        v.encloseWalls = false;
        Level level;
        expect(generateLevel(v, level), "generation without walls");
        expect(level.countTiles(TileType::Wall) == 0, "no walls when disabled");
    }
    {
        GeneratorConfig v = cfg;
        v.targetFloorRatio = 0.05f;
        v.minRoomCount = 6;
        Level level;
        GenerationReport rep;
        const bool ok = generateLevel(v, level, &rep);
        expect(ok, "minimum room count generation: " + rep.error);
        if (ok) expect(level.rooms().size() >= 6, "minimum room count honoured");
    }
    for (uint32_t seed = 1; seed <= 6; ++seed) {
        GeneratorConfig v = cfg;
        v.corridorPolicy = CorridorPolicy::Strict;
        v.seed = seed;
        Level level;
        GenerationReport rep;
        if (generateLevel(v, level, &rep)) {
            checkLevel(level, v, "strict seed " + std::to_string(seed));
            expect(rep.corridorsClipped == 0, "strict levels never clip rooms");
        } else {
            expect(rep.failure == GenerationFailure::GenerationExhausted, "strict failure is exhaustion");
        }
        for (const AttemptRecord& a : rep.failedAttempts) {
            expect(a.failure == GenerationFailure::CarvingBlocked ||
                       a.failure == GenerationFailure::PlacementExhausted,
                   "strict attempts fail by blocking or placement");
        }
    }
}

void test_generate_impossible_rooms() {
    GeneratorConfig cfg;
    cfg.regionWidth = 10;
    cfg.regionHeight = 10;
    cfg.minRoomSize = 20;
    cfg.maxRoomSize = 20;
    cfg.maxWholeLevelRetries = 3;

    Level level;
    GenerationReport rep;
    expect(!generateLevel(cfg, level, &rep), "rooms larger than the region cannot generate");
    expect(rep.failure == GenerationFailure::GenerationExhausted, "impossible rooms exhaust generation");
    expect(rep.attempts == 4, "every whole-level attempt used");
    expect(rep.failedAttempts.size() == 4, "every attempt recorded");
    for (const AttemptRecord& a : rep.failedAttempts) {
        expect(a.failure == GenerationFailure::PlacementExhausted, "attempt failed in placement");
        expect(a.state == GenState::Placing, "attempt failed while placing");
        expect(!a.detail.empty(), "attempt failure described");
    }
    expect(!rep.error.empty(), "terminal error described");
    expect(level.width() == 0 && level.rooms().empty(), "output untouched on failure");
}

void test_generate_unreachable_ratio() {
    GeneratorConfig cfg;
    cfg.regionWidth = 20;
    cfg.regionHeight = 20;
    cfg.minRoomSize = 3;
    cfg.maxRoomSize = 3;
    cfg.targetFloorRatio = 1.0f;
    cfg.floorRatioTolerance = 0.0f;
    cfg.maxWholeLevelRetries = 2;
    cfg.maxPlacementFailuresInARow = 16;

    Level level;
    GenerationReport rep;
    expect(!generateLevel(cfg, level, &rep), "full coverage with 3x3 rooms is unreachable");
    expect(rep.failure == GenerationFailure::GenerationExhausted, "unreachable ratio exhausts generation");
    expect(rep.attempts == 3, "retries used");
    for (const AttemptRecord& a : rep.failedAttempts) {
        expect(a.failure == GenerationFailure::PlacementExhausted, "unreachable ratio fails in placement");
    }
}

void test_generate_invalid_config() {
    GeneratorConfig cfg;
    cfg.targetFloorRatio = 0.0f;

    Level level;
    GenerationReport rep;
    expect(!generateLevel(cfg, level, &rep), "invalid config does not generate");
    expect(rep.failure == GenerationFailure::InvalidConfig, "invalid config reported");
    expect(rep.attempts == 0, "no attempt runs for an invalid config");
    expect(!rep.error.empty(), "invalid config described");

    GeneratorConfig huge;
    huge.regionWidth = 50000;
    huge.regionHeight = 50000;
    GenerationReport hugeRep;
    expect(!generateLevel(huge, level, &hugeRep), "oversized region does not generate");
    expect(hugeRep.failure == GenerationFailure::InvalidConfig, "oversized region is an invalid config");
    expect(hugeRep.attempts == 0, "no level is allocated for an oversized region");
}

} // namespace

int main() {
    std::cout << "Running DelveGen tests...\n";

    test_rng_reproducible();
    test_rng_substreams();
    test_geometry_relations();
    test_geometry_crop_and_corners();
    test_disjoint_set();

    test_room_placer_invariants();
    test_room_placer_failures();
    test_connector_three_rooms();
    test_connector_edges_and_loops();
    test_corridor_shapes();
    test_carve_into_level();
    test_corridor_policies();

    test_level_basics();
    test_level_connectivity_and_text();

    test_config_validation();
    test_parse_unsigned();
    test_config_load();
    test_config_default_file();

    test_generate_small_region();
    test_generate_small_region_seeds();
    test_validate_level_window();
    test_generate_many_seeds();
    test_generate_deterministic();
    test_generate_variants();
    test_generate_impossible_rooms();
    test_generate_unreachable_ratio();
    test_generate_invalid_config();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
