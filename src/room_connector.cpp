#include "room_connector.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace {

RoomEdge makeEdge(const std::vector<Room>& rooms, std::size_t i, std::size_t j, DistanceMetric metric) {
    if (rooms[j].id < rooms[i].id) std::swap(i, j);

    RoomEdge e;
    e.roomA = rooms[i].id;
    e.roomB = rooms[j].id;
    e.indexA = i;
    e.indexB = j;
    e.distance = roomDistance(rooms[i].rect, rooms[j].rect, metric);
    e.alignment = classifyAlignment(rooms[i].rect, rooms[j].rect);
    return e;
}

bool edgeLess(const RoomEdge& a, const RoomEdge& b) {
    if (a.distance != b.distance) return a.distance < b.distance;
    if (a.roomA != b.roomA) return a.roomA < b.roomA;
    return a.roomB < b.roomB;
}

// Kruskal: shortest edges first, skipping pairs that are already joined.
void connectSortedEdges(const std::vector<RoomEdge>& edges,
                        DisjointSet& sets,
                        std::vector<RoomEdge>& out,
                        ConnectStats& stats,
                        std::size_t& resumeAt) {
    resumeAt = edges.size();
    for (std::size_t k = 0; k < edges.size(); ++k) {
        if (sets.fullyConnected()) {
            resumeAt = k;
            return;
        }
        const RoomEdge& e = edges[k];
        if (!sets.unite(e.indexA, e.indexB)) continue;
        out.push_back(e);
        ++stats.accepted;
    }
}

// Each room, in creation order, attaches to the closest room before it that
// is not yet in its component.
void connectNearestNeighbor(const std::vector<Room>& rooms,
                            DisjointSet& sets,
                            DistanceMetric metric,
                            std::vector<RoomEdge>& out,
                            ConnectStats& stats) {
    for (std::size_t i = 1; i < rooms.size(); ++i) {
        std::size_t best = i;
        int bestDist = std::numeric_limits<int>::max();
        for (std::size_t j = 0; j < i; ++j) {
            if (sets.same(i, j)) continue;
            const int d = roomDistance(rooms[i].rect, rooms[j].rect, metric);
            if (d < bestDist || (d == bestDist && rooms[j].id < rooms[best].id)) {
                bestDist = d;
                best = j;
            }
        }
        if (best == i || !sets.unite(i, best)) continue;

        out.push_back(makeEdge(rooms, best, i, metric));
        ++stats.accepted;
    }
}

} // namespace

Alignment classifyAlignment(const Rect& a, const Rect& b) {
    switch (classifyRects(a, b)) {
        case RectRelation::Horizontal: return Alignment::Horizontal;
        case RectRelation::Vertical:   return Alignment::Vertical;
        case RectRelation::Disjoint:   return Alignment::Diagonal;
        case RectRelation::Overlap:    break;
    }
    // Overlapping rooms share tiles already; any straight class yields an empty corridor.
    return Alignment::Horizontal;
}

int roomDistance(const Rect& a, const Rect& b, DistanceMetric metric) {
    if (metric == DistanceMetric::Center) return centerDistance(a, b);
    return gapDistance(a, b);
}

std::vector<RoomEdge> buildRoomEdges(const std::vector<Room>& rooms, DistanceMetric metric) {
    std::vector<RoomEdge> edges;
    const std::size_t n = rooms.size();
    if (n >= 2) edges.reserve(n * (n - 1) / 2);

    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            edges.push_back(makeEdge(rooms, i, j, metric));
        }
    }

    std::sort(edges.begin(), edges.end(), edgeLess);
    return edges;
}

bool connectRooms(const std::vector<Room>& rooms,
                  DisjointSet& sets,
                  const GeneratorConfig& cfg,
                  std::vector<RoomEdge>& out,
                  ConnectStats* outStats) {
    ConnectStats stats;
    if (sets.size() != rooms.size()) sets.reset(rooms.size());

    const std::vector<RoomEdge> edges = buildRoomEdges(rooms, cfg.distanceMetric);
    stats.candidates = static_cast<int>(edges.size());

    // Extra links are drawn from the sorted list after the tree is complete.
    std::size_t loopFrom = 0;
    if (cfg.connector == ConnectorStyle::NearestNeighbor) {
        connectNearestNeighbor(rooms, sets, cfg.distanceMetric, out, stats);
    } else {
        connectSortedEdges(edges, sets, out, stats, loopFrom);
    }

    if (sets.fullyConnected() && cfg.extraConnections > 0) {
        for (std::size_t k = loopFrom; k < edges.size() && stats.loops < cfg.extraConnections; ++k) {
            const RoomEdge& e = edges[k];
            if (e.distance <= cfg.minConnectionDistance) continue;

            // Skip pairs the tree already links directly.
            const bool duplicate = std::any_of(out.begin(), out.end(), [&](const RoomEdge& o) {
                return o.roomA == e.roomA && o.roomB == e.roomB;
            });
            if (duplicate) continue;

            RoomEdge loop = e;
            loop.loop = true;
            out.push_back(loop);
            ++stats.loops;
            ++stats.accepted;
        }
    }

    stats.componentsLeft = sets.componentCount();
    if (outStats) *outStats = stats;
    return sets.fullyConnected();
}
