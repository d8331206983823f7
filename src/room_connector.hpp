#pragma once

#include "disjoint_set.hpp"
#include "gen_config.hpp"
#include "level.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

// Corridor shape implied by how two rooms sit relative to each other.
//  - Horizontal: side by side (y-ranges overlap) -> straight east/west corridor.
//  - Vertical:   stacked (x-ranges overlap)      -> straight north/south corridor.
//  - Diagonal:   no shared range                 -> L-shaped corridor.
enum class Alignment : uint8_t {
    Horizontal = 0,
    Vertical,
    Diagonal,
};

inline const char* alignmentName(Alignment a) {
    switch (a) {
        case Alignment::Horizontal: return "Horizontal";
        case Alignment::Vertical:   return "Vertical";
        case Alignment::Diagonal:   return "Diagonal";
    }
    return "Unknown";
}

inline bool isStraight(Alignment a) {
    return a != Alignment::Diagonal;
}

Alignment classifyAlignment(const Rect& a, const Rect& b);

// Candidate connection between two rooms. Also serves as the carving
// instruction once accepted.
struct RoomEdge {
    // Room ids, lower id first.
    int roomA = -1;
    int roomB = -1;
    // Positions of those rooms in the room list handed to the connector.
    std::size_t indexA = 0;
    std::size_t indexB = 0;

    int distance = 0;
    Alignment alignment = Alignment::Diagonal;

    // Accepted after the rooms were already connected (an extra loop link).
    bool loop = false;
};

int roomDistance(const Rect& a, const Rect& b, DistanceMetric metric);

// Every unordered room pair, sorted by (distance, roomA, roomB).
std::vector<RoomEdge> buildRoomEdges(const std::vector<Room>& rooms, DistanceMetric metric);

struct ConnectStats {
    int candidates = 0;
    int accepted = 0;
    int loops = 0;
    std::size_t componentsLeft = 0;
};

// Chooses which room pairs get corridors and in what order.
//
// `sets` tracks room connectivity by position in `rooms`; it is reset to
// rooms.size() singletons if its size does not match (callers may pre-union
// rooms that are already joined). Accepted edges are appended to `out` in
// carving order.
//
// Returns false (DisconnectedLevel) if the rooms could not all be joined.
bool connectRooms(const std::vector<Room>& rooms,
                  DisjointSet& sets,
                  const GeneratorConfig& cfg,
                  std::vector<RoomEdge>& out,
                  ConnectStats* outStats = nullptr);
