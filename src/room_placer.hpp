#pragma once

#include "gen_config.hpp"
#include "level.hpp"
#include "rng.hpp"

#include <cstdint>
#include <vector>

// Why a single room candidate was discarded. None of these is fatal; the
// generator counts consecutive failures and gives up on the attempt after
// GeneratorConfig::maxPlacementFailuresInARow.
//
// Append-only.
enum class PlacementFailure : uint8_t {
    None = 0,
    // Still overlapping after maxPushSteps single-tile pushes.
    PushBudgetExhausted,
    // Pushed completely out of the region.
    LeftRegion,
    // Cropped to the region, a side fell below minRoomSize.
    Undersized,
    // Raised by the generator's fit check, never by placeRoom():
    // every size of the room would push the floor ratio past target + tolerance.
    Overshoot,
    // With the room added, some corridor has no route the policy accepts.
    CorridorBlocked,
};

inline const char* placementFailureName(PlacementFailure f) {
    switch (f) {
        case PlacementFailure::None:                return "None";
        case PlacementFailure::PushBudgetExhausted: return "PushBudgetExhausted";
        case PlacementFailure::LeftRegion:          return "LeftRegion";
        case PlacementFailure::Undersized:          return "Undersized";
        case PlacementFailure::Overshoot:           return "Overshoot";
        case PlacementFailure::CorridorBlocked:     return "CorridorBlocked";
    }
    return "Unknown";
}

struct PlacementStats {
    int pushSteps = 0;
    bool cropped = false;
    PlacementFailure failure = PlacementFailure::None;
};

// Draws a random room and shoves it off existing rooms one tile at a time in
// random 8-way directions, then crops it to `region`.
//
// On success `out` holds a room with id `nextId` that lies inside `region`,
// overlaps none of `existing`, and is at least minRoomSize on both sides.
bool placeRoom(const Rect& region,
               const std::vector<Room>& existing,
               RandomSource& rng,
               const GeneratorConfig& cfg,
               int nextId,
               Room& out,
               PlacementStats* outStats = nullptr);
