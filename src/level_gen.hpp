#pragma once

#include "gen_config.hpp"
#include "level.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Pipeline stage. An attempt walks Placing -> Connecting -> Carving ->
// Validating and ends in Done or Failed.
enum class GenState : uint8_t {
    Placing = 0,
    Connecting,
    Carving,
    Validating,
    Done,
    Failed,
};

inline const char* genStateName(GenState s) {
    switch (s) {
        case GenState::Placing:    return "Placing";
        case GenState::Connecting: return "Connecting";
        case GenState::Carving:    return "Carving";
        case GenState::Validating: return "Validating";
        case GenState::Done:       return "Done";
        case GenState::Failed:     return "Failed";
    }
    return "Unknown";
}

// Append-only: tooling matches on these names.
enum class GenerationFailure : uint8_t {
    None = 0,
    // Too many room candidates discarded in a row.
    PlacementExhausted,
    // The connector could not join every room (internal invariant violation).
    DisconnectedLevel,
    // Strict corridor policy found no clean route for a corridor.
    CarvingBlocked,
    // Ratio window or flood-fill connectivity check failed after carving.
    ValidationFailed,
    // Every whole-level attempt failed. Terminal.
    GenerationExhausted,
    // The configuration was rejected before any attempt ran. Terminal.
    InvalidConfig,
};

inline const char* generationFailureName(GenerationFailure f) {
    switch (f) {
        case GenerationFailure::None:                return "None";
        case GenerationFailure::PlacementExhausted:  return "PlacementExhausted";
        case GenerationFailure::DisconnectedLevel:   return "DisconnectedLevel";
        case GenerationFailure::CarvingBlocked:      return "CarvingBlocked";
        case GenerationFailure::ValidationFailed:    return "ValidationFailed";
        case GenerationFailure::GenerationExhausted: return "GenerationExhausted";
        case GenerationFailure::InvalidConfig:       return "InvalidConfig";
    }
    return "Unknown";
}

// One failed whole-level attempt.
struct AttemptRecord {
    int attempt = 0;
    GenState state = GenState::Placing;
    GenerationFailure failure = GenerationFailure::None;
    std::string detail;
};

struct GenerationReport {
    // Terminal outcome: None on success, GenerationExhausted or InvalidConfig otherwise.
    GenerationFailure failure = GenerationFailure::None;
    std::string error;

    int attempts = 0;
    std::vector<AttemptRecord> failedAttempts;

    // Totals across all attempts.
    int placementAttempts = 0;
    int placementFailures = 0;
    int pushSteps = 0;
    int roomsCommitted = 0;
    int corridorsCarved = 0;
    int corridorsClipped = 0;
    int corridorReroutes = 0;
    int loopCorridors = 0;
};

// Post-carving checks: the floor ratio lies in [target, target + tolerance]
// and a flood fill reaches every room. The upper bound is waived when the
// level holds no more than the rooms minRoomCount forces. Returns
// ValidationFailed (with a description in `detail`) or None.
GenerationFailure validateLevel(const Level& level, const GeneratorConfig& cfg, std::string* detail = nullptr);

// Generates a level for `cfg`. Deterministic in cfg (seed included).
//
// On success `out` is a sealed Level with success = true and the report's
// failure is None. On failure `out` is left untouched and the report names
// the terminal failure plus the cause of each failed attempt.
bool generateLevel(const GeneratorConfig& cfg, Level& out, GenerationReport* report = nullptr);
