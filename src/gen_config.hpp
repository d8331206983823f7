#pragma once

#include <cstdint>
#include <string>

// What to do when a corridor's path runs through a room other than the two
// it connects.
enum class CorridorPolicy : uint8_t {
    // Carve the first path regardless (corridors may clip third rooms).
    Permissive = 0,
    // Try alternative paths; fall back to the first path if none is clean.
    Reroute,
    // Try alternative paths; give up with CarvingBlocked if none is clean.
    Strict,
};

enum class ConnectorStyle : uint8_t {
    SortedEdges = 0,  // Kruskal over distance-sorted room pairs
    NearestNeighbor,  // attach each room to its nearest already-visited room
};

enum class DistanceMetric : uint8_t {
    NearestCorner = 0, // empty tiles between the rectangles (x gap + y gap)
    Center,            // Manhattan distance between center tiles
};

// Largest region validateConfig() accepts, in tiles.
constexpr int64_t kMaxRegionTiles = int64_t(1) << 24;

const char* corridorPolicyName(CorridorPolicy p);
const char* connectorStyleName(ConnectorStyle s);
const char* distanceMetricName(DistanceMetric m);

// Everything a generation run depends on. generateLevel() is a pure function
// of this record.
struct GeneratorConfig {
    int regionWidth = 80;
    int regionHeight = 40;

    // Fraction of region tiles that should end up Floor/CorridorFloor.
    float targetFloorRatio = 0.35f;
    // The achieved ratio must land in [target, target + tolerance].
    float floorRatioTolerance = 0.02f;

    int minRoomSize = 4;
    int maxRoomSize = 10;
    // Keep placing rooms until at least this many exist, even past the target ratio.
    int minRoomCount = 1;

    // Extra (loop) links are only taken if they are longer than this.
    int minConnectionDistance = 3;
    // Redundant links to add after full connectivity. 0 = spanning tree only.
    int extraConnections = 0;

    // Attempt ceilings.
    int maxPlacementFailuresInARow = 64;
    int maxPushSteps = 48;
    int maxWholeLevelRetries = 8;
    int maxCorridorReroutes = 8;

    CorridorPolicy corridorPolicy = CorridorPolicy::Permissive;
    ConnectorStyle connector = ConnectorStyle::SortedEdges;
    DistanceMetric distanceMetric = DistanceMetric::NearestCorner;

    // Ring walkable tiles with Wall after carving.
    bool encloseWalls = true;

    uint32_t seed = 1;
};

// Rejects malformed configurations (non-positive region, ratio outside (0,1],
// min > max room size, ...). Configurations that are merely impossible to
// satisfy are accepted; generation reports them as GenerationExhausted.
bool validateConfig(const GeneratorConfig& cfg, std::string* err = nullptr);

// Loads a config file (INI-ish: key = value, # or ; comments) over the
// defaults already in `cfg`. Unknown keys and bad values are skipped and
// described in `warnings`. Returns false only if the file cannot be opened.
bool loadGeneratorConfig(const std::string& path, GeneratorConfig& cfg, std::string* warnings = nullptr);

// Decimal or 0x-prefixed hex, no sign, must fit in 32 bits. Shared by the
// config loader and the command line so both accept the same seeds.
bool parseUnsigned32(const std::string& text, uint32_t& out);

// Writes a commented config file holding the default values.
bool writeDefaultGeneratorConfig(const std::string& path);
