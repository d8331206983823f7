#include "gen_config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

std::string ltrim(std::string s) {
    s.erase(s.begin(),
        std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

std::string rtrim(std::string s) {
    s.erase(
        std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(),
        s.end());
    return s;
}

std::string trim(std::string s) {
    return rtrim(ltrim(std::move(s)));
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parseBool(const std::string& v, bool& out) {
    const std::string s = toLower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt(const std::string& v, int& out) {
    const std::string s = trim(v);
    if (s.empty()) return false;
    try {
        size_t used = 0;
        const int parsed = std::stoi(s, &used, 10);
        if (used != s.size()) return false;
        out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseFloat(const std::string& v, float& out) {
    const std::string s = trim(v);
    if (s.empty()) return false;
    try {
        size_t used = 0;
        const float parsed = std::stof(s, &used);
        if (used != s.size()) return false;
        out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

bool parseUnsigned32(const std::string& text, uint32_t& out) {
    const std::string s = trim(text);
    if (s.empty()) return false;

    uint64_t base = 10;
    size_t i = 0;
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        base = 16;
        i = 2;
    }

    uint64_t v = 0;
    for (; i < s.size(); ++i) {
        const char c = s[i];
        uint64_t d = 0;
        if (c >= '0' && c <= '9') d = static_cast<uint64_t>(c - '0');
        else if (base == 16 && c >= 'a' && c <= 'f') d = static_cast<uint64_t>(c - 'a' + 10);
        else if (base == 16 && c >= 'A' && c <= 'F') d = static_cast<uint64_t>(c - 'A' + 10);
        else return false;
        v = v * base + d;
        if (v > 0xFFFFFFFFull) return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

const char* corridorPolicyName(CorridorPolicy p) {
    switch (p) {
        case CorridorPolicy::Permissive: return "permissive";
        case CorridorPolicy::Reroute:    return "reroute";
        case CorridorPolicy::Strict:     return "strict";
    }
    return "permissive";
}

const char* connectorStyleName(ConnectorStyle s) {
    switch (s) {
        case ConnectorStyle::SortedEdges:     return "sorted";
        case ConnectorStyle::NearestNeighbor: return "nearest";
    }
    return "sorted";
}

const char* distanceMetricName(DistanceMetric m) {
    switch (m) {
        case DistanceMetric::NearestCorner: return "corner";
        case DistanceMetric::Center:        return "center";
    }
    return "corner";
}

bool validateConfig(const GeneratorConfig& cfg, std::string* err) {
    auto fail = [&](const std::string& msg) {
        if (err) *err = msg;
        return false;
    };

    if (cfg.regionWidth <= 0 || cfg.regionHeight <= 0) {
        return fail("region_width and region_height must be positive");
    }
    if (static_cast<int64_t>(cfg.regionWidth) * static_cast<int64_t>(cfg.regionHeight) > kMaxRegionTiles) {
        return fail("region_width * region_height must not exceed " + std::to_string(kMaxRegionTiles) + " tiles");
    }
    // Written so NaN fails too.
    if (!(cfg.targetFloorRatio > 0.0f && cfg.targetFloorRatio <= 1.0f)) {
        return fail("target_floor_ratio must be in (0, 1]");
    }
    if (!(cfg.floorRatioTolerance >= 0.0f && cfg.floorRatioTolerance < 1.0f)) {
        return fail("floor_ratio_tolerance must be in [0, 1)");
    }
    if (cfg.minRoomSize < 1) return fail("min_room_size must be at least 1");
    if (cfg.maxRoomSize < cfg.minRoomSize) return fail("max_room_size must be >= min_room_size");
    if (cfg.minRoomCount < 0) return fail("min_room_count must be >= 0");
    if (cfg.minConnectionDistance < 0) return fail("min_connection_distance must be >= 0");
    if (cfg.extraConnections < 0) return fail("extra_connections must be >= 0");
    if (cfg.maxPlacementFailuresInARow < 1) return fail("max_placement_failures_in_a_row must be >= 1");
    if (cfg.maxPushSteps < 1) return fail("max_push_steps must be >= 1");
    if (cfg.maxWholeLevelRetries < 0) return fail("max_whole_level_retries must be >= 0");
    if (cfg.maxCorridorReroutes < 0) return fail("max_corridor_reroutes must be >= 0");
    return true;
}

bool loadGeneratorConfig(const std::string& path, GeneratorConfig& cfg, std::string* warnings) {
    std::ifstream f(path);
    if (!f) return false;

    std::ostringstream warn;
    auto badValue = [&](int lineNo, const std::string& key, const std::string& val) {
        warn << path << ":" << lineNo << ": invalid value for " << key << ": '" << val << "'\n";
    };

    std::string line;
    int lineNo = 0;
    while (std::getline(f, line)) {
        ++lineNo;

        // Strip comments (# or ;)
        const size_t cut = line.find_first_of("#;");
        if (cut != std::string::npos) line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        const size_t eq = line.find('=');
        if (eq == std::string::npos) {
            warn << path << ":" << lineNo << ": expected key = value\n";
            continue;
        }

        const std::string key = toLower(trim(line.substr(0, eq)));
        const std::string val = trim(line.substr(eq + 1));

        int iv = 0;
        float fv = 0.0f;
        bool bv = false;

        if (key == "region_width") {
            if (parseInt(val, iv)) cfg.regionWidth = iv; else badValue(lineNo, key, val);
        } else if (key == "region_height") {
            if (parseInt(val, iv)) cfg.regionHeight = iv; else badValue(lineNo, key, val);
        } else if (key == "target_floor_ratio") {
            if (parseFloat(val, fv)) cfg.targetFloorRatio = fv; else badValue(lineNo, key, val);
        } else if (key == "floor_ratio_tolerance") {
            if (parseFloat(val, fv)) cfg.floorRatioTolerance = fv; else badValue(lineNo, key, val);
        } else if (key == "min_room_size") {
            if (parseInt(val, iv)) cfg.minRoomSize = iv; else badValue(lineNo, key, val);
        } else if (key == "max_room_size") {
            if (parseInt(val, iv)) cfg.maxRoomSize = iv; else badValue(lineNo, key, val);
        } else if (key == "min_room_count") {
            if (parseInt(val, iv)) cfg.minRoomCount = iv; else badValue(lineNo, key, val);
        } else if (key == "min_connection_distance") {
            if (parseInt(val, iv)) cfg.minConnectionDistance = iv; else badValue(lineNo, key, val);
        } else if (key == "extra_connections") {
            if (parseInt(val, iv)) cfg.extraConnections = iv; else badValue(lineNo, key, val);
        } else if (key == "max_placement_failures_in_a_row") {
            if (parseInt(val, iv)) cfg.maxPlacementFailuresInARow = iv; else badValue(lineNo, key, val);
        } else if (key == "max_push_steps") {
            if (parseInt(val, iv)) cfg.maxPushSteps = iv; else badValue(lineNo, key, val);
        } else if (key == "max_whole_level_retries") {
            if (parseInt(val, iv)) cfg.maxWholeLevelRetries = iv; else badValue(lineNo, key, val);
        } else if (key == "max_corridor_reroutes") {
            if (parseInt(val, iv)) cfg.maxCorridorReroutes = iv; else badValue(lineNo, key, val);
        } else if (key == "corridor_policy") {
            const std::string v = toLower(val);
            if (v == "permissive") cfg.corridorPolicy = CorridorPolicy::Permissive;
            else if (v == "reroute") cfg.corridorPolicy = CorridorPolicy::Reroute;
            else if (v == "strict") cfg.corridorPolicy = CorridorPolicy::Strict;
            else badValue(lineNo, key, val);
        } else if (key == "connector") {
            const std::string v = toLower(val);
            if (v == "sorted") cfg.connector = ConnectorStyle::SortedEdges;
            else if (v == "nearest") cfg.connector = ConnectorStyle::NearestNeighbor;
            else badValue(lineNo, key, val);
        } else if (key == "distance_metric") {
            const std::string v = toLower(val);
            if (v == "corner") cfg.distanceMetric = DistanceMetric::NearestCorner;
            else if (v == "center") cfg.distanceMetric = DistanceMetric::Center;
            else badValue(lineNo, key, val);
        } else if (key == "enclose_walls") {
            if (parseBool(val, bv)) cfg.encloseWalls = bv; else badValue(lineNo, key, val);
        } else if (key == "seed") {
            uint32_t sv = 0;
            if (parseUnsigned32(val, sv)) cfg.seed = sv; else badValue(lineNo, key, val);
        } else {
            warn << path << ":" << lineNo << ": unknown key '" << key << "'\n";
        }
    }

    if (warnings) *warnings = warn.str();
    return true;
}

bool writeDefaultGeneratorConfig(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# DelveGen level generator settings
#
# Lines are: key = value
# Comments start with # or ;

# Region
region_width = 80
region_height = 40

# Coverage
# target_floor_ratio: (0, 1]  fraction of tiles that become floor or corridor
target_floor_ratio = 0.35
# floor_ratio_tolerance: accepted overshoot above the target
floor_ratio_tolerance = 0.02

# Rooms
min_room_size = 4
max_room_size = 10
min_room_count = 1

# Connections
# connector: sorted | nearest
connector = sorted
# distance_metric: corner | center
distance_metric = corner
# extra_connections: loop links added after everything is connected (0 = tree)
extra_connections = 0
min_connection_distance = 3

# Corridors
# corridor_policy: permissive | reroute | strict
#   permissive: corridors may clip through other rooms
#   reroute:    try other paths, accept the clipping path if none is clean
#   strict:     try other paths, fail the attempt if none is clean
corridor_policy = permissive
max_corridor_reroutes = 8
enclose_walls = true

# Retry ceilings
max_placement_failures_in_a_row = 64
max_push_steps = 48
max_whole_level_retries = 8

seed = 1
)INI";

    return static_cast<bool>(f);
}
