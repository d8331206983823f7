#include "level_gen.hpp"

#include "corridor_carver.hpp"
#include "disjoint_set.hpp"
#include "rng.hpp"
#include "room_connector.hpp"
#include "room_placer.hpp"

#include <algorithm>
#include <cstddef>
#include <sstream>
#include <utility>

namespace {

struct AttemptOutcome {
    GenState state = GenState::Placing;
    GenerationFailure failure = GenerationFailure::None;
    std::string detail;
};

struct CarveTotals {
    int carved = 0;
    int clipped = 0;
    int reroutes = 0;
    int loops = 0;
    // Set when the policy refused a corridor.
    RoomEdge blocked;
    int blockedReroutes = 0;
};

bool carvePlan(Level& level, const std::vector<RoomEdge>& plan, RandomSource& rng,
               const GeneratorConfig& cfg, CarveTotals& totals) {
    const std::vector<Room>& rooms = level.rooms();
    for (const RoomEdge& e : plan) {
        // Copies: carving must not hold references into the level it mutates.
        const Room a = rooms[e.indexA];
        const Room b = rooms[e.indexB];

        CarveStats cs;
        const bool ok = carveCorridor(level, a, b, e.alignment, rng, cfg, nullptr, &cs);
        totals.reroutes += cs.reroutes;
        if (!ok) {
            totals.blocked = e;
            totals.blockedReroutes = cs.reroutes;
            return false;
        }

        ++totals.carved;
        if (cs.clipped) ++totals.clipped;
        if (e.loop) ++totals.loops;
    }
    return true;
}

// Floor ratio the level would finish with if `candidate` were the last room.
// Connects and carves a scratch copy with a copy of the attempt's stream, so
// the real Connecting/Carving stages reproduce it exactly when nothing is
// drawn in between. Returns false if the layout cannot be carved.
bool trialRatio(const Level& level, const Room& candidate, const RandomSource& rng,
                const GeneratorConfig& cfg, double& ratio) {
    Level scratch = level;
    if (!scratch.commitRoom(candidate)) return false;

    DisjointSet sets(scratch.rooms().size());
    std::vector<RoomEdge> plan;
    if (!connectRooms(scratch.rooms(), sets, cfg, plan)) return false;

    RandomSource carveRng = rng;
    CarveTotals totals;
    if (!carvePlan(scratch, plan, carveRng, cfg, totals)) return false;

    ratio = scratch.floorRatio();
    return true;
}

// Rooms that must exist whatever the floor ratio says.
std::size_t requiredRooms(const GeneratorConfig& cfg) {
    return static_cast<std::size_t>(std::max(1, cfg.minRoomCount));
}

// Decides whether `room` may join the level. Accepts it (possibly shrunk
// in place) unless every size overshoots target + tolerance; `finished` is
// set when the level then reaches the target. A room that is still needed
// for the minimum room count is taken as it is.
bool fitRoom(const Level& level, Room& room, const RandomSource& rng, const GeneratorConfig& cfg,
             bool required, bool& finished, PlacementFailure& why) {
    const double target = static_cast<double>(cfg.targetFloorRatio);
    const double upper = target + static_cast<double>(cfg.floorRatioTolerance);

    double ratio = 0.0;
    if (!trialRatio(level, room, rng, cfg, ratio)) {
        why = PlacementFailure::CorridorBlocked;
        return false;
    }
    if (ratio <= upper || required) {
        finished = ratio >= target;
        return true;
    }

    // Smaller rooms at the same origin stay inside the region and clear of
    // the other rooms. Largest first.
    std::vector<Rect> sizes;
    for (int w = room.rect.w; w >= cfg.minRoomSize; --w) {
        for (int h = room.rect.h; h >= cfg.minRoomSize; --h) {
            if (w == room.rect.w && h == room.rect.h) continue;
            sizes.push_back(Rect{room.rect.x, room.rect.y, w, h});
        }
    }
    std::stable_sort(sizes.begin(), sizes.end(), [](const Rect& a, const Rect& b) {
        return a.area() > b.area();
    });

    for (const Rect& r : sizes) {
        const Room smaller{room.id, r};
        if (!trialRatio(level, smaller, rng, cfg, ratio)) continue;
        if (ratio > upper) continue;
        room = smaller;
        finished = ratio >= target;
        return true;
    }

    why = PlacementFailure::Overshoot;
    return false;
}

bool placeRooms(Level& level, RandomSource& rng, const GeneratorConfig& cfg,
                GenerationReport& rep, AttemptOutcome& outcome) {
    const Rect region = level.region();
    const std::size_t required = requiredRooms(cfg);

    int nextId = 0;
    int failuresInARow = 0;

    for (;;) {
        ++rep.placementAttempts;

        Room room;
        PlacementStats ps;
        bool placed = placeRoom(region, level.rooms(), rng, cfg, nextId, room, &ps);
        rep.pushSteps += ps.pushSteps;

        // Rooms short of the minimum count are committed without a fit check;
        // from the last required room on, each one is measured with corridors.
        bool finished = false;
        const std::size_t count = level.rooms().size() + 1;
        if (placed && count >= required) {
            placed = fitRoom(level, room, rng, cfg, count == required, finished, ps.failure);
        }
        if (placed) placed = level.commitRoom(room);

        if (!placed) {
            ++rep.placementFailures;
            ++failuresInARow;
            if (failuresInARow > cfg.maxPlacementFailuresInARow) {
                std::ostringstream ss;
                ss << failuresInARow << " placement failures in a row (last: "
                   << placementFailureName(ps.failure) << ") with "
                   << level.rooms().size() << " rooms placed";
                outcome.failure = GenerationFailure::PlacementExhausted;
                outcome.detail = ss.str();
                return false;
            }
            continue;
        }

        failuresInARow = 0;
        ++nextId;
        ++rep.roomsCommitted;
        if (finished) return true;
    }
}

bool carveAll(Level& level, const std::vector<RoomEdge>& plan, RandomSource& rng,
              const GeneratorConfig& cfg, GenerationReport& rep, AttemptOutcome& outcome) {
    CarveTotals totals;
    const bool ok = carvePlan(level, plan, rng, cfg, totals);

    rep.corridorsCarved += totals.carved;
    rep.corridorsClipped += totals.clipped;
    rep.corridorReroutes += totals.reroutes;
    rep.loopCorridors += totals.loops;

    if (!ok) {
        std::ostringstream ss;
        ss << "no clean " << alignmentName(totals.blocked.alignment) << " route between rooms "
           << totals.blocked.roomA << " and " << totals.blocked.roomB << " after "
           << totals.blockedReroutes << " reroutes";
        outcome.failure = GenerationFailure::CarvingBlocked;
        outcome.detail = ss.str();
        return false;
    }
    return true;
}

// One whole-level attempt, start to finish.
AttemptOutcome runAttempt(const GeneratorConfig& cfg, int attempt, Level& level, GenerationReport& rep) {
    AttemptOutcome outcome;
    RandomSource rng = RandomSource::substream(cfg.seed, tag32("LEVEL_ATTEMPT"), static_cast<uint32_t>(attempt));
    level = Level(cfg.regionWidth, cfg.regionHeight);

    std::vector<RoomEdge> plan;

    while (outcome.state != GenState::Done && outcome.state != GenState::Failed) {
        switch (outcome.state) {
            case GenState::Placing:
                outcome.state = placeRooms(level, rng, cfg, rep, outcome) ? GenState::Connecting : GenState::Failed;
                break;

            case GenState::Connecting: {
                DisjointSet sets(level.rooms().size());
                ConnectStats st;
                if (connectRooms(level.rooms(), sets, cfg, plan, &st)) {
                    outcome.state = GenState::Carving;
                } else {
                    std::ostringstream ss;
                    ss << st.componentsLeft << " components remain after "
                       << st.candidates << " candidate pairs";
                    outcome.failure = GenerationFailure::DisconnectedLevel;
                    outcome.detail = ss.str();
                    outcome.state = GenState::Failed;
                }
                break;
            }

            case GenState::Carving:
                outcome.state = carveAll(level, plan, rng, cfg, rep, outcome) ? GenState::Validating : GenState::Failed;
                break;

            case GenState::Validating: {
                std::string detail;
                const GenerationFailure f = validateLevel(level, cfg, &detail);
                if (f == GenerationFailure::None) {
                    outcome.state = GenState::Done;
                } else {
                    outcome.failure = f;
                    outcome.detail = detail;
                    outcome.state = GenState::Failed;
                }
                break;
            }

            case GenState::Done:
            case GenState::Failed:
                break;
        }
    }

    return outcome;
}

GenState failedStage(GenerationFailure f) {
    switch (f) {
        case GenerationFailure::PlacementExhausted: return GenState::Placing;
        case GenerationFailure::DisconnectedLevel:  return GenState::Connecting;
        case GenerationFailure::CarvingBlocked:     return GenState::Carving;
        case GenerationFailure::ValidationFailed:   return GenState::Validating;
        default:                                    return GenState::Failed;
    }
}

} // namespace

GenerationFailure validateLevel(const Level& level, const GeneratorConfig& cfg, std::string* detail) {
    const double ratio = level.floorRatio();
    const double target = static_cast<double>(cfg.targetFloorRatio);
    const double upper = target + static_cast<double>(cfg.floorRatioTolerance);

    std::ostringstream ss;
    if (ratio < target) {
        ss << "floor ratio " << ratio << " below target " << target;
    } else if (ratio > upper && level.rooms().size() > requiredRooms(cfg)) {
        ss << "floor ratio " << ratio << " above " << upper;
    } else if (!level.isFullyConnected()) {
        ss << "flood fill does not reach every room";
    } else {
        return GenerationFailure::None;
    }

    if (detail) *detail = ss.str();
    return GenerationFailure::ValidationFailed;
}

bool generateLevel(const GeneratorConfig& cfg, Level& out, GenerationReport* report) {
    GenerationReport rep;

    std::string err;
    if (!validateConfig(cfg, &err)) {
        rep.failure = GenerationFailure::InvalidConfig;
        rep.error = err;
        if (report) *report = std::move(rep);
        return false;
    }

    const int maxAttempts = cfg.maxWholeLevelRetries + 1;
    for (int attempt = 0; attempt < maxAttempts; ++attempt) {
        ++rep.attempts;

        Level level;
        const AttemptOutcome outcome = runAttempt(cfg, attempt, level, rep);
        if (outcome.state == GenState::Done) {
            if (cfg.encloseWalls) level.encloseWithWalls();

            LevelInfo info;
            info.seed = cfg.seed;
            info.targetFloorRatio = cfg.targetFloorRatio;
            info.achievedFloorRatio = level.floorRatio();
            info.attempt = attempt;
            info.success = true;
            level.setInfo(info);
            level.seal();

            out = std::move(level);
            rep.failure = GenerationFailure::None;
            if (report) *report = std::move(rep);
            return true;
        }

        AttemptRecord rec;
        rec.attempt = attempt;
        rec.state = failedStage(outcome.failure);
        rec.failure = outcome.failure;
        rec.detail = outcome.detail;
        rep.failedAttempts.push_back(std::move(rec));
    }

    std::ostringstream ss;
    ss << "all " << maxAttempts << " level attempts failed";
    if (!rep.failedAttempts.empty()) {
        const AttemptRecord& last = rep.failedAttempts.back();
        ss << " (last: " << generationFailureName(last.failure) << ": " << last.detail << ")";
    }
    rep.failure = GenerationFailure::GenerationExhausted;
    rep.error = ss.str();
    if (report) *report = std::move(rep);
    return false;
}
