#include "room_placer.hpp"

namespace {

bool overlapsAny(const Rect& r, const std::vector<Room>& rooms) {
    for (const Room& other : rooms) {
        if (rectsOverlap(r, other.rect)) return true;
    }
    return false;
}

} // namespace

bool placeRoom(const Rect& region,
               const std::vector<Room>& existing,
               RandomSource& rng,
               const GeneratorConfig& cfg,
               int nextId,
               Room& out,
               PlacementStats* outStats) {
    PlacementStats stats;
    auto fail = [&](PlacementFailure why) {
        stats.failure = why;
        if (outStats) *outStats = stats;
        return false;
    };

    Rect cand;
    cand.w = rng.range(cfg.minRoomSize, cfg.maxRoomSize);
    cand.h = rng.range(cfg.minRoomSize, cfg.maxRoomSize);
    cand.x = rng.range(region.x, region.x2() - 1);
    cand.y = rng.range(region.y, region.y2() - 1);

    const Vec2i* dirs = eightDirections();
    while (overlapsAny(cand, existing)) {
        if (stats.pushSteps >= cfg.maxPushSteps) return fail(PlacementFailure::PushBudgetExhausted);

        const Vec2i d = dirs[rng.index(8)];
        cand.x += d.x;
        cand.y += d.y;
        ++stats.pushSteps;

        // Nothing left to crop back into the region.
        if (cropRect(cand, region).empty()) return fail(PlacementFailure::LeftRegion);
    }

    const Rect cropped = cropRect(cand, region);
    stats.cropped = (cropped != cand);
    if (cropped.w < cfg.minRoomSize || cropped.h < cfg.minRoomSize) {
        return fail(PlacementFailure::Undersized);
    }

    out.id = nextId;
    out.rect = cropped;
    if (outStats) *outStats = stats;
    return true;
}
