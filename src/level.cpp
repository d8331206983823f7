#include "level.hpp"

#include <deque>

Level::Level(int w, int h)
    : width_(w > 0 ? w : 0), height_(h > 0 ? h : 0) {
    const size_t n = static_cast<size_t>(width_) * static_cast<size_t>(height_);
    tiles_.assign(n, TileType::Void);
    roomMask_.assign(n, -1);
}

int Level::roomIdAt(int x, int y) const {
    if (!inBounds(x, y)) return -1;
    return roomMask_[index(x, y)];
}

bool Level::commitRoom(const Room& room) {
    if (sealed_) return false;
    if (room.rect.empty() || !rectInside(room.rect, region())) return false;
    for (const Room& r : rooms_) {
        if (r.id == room.id) return false;
        if (rectsOverlap(r.rect, room.rect)) return false;
    }

    for (int y = room.rect.y; y < room.rect.y2(); ++y) {
        for (int x = room.rect.x; x < room.rect.x2(); ++x) {
            const size_t i = index(x, y);
            // Corridors are carved after all rooms exist, so only Void is expected here.
            tiles_[i] = TileType::Floor;
            roomMask_[i] = room.id;
        }
    }
    rooms_.push_back(room);
    return true;
}

bool Level::carveCorridorTile(int x, int y) {
    if (sealed_ || !inBounds(x, y)) return false;
    TileType& t = tiles_[index(x, y)];
    if (t == TileType::Void) t = TileType::CorridorFloor;
    return true;
}

bool Level::setInfo(const LevelInfo& info) {
    if (sealed_) return false;
    info_ = info;
    return true;
}

int Level::encloseWithWalls() {
    if (sealed_) return 0;

    int placed = 0;
    const Vec2i* dirs = eightDirections();
    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            if (tiles_[index(x, y)] != TileType::Void) continue;
            for (int k = 0; k < 8; ++k) {
                const int nx = x + dirs[k].x;
                const int ny = y + dirs[k].y;
                if (!inBounds(nx, ny)) continue;
                if (isWalkableTile(tiles_[index(nx, ny)])) {
                    tiles_[index(x, y)] = TileType::Wall;
                    ++placed;
                    break;
                }
            }
        }
    }
    return placed;
}

int Level::countTiles(TileType t) const {
    int n = 0;
    for (TileType v : tiles_) {
        if (v == t) ++n;
    }
    return n;
}

double Level::floorRatio() const {
    if (tiles_.empty()) return 0.0;
    int walkable = 0;
    for (TileType v : tiles_) {
        if (isWalkableTile(v)) ++walkable;
    }
    return static_cast<double>(walkable) / static_cast<double>(tiles_.size());
}

bool Level::isFullyConnected() const {
    if (rooms_.empty()) return true;

    std::vector<uint8_t> visited(tiles_.size(), 0);
    std::deque<Vec2i> q;

    const Rect& start = rooms_.front().rect;
    visited[index(start.x, start.y)] = 1;
    q.push_back({start.x, start.y});

    const int dirs[4][2] = {{1,0},{-1,0},{0,1},{0,-1}};

    while (!q.empty()) {
        const Vec2i p = q.front();
        q.pop_front();

        for (auto& dv : dirs) {
            const int nx = p.x + dv[0];
            const int ny = p.y + dv[1];
            if (!inBounds(nx, ny)) continue;
            const size_t ii = index(nx, ny);
            if (visited[ii]) continue;
            if (!isWalkableTile(tiles_[ii])) continue;
            visited[ii] = 1;
            q.push_back({nx, ny});
        }
    }

    // Rooms are solid rectangles of Floor, so one reached tile means the whole room.
    for (const Room& r : rooms_) {
        if (!visited[index(r.rect.x, r.rect.y)]) return false;
    }
    return true;
}

uint64_t Level::contentHash() const {
    uint64_t h = 1469598103934665603ull; // FNV-1a 64 offset basis
    auto mix = [&](uint64_t v) {
        for (int i = 0; i < 8; ++i) {
            h ^= (v >> (i * 8)) & 0xFFull;
            h *= 1099511628211ull;
        }
    };

    mix(static_cast<uint64_t>(width_));
    mix(static_cast<uint64_t>(height_));
    for (TileType t : tiles_) {
        h ^= static_cast<uint64_t>(t);
        h *= 1099511628211ull;
    }
    mix(static_cast<uint64_t>(rooms_.size()));
    for (const Room& r : rooms_) {
        mix(static_cast<uint64_t>(static_cast<uint32_t>(r.id)));
        mix(static_cast<uint64_t>(static_cast<uint32_t>(r.rect.x)));
        mix(static_cast<uint64_t>(static_cast<uint32_t>(r.rect.y)));
        mix(static_cast<uint64_t>(static_cast<uint32_t>(r.rect.w)));
        mix(static_cast<uint64_t>(static_cast<uint32_t>(r.rect.h)));
    }
    return h;
}

std::string Level::toText() const {
    std::string out;
    out.reserve(static_cast<size_t>((width_ + 1) * height_));
    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            out.push_back(tileGlyph(tiles_[index(x, y)]));
        }
        out.push_back('\n');
    }
    return out;
}

char tileGlyph(TileType t) {
    switch (t) {
        case TileType::Void:          return ' ';
        case TileType::Floor:         return '.';
        case TileType::Wall:          return '#';
        case TileType::CorridorFloor: return ',';
    }
    return '?';
}
