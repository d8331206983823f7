#pragma once
#include "common.hpp"
#include "geometry.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

enum class TileType : uint8_t {
    Void = 0,
    Floor,
    Wall,
    CorridorFloor,
};

inline bool isWalkableTile(TileType t) {
    return t == TileType::Floor || t == TileType::CorridorFloor;
}

struct LevelInfo {
    uint32_t seed = 0;
    float targetFloorRatio = 0.0f;
    double achievedFloorRatio = 0.0;
    int attempt = 0;
    bool success = false;
};

struct Room {
    int id = -1;
    Rect rect;
};

inline bool operator==(const Room& a, const Room& b) {
    return a.id == b.id && a.rect == b.rect;
}

// Tile buffer plus room registry for one generated level.
//
// Only the generation pipeline mutates a Level. generateLevel() seals it before
// handing it out; after seal() every mutator is a no-op returning false.
class Level {
public:
    Level() = default;
    Level(int w, int h);

    int width() const { return width_; }
    int height() const { return height_; }
    Rect region() const { return Rect{0, 0, width_, height_}; }

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    TileType at(int x, int y) const { return tiles_[index(x, y)]; }
    const std::vector<TileType>& tiles() const { return tiles_; }

    // Rooms in creation order.
    const std::vector<Room>& rooms() const { return rooms_; }

    // Id of the room covering (x,y), or -1.
    int roomIdAt(int x, int y) const;

    // Appends the room and turns its Void tiles into Floor. Fails if the level
    // is sealed, the rect leaves the region, or it overlaps a committed room.
    bool commitRoom(const Room& room);

    // Void -> CorridorFloor. Floor tiles are left untouched (still returns true).
    bool carveCorridorTile(int x, int y);

    // Every Void tile 8-adjacent to a walkable tile becomes Wall.
    // Returns the number of walls placed.
    int encloseWithWalls();

    int countTiles(TileType t) const;

    // (Floor + CorridorFloor) / (width * height).
    double floorRatio() const;

    // Flood fill (4-neighbour) over walkable tiles from the first room;
    // true iff every room is reached. A level with no rooms counts as connected.
    bool isFullyConnected() const;

    // Stable FNV-1a digest of size, tiles and rooms. Equal for identical levels.
    uint64_t contentHash() const;

    // One line per row: ' ' Void, '.' Floor, '#' Wall, ',' CorridorFloor.
    std::string toText() const;

    void seal() { sealed_ = true; }
    bool sealed() const { return sealed_; }

    // Generation metadata. Written once by generateLevel() before sealing.
    const LevelInfo& info() const { return info_; }
    bool setInfo(const LevelInfo& info);

private:
    size_t index(int x, int y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x);
    }

    int width_ = 0;
    int height_ = 0;
    std::vector<TileType> tiles_;
    // Room id per tile (-1 = none). Kept alongside tiles_ so ownership
    // questions during carving are O(1).
    std::vector<int> roomMask_;
    std::vector<Room> rooms_;
    LevelInfo info_;
    bool sealed_ = false;
};

char tileGlyph(TileType t);
