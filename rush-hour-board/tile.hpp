/**
 * @file tile.hpp
 * @brief Primitive grid coordinate and axis types shared by pieces, moves and boards.
 */

#ifndef __TILE_HPP___
#define __TILE_HPP___

#include <cstddef>
#include <ostream>

/**
 * @brief A grid coordinate (x = column, y = row).
 *
 * Coordinates carry no bounds of their own; whether a tile exists is decided
 * by the board it is checked against.
 */
struct Tile {
    int x;
    int y;

    Tile() : x(0), y(0) {}
    Tile(int x, int y) : x(x), y(y) {}

    bool operator==(const Tile &rhs) const { return x == rhs.x && y == rhs.y; }
    bool operator!=(const Tile &rhs) const { return !(*this == rhs); }

    /**
     * @brief Lexicographic ordering (x first), used by ordered containers.
     */
    bool operator<(const Tile &rhs) const { return x < rhs.x || (x == rhs.x && y < rhs.y); }
};

inline std::ostream &operator<<(std::ostream &os, const Tile &t) {
    return os << "(" << t.x << "," << t.y << ")";
}

/**
 * @brief The axis a piece is laid out along, and the only axis it may slide on.
 */
enum class Direction {
    Horizontal,
    Vertical
};

inline std::ostream &operator<<(std::ostream &os, Direction d) {
    return os << (d == Direction::Horizontal ? "horizontal" : "vertical");
}

#endif // __TILE_HPP___
