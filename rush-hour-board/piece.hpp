/**
 * @file piece.hpp
 * @brief Rigid sliding piece (a car or truck on a Rush-Hour grid).
 */

#ifndef __PIECE_HPP___
#define __PIECE_HPP___

#include <cstddef>
#include <vector>

#include "tile.hpp"

/**
 * @brief An immutable straight piece occupying `size` consecutive tiles.
 *
 * `location` is the minimum-coordinate endpoint of the piece. A piece never
 * changes once constructed; moving it produces a new Piece.
 */
class Piece {

private:
    int size;
    Tile location;
    Direction direction;
    bool marked;
public:
    /**
     * @brief Construct a piece.
     *
     * @param location Minimum-coordinate endpoint.
     * @param size Number of tiles covered (assumed >= 1).
     * @param direction Axis the piece lies and slides along.
     * @param marked Whether this is the piece that has to reach the goal.
     */
    Piece(Tile location, int size, Direction direction, bool marked = false);

    /**
     * @brief Convenience factory for the marked piece.
     */
    static Piece marked_piece(Tile location, int size, Direction direction);

    Tile get_location() const;
    int get_size() const;
    Direction get_direction() const;
    bool is_marked() const;

    /**
     * @brief Tiles covered by the piece, starting at `location` and stepping
     * along `direction`.
     *
     * @return Exactly `size` tiles in increasing coordinate order.
     */
    std::vector<Tile> occupies() const;

    /**
     * @brief Copy of this piece shifted by (dx, dy).
     */
    Piece moved_by(int dx, int dy) const;

    size_t hash() const;

    bool operator==(const Piece &rhs) const;
    bool operator!=(const Piece &rhs) const;
};

#endif // __PIECE_HPP___
