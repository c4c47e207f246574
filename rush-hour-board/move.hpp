/**
 * @file move.hpp
 * @brief A single slide of one piece by a positive number of tiles.
 */

#ifndef __MOVE_HPP___
#define __MOVE_HPP___

#include <cstddef>
#include <ostream>
#include <string>

#include "tile.hpp"

/**
 * @brief Slide direction of a move. Left/Right are horizontal motion,
 * Up/Down vertical motion.
 */
enum class MoveKind {
    Left,
    Right,
    Up,
    Down
};

/**
 * @brief An action descriptor: which piece slides (identified by its current
 * location), which way, and how far.
 *
 * The type itself does not know about piece axes; moves are only ever legal
 * when produced by `Board::all_moves()`.
 */
struct Move {
    MoveKind kind;
    Tile origin;
    int steps;

    Move(MoveKind kind, Tile origin, int steps) : kind(kind), origin(origin), steps(steps) {}

    static Move left(Tile origin, int steps) { return Move(MoveKind::Left, origin, steps); }
    static Move right(Tile origin, int steps) { return Move(MoveKind::Right, origin, steps); }
    static Move up(Tile origin, int steps) { return Move(MoveKind::Up, origin, steps); }
    static Move down(Tile origin, int steps) { return Move(MoveKind::Down, origin, steps); }

    /**
     * @brief The tile the moved piece starts from.
     */
    Tile get_tile() const { return origin; }

    /**
     * @brief Signed column offset applied to the moved piece.
     */
    int dx() const;

    /**
     * @brief Signed row offset applied to the moved piece.
     */
    int dy() const;

    /**
     * @brief The move that takes the piece back, with the origin set to where
     * this move leaves the piece (Left k at (x,y) becomes Right k at (x-k,y)).
     */
    Move inverse() const;

    /**
     * @brief Human-readable form, e.g. "Move (0,0) right by 2 steps".
     */
    std::string to_string() const;

    bool operator==(const Move &rhs) const {
        return kind == rhs.kind && origin == rhs.origin && steps == rhs.steps;
    }
    bool operator!=(const Move &rhs) const { return !(*this == rhs); }
};

const char *move_kind_name(MoveKind kind);

std::ostream &operator<<(std::ostream &os, const Move &m);

#endif // __MOVE_HPP___
