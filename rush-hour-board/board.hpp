/**
 * @file board.hpp
 * @brief Rush-Hour board state (grid, goal, ordered pieces) and move generation.
 *
 * This header declares the Board class used by the solver, the file helpers
 * and the sample generators.
 */

#ifndef __BOARD_HPP___
#define __BOARD_HPP___

#include <cstddef>
#include <functional>
#include <ostream>
#include <set>
#include <utility>
#include <vector>

#include "tile.hpp"
#include "piece.hpp"
#include "move.hpp"

/**
 * @brief An immutable snapshot of a sliding-block puzzle.
 *
 * The board stores its dimensions, the goal tile and the pieces in their
 * original order, plus two values derived at construction: the set of
 * occupied tiles and whether a marked piece covers the goal. Applying a
 * move never mutates a board; it builds a new one.
 *
 * Overlapping pieces or pieces hanging off the grid are not checked for.
 */
class Board {

private:
    int width;
    int height;
    Tile goal;
    std::vector<Piece> pieces;
    std::set<Tile> occupied_tiles;
    bool won;
    void init();
public:
    Board() : width(0), height(0), won(false) {}

    /**
     * @brief Construct a board and derive its occupancy and win flag.
     *
     * @param width Number of columns.
     * @param height Number of rows.
     * @param goal Tile the marked piece has to reach.
     * @param pieces Pieces in board order. The order is part of the state.
     */
    Board(int width, int height, Tile goal, const std::vector<Piece>& pieces);
    ~Board() = default;

    // Rule of five
    Board(const Board& other) = default;
    Board& operator=(const Board& other) = default;
    Board(Board&& other) = default;
    Board& operator=(Board&& other) = default;

    int get_width() const;
    int get_height() const;
    Tile get_goal() const;
    const std::vector<Piece>& get_pieces() const;
    const std::set<Tile>& get_occupied_tiles() const;

    /**
     * @brief True iff some marked piece covers the goal with any of its tiles.
     */
    bool is_won() const;

    /**
     * @brief Enumerate every legal slide on this board.
     *
     * Pieces are visited in board order. A horizontal piece yields its Right
     * moves then its Left moves, a vertical piece its Up moves then its Down
     * moves. Every reachable step length is a separate move, from 1 up to the
     * first blocked or off-board tile.
     *
     * @return Legal moves, in a deterministic order.
     */
    std::vector<Move> all_moves() const;

    /**
     * @brief Every one-ply successor, paired with the move producing it.
     */
    std::vector<std::pair<Board, Move>> future_boards() const;

    /**
     * @brief Board obtained by sliding the piece located at the move's origin.
     *
     * The other pieces keep their positions and relative order. The move is
     * not validated; pass only moves returned by `all_moves()`.
     *
     * @param move Move to apply.
     * @return The resulting board.
     */
    Board play(const Move& move) const;

    /**
     * @brief Reverse a move previously applied to reach this board.
     *
     * `b.play(m).undo(m) == b` for every `m` in `b.all_moves()`.
     */
    Board undo(const Move& move) const;

    /**
     * @brief True iff `t` is on the board and not covered by a piece.
     */
    bool empty_tile(Tile t) const;

    /**
     * @brief True iff `t` lies within [0, width) x [0, height).
     */
    bool tile_exists(Tile t) const;

    /**
     * @brief Compute a stable hash for this board.
     *
     * The hash follows the piece order, so it is suitable for use in
     * unordered containers together with operator==.
     * @return A size_t hash value.
     */
    size_t hash() const;

    /**
     * @brief Equality over dimensions, goal, ordered pieces and derived fields.
     */
    bool operator==(const Board &rhs) const;
    bool operator!=(const Board &rhs) const;
};

/**
 * @brief Draw the grid: '.' empty, 'X' marked piece, 'a', 'b', ... other
 * pieces in board order, 'G' an uncovered goal tile.
 */
std::ostream &operator<<(std::ostream &os, const Board &board);

namespace std {
    template <>
    struct hash<Board> {
        size_t operator()(const Board &b) const noexcept {
            return b.hash();
        }
    };
}

#endif // __BOARD_HPP___
