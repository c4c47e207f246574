#ifndef __RUSH_HOUR_BFS_SOLVER_HPP___
#define __RUSH_HOUR_BFS_SOLVER_HPP___

#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "board.hpp"

/**
 * @file rush-hour-bfs-solver.hpp
 * @brief Level-synchronized breadth-first solver for Rush-Hour `Board`s.
 */

/**
 * @brief Search parameters.
 * @var stop_on_empty_frontier End the search with no result once a level
 *      discovers no new board. When false the search keeps counting empty
 *      levels and never returns on an unsolvable board.
 * @var check_start_board Report a start board that is already won as a
 *      0-ply solution. When false only boards found by expansion are tested.
 * @var max_plies Give up with no result once this many levels have been
 *      searched without a win. 0 means unbounded.
 */
struct BFSParams {
    bool stop_on_empty_frontier;
    bool check_start_board;
    int max_plies;

    BFSParams() :
        stop_on_empty_frontier(true),
        check_start_board(true),
        max_plies(0) {}

    /**
     * @brief Parameters reproducing the unguarded search: no exhaustion
     * check and no test of the start board.
     */
    static BFSParams inherited(int max_plies = 0) {
        BFSParams p;
        p.stop_on_empty_frontier = false;
        p.check_start_board = false;
        p.max_plies = max_plies;
        return p;
    }
};

/**
 * @brief Every board discovered by a search, mapped to the move that first
 * produced it. The start board maps to an empty optional.
 */
typedef std::unordered_map<Board, std::optional<Move>> TranspositionTable;

/**
 * @brief A solved puzzle: the winning board, the number of slides, and the
 * slides themselves from the start board.
 */
struct BFSSolution {
    Board board;
    int plies;
    std::vector<Move> moves;
};

/**
 * @brief Breadth-first search for the closest winning board.
 *
 * Levels are expanded one at a time: all boards at ply k are recorded in
 * `visited` and tested before any board at ply k+1, so the returned ply
 * count is minimal. Each slide counts as one ply regardless of its length.
 *
 * @param start Starting board.
 * @param visited Transposition table to fill. Expected to be empty.
 * @param params Search parameters.
 * @return The winning board and its ply count, or an empty optional when the
 *         search gave up (see `BFSParams`).
 */
std::optional<std::pair<Board, int>> BFSSolveBoard(const Board &start, TranspositionTable &visited, const BFSParams &params = BFSParams());

/**
 * @brief Walk back from a board to the root of a search.
 *
 * @param board Board found by `BFSSolveBoard`.
 * @param visited Table filled by the same search.
 * @throws std::runtime_error if a board on the way back is not in the table.
 * @return Moves from the start board to `board`, in playing order.
 */
std::vector<Move> ReconstructPath(const Board &board, const TranspositionTable &visited);

/**
 * @brief Solve a board and reconstruct the solution.
 *
 * @param start Starting board.
 * @param params Search parameters.
 * @param visited_nodes Optional out-parameter to receive the number of distinct boards discovered.
 * @return The solution, or an empty optional when the search gave up.
 */
std::optional<BFSSolution> BFSRushHourSolver(const Board &start, const BFSParams &params = BFSParams(), int* visited_nodes = nullptr);

#endif // __RUSH_HOUR_BFS_SOLVER_HPP___
