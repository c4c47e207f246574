#ifndef __GENERATE_SAMPLE_BOARD_HPP___
#define __GENERATE_SAMPLE_BOARD_HPP___

#include "board.hpp"
#include <random>

/**
 * @file generate_sample_board.hpp
 * @brief Built-in sample puzzle and utilities to scramble boards for benchmarks and testing.
 *
 * Two scrambling strategies are provided:
 * - random walk: perform `target_depth` random legal moves from a board
 * - BFS sampling: collect all boards at exact depth and pick one uniformly
 */

/**
 * @brief The default 6x6 puzzle solved when no input file is given.
 *
 * The marked piece is the horizontal car on row 2 and the goal is the right
 * edge of that row.
 */
Board sample_board();

/**
 * @brief Generate a board by performing a random walk from `start`.
 *
 * Applies `target_depth` uniformly-random legal moves, stopping early if a
 * board has no legal move.
 *
 * @param start Board to walk from.
 * @param target_depth Number of random moves to perform.
 * @param rng Random number generator to use (std::mt19937).
 * @return The final board of the walk.
 */
Board random_board_random_walk(const Board& start, int target_depth, std::mt19937 &rng);

/**
 * @brief Generate a board by uniform sampling among boards at exact BFS depth.
 *
 * Performs a breadth-first search from `start` up to `target_depth` and
 * uniformly selects one of the boards whose shortest distance from `start`
 * is exactly `target_depth`.
 *
 * @param start Board to search from.
 * @param target_depth Depth to sample at (distance from `start` in slides).
 * @param rng Random number generator to use (std::mt19937).
 * @return A sampled board. Returns `start` if no board exists at that depth.
 */
Board random_board_bfs(const Board& start, int target_depth, std::mt19937 &rng);

#endif // __GENERATE_SAMPLE_BOARD_HPP___
