#include <queue>
#include <random>
#include <unordered_set>
#include <utility>
#include <vector>

#include "generate_sample_board.hpp"

using namespace std;

Board sample_board() {
    const Direction H = Direction::Horizontal;
    const Direction V = Direction::Vertical;
    return Board(6, 6, Tile(5, 2), {
        Piece::marked_piece(Tile(0, 2), 2, H),
        Piece(Tile(0, 3), 2, H),
        Piece(Tile(0, 4), 2, V),
        Piece(Tile(1, 4), 2, V),
        Piece(Tile(2, 0), 2, V),
        Piece(Tile(2, 2), 2, V),
        Piece(Tile(2, 4), 2, H),
        Piece(Tile(2, 5), 2, H),
        Piece(Tile(3, 0), 3, H),
        Piece(Tile(3, 3), 2, H),
        Piece(Tile(3, 1), 2, V),
        Piece(Tile(5, 2), 3, V),
    });
}

Board random_board_random_walk(const Board& start, int target_depth, mt19937 &rng) {
    Board temp_board = start;
    for (int i = 0; i < target_depth; ++i) {
        auto moves = temp_board.all_moves();
        if (moves.empty()) break;
        uniform_int_distribution<size_t> dist(0, moves.size() - 1);
        temp_board = temp_board.play(moves[dist(rng)]);
    }
    return temp_board;
}

Board random_board_bfs(const Board& start, int target_depth, mt19937 &rng) {
    queue<pair<Board, int>> frontier;
    unordered_set<Board> explored;
    frontier.push({start, 0});
    explored.insert(start);

    vector<Board> candidates;

    while (!frontier.empty()) {
        auto current = frontier.front();
        frontier.pop();
        const Board &board = current.first;
        int depth = current.second;

        if (depth > target_depth) break;

        if (depth == target_depth) {
            candidates.push_back(board);
            continue;
        }

        for (const auto &next : board.future_boards()) {
            if (explored.insert(next.first).second) {
                frontier.push({next.first, depth + 1});
            }
        }
    }

    if (candidates.empty()) {
        // nothing at that depth; fall back to the start board
        return start;
    }

    uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
    return candidates[dist(rng)];
}
