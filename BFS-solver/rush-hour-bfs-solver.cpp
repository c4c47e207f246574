#include <algorithm>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>
#include "board.hpp"

#include "rush-hour-bfs-solver.hpp"

using namespace std;

optional<pair<Board, int>> BFSSolveBoard(const Board &start, TranspositionTable &visited, const BFSParams &params) {
    visited.emplace(start, nullopt);
    if (params.check_start_board && start.is_won()) {
        return make_pair(start, 0);
    }

    vector<pair<Board, Move>> frontier = start.future_boards();
    int steps = 0;
    while (true) {
        if (params.max_plies > 0 && steps >= params.max_plies) {
            return nullopt;
        }
        if (params.stop_on_empty_frontier && frontier.empty()) {
            return nullopt;
        }

        // drop configurations we have already seen and record the new ones
        // together with the move that produced them
        vector<pair<Board, Move>> fresh;
        for (auto &entry : frontier) {
            if (visited.emplace(entry.first, entry.second).second) {
                fresh.push_back(std::move(entry));
            }
        }

        ++steps;

        vector<pair<Board, Move>> next_frontier;
        for (const auto &entry : fresh) {
            if (entry.first.is_won()) {
                return make_pair(entry.first, steps);
            }
            vector<pair<Board, Move>> successors = entry.first.future_boards();
            next_frontier.insert(next_frontier.end(),
                                 make_move_iterator(successors.begin()),
                                 make_move_iterator(successors.end()));
        }
        frontier = std::move(next_frontier);
    }
}

vector<Move> ReconstructPath(const Board &board, const TranspositionTable &visited) {
    vector<Move> history;
    Board current = board;
    while (true) {
        auto it = visited.find(current);
        if (it == visited.end()) {
            throw runtime_error("Board is missing from the transposition table");
        }
        if (!it->second.has_value()) {
            break; // reached the start board
        }
        const Move &prev_move = it->second.value();
        history.push_back(prev_move);
        current = current.undo(prev_move);
    }
    reverse(history.begin(), history.end());
    return history;
}

optional<BFSSolution> BFSRushHourSolver(const Board &start, const BFSParams &params, int* visited_nodes) {
    TranspositionTable visited;
    optional<pair<Board, int>> result = BFSSolveBoard(start, visited, params);
    if (visited_nodes) {
        *visited_nodes = static_cast<int>(visited.size());
    }
    if (!result) {
        return nullopt;
    }
    BFSSolution solution;
    solution.board = result->first;
    solution.plies = result->second;
    solution.moves = ReconstructPath(result->first, visited);
    return solution;
}
