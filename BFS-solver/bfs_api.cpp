#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include "board.hpp"
#include "board_file_operations.hpp"
#include "rush-hour-bfs-solver.hpp"

extern "C" {
    // Run BFS on a given board file; time is reported in milliseconds.
    // Returns 1 if a solution was found, 0 otherwise, -1 on null arguments
    // and -2 if the board could not be loaded or solved.
    // steps and visited are outputs; steps is -1 when nothing was found.
    int bfs_run_instance(
        const char* input_file,
        int max_plies,
        double* out_time_ms,
        int* out_steps,
        int* out_visited
    ) {
        if (!input_file || !out_time_ms || !out_steps || !out_visited) {
            return -1;
        }
        try {
            Board start_board = read_board_from_file(std::string(input_file));
            BFSParams params;
            params.max_plies = max_plies;

            auto t0 = std::chrono::steady_clock::now();
            int visited_nodes = 0;
            std::optional<BFSSolution> solution = BFSRushHourSolver(start_board, params, &visited_nodes);
            auto t1 = std::chrono::steady_clock::now();
            double ms = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(t1 - t0).count();

            *out_time_ms = ms;
            *out_steps = solution ? solution->plies : -1;
            *out_visited = visited_nodes;
            return solution ? 1 : 0;
        } catch (const std::exception&) {
            return -2;
        }
    }
}
