#include <iostream>
#include <vector>
#include <chrono>
#include <optional>
#include <string>

#include "board.hpp"
#include "board_file_operations.hpp"
#include "generate_sample_board.hpp"
#include "rush-hour-bfs-solver.hpp"

using namespace std;

int main(int argc, char** argv) {
    string input_file;
    bool verbose = false;
    bool print_board = false;
    BFSParams params;

    // Simple argument parsing
    try {
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--input-file" && i + 1 < argc) { input_file = argv[++i]; }
            else if (a == "--max-plies" && i + 1 < argc) { params.max_plies = stoi(argv[++i]); }
            else if (a == "--inherited") { params = BFSParams::inherited(params.max_plies); }
            else if (a == "--verbose") { verbose = true; }
            else if (a == "--print-board") { print_board = true; }
            else if (a == "--help") {
                cout << "Usage: rush_hour_bfs [options]\n";
                cout << "Options:\n";
                cout << "  --input-file FILE     Board file (default: built-in 6x6 sample)\n";
                cout << "  --max-plies N         Give up after N levels (default: 0, unbounded)\n";
                cout << "  --inherited           Skip the start-board and empty-frontier checks\n";
                cout << "  --verbose             Print every move of the solution\n";
                cout << "  --print-board         Print the start and final boards\n";
                return 0;
            }
            else {
                cerr << "Unknown argument: " << a << '\n';
                return 1;
            }
        }
    } catch (const std::exception& e) {
        cerr << "Error parsing arguments: " << e.what() << '\n';
        return 1;
    }

    Board start_board;
    try {
        start_board = input_file.empty() ? sample_board() : read_board_from_file(input_file);
    } catch (const std::exception& e) {
        cerr << "Error loading board: " << e.what() << '\n';
        return 2;
    }

    if (print_board) {
        cout << start_board << "\n\n";
    }

    auto t0 = chrono::steady_clock::now();
    int visited_nodes = 0;
    optional<BFSSolution> solution;
    try {
        solution = BFSRushHourSolver(start_board, params, &visited_nodes);
    } catch (const std::exception& e) {
        cerr << "Error solving board: " << e.what() << '\n';
        return 4;
    }
    auto t1 = chrono::steady_clock::now();
    double ms = chrono::duration_cast<chrono::duration<double, milli>>(t1 - t0).count();

    if (!solution) {
        cout << "No solution found, time: " << ms << "ms, visited nodes: " << visited_nodes << '\n';
        return 3;
    }

    cout << "Total steps: " << solution->plies << '\n';
    cout << "Total time: " << ms << " ms, visited nodes: " << visited_nodes << '\n';

    if (verbose) {
        for (const Move& m : solution->moves) {
            cout << m << '\n';
        }
    }
    if (print_board) {
        cout << '\n' << solution->board << '\n';
    }

    return 0;
}
