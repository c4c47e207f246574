#include <iostream>
#include <random>
#include <string>

#include "board.hpp"
#include "board_file_operations.hpp"
#include "generate_sample_board.hpp"

using namespace std;

int main(int argc, char** argv) {
    int depth = 10;
    unsigned int seed = 0;
    string mode = "walk";
    string input_file;
    string output_file;

    // Simple argument parsing
    try {
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--input-file" && i + 1 < argc) { input_file = argv[++i]; }
            else if (a == "--depth" && i + 1 < argc) { depth = stoi(argv[++i]); }
            else if (a == "--seed" && i + 1 < argc) { seed = static_cast<unsigned int>(stoul(argv[++i])); }
            else if (a == "--mode" && i + 1 < argc) { mode = argv[++i]; }
            else if (a == "--output-file" && i + 1 < argc) { output_file = argv[++i]; }
            else if (a == "--help") {
                cout << "Usage: generate_sample_walk [--input-file F] [--depth D] [--seed S] [--mode walk|bfs] --output-file F\n";
                return 0;
            }
        }
    } catch (const std::exception& e) {
        cerr << "Error parsing arguments: " << e.what() << '\n';
        return 1;
    }
    if (output_file.empty()) {
        cerr << "--output-file is required\n";
        return 1;
    }
    if (mode != "walk" && mode != "bfs") {
        cerr << "Unknown mode: " << mode << '\n';
        return 1;
    }

    try {
        Board start = input_file.empty() ? sample_board() : read_board_from_file(input_file);
        mt19937 rng(seed);
        Board sample = mode == "bfs" ? random_board_bfs(start, depth, rng)
                                     : random_board_random_walk(start, depth, rng);
        write_board_to_file(sample, output_file);
    } catch (const std::exception& e) {
        cerr << "Error generating board: " << e.what() << '\n';
        return 2;
    }
    return 0;
}
