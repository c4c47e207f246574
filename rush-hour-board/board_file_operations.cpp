#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "board_file_operations.hpp"

using namespace std;

static int read_int(istream& in, const char* what) {
    int value;
    if (!(in >> value)) {
        throw invalid_argument(string("Expected ") + what + " in board description");
    }
    return value;
}

Board read_board(istream& in) {
    int width = read_int(in, "width");
    int height = read_int(in, "height");
    int goal_x = read_int(in, "goal x");
    int goal_y = read_int(in, "goal y");
    int npieces = read_int(in, "piece count");
    if (width <= 0 || height <= 0) {
        throw invalid_argument("Board dimensions must be positive");
    }
    if (npieces < 0) {
        throw invalid_argument("Piece count cannot be negative");
    }

    vector<Piece> pieces;
    pieces.reserve(npieces);
    for (int i = 0; i < npieces; ++i) {
        int x = read_int(in, "piece x");
        int y = read_int(in, "piece y");
        int size = read_int(in, "piece size");
        string axis;
        if (!(in >> axis)) {
            throw invalid_argument("Expected piece axis in board description");
        }
        int marked = read_int(in, "piece marked flag");
        if (size <= 0) {
            throw invalid_argument("Piece size must be positive");
        }
        Direction dir;
        if (axis == "H" || axis == "h") {
            dir = Direction::Horizontal;
        } else if (axis == "V" || axis == "v") {
            dir = Direction::Vertical;
        } else {
            throw invalid_argument("Unknown piece axis: " + axis);
        }
        if (marked != 0 && marked != 1) {
            throw invalid_argument("Piece marked flag must be 0 or 1");
        }
        pieces.emplace_back(Tile(x, y), size, dir, marked == 1);
    }
    return Board(width, height, Tile(goal_x, goal_y), pieces);
}

void write_board(const Board& board, ostream& out) {
    const vector<Piece>& pieces = board.get_pieces();
    out << board.get_width() << " " << board.get_height() << " "
        << board.get_goal().x << " " << board.get_goal().y << " "
        << pieces.size() << "\n";
    for (const Piece& p : pieces) {
        out << p.get_location().x << " " << p.get_location().y << " "
            << p.get_size() << " "
            << (p.get_direction() == Direction::Horizontal ? "H" : "V") << " "
            << (p.is_marked() ? 1 : 0) << "\n";
    }
}

Board read_board_from_file(const string& filename) {
    ifstream infile(filename);
    if (!infile.is_open()) {
        throw runtime_error("Could not open file: " + filename);
    }
    return read_board(infile);
}

void write_board_to_file(const Board& board, const string& filename) {
    ofstream outfile(filename);
    if (!outfile.is_open()) {
        throw runtime_error("Could not open file for writing: " + filename);
    }
    write_board(board, outfile);
}
