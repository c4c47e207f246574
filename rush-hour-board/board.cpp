#include <string>
#include <utility>
#include <vector>

#include "board.hpp"

using namespace std;

void Board::init() {
    occupied_tiles.clear();
    won = false;
    for (const Piece& p : pieces) {
        for (const Tile& t : p.occupies()) {
            occupied_tiles.insert(t);
            if (p.is_marked() && t == goal) {
                won = true;
            }
        }
    }
}

Board::Board(int width, int height, Tile goal, const vector<Piece>& pieces)
    : width(width), height(height), goal(goal), pieces(pieces) {
    init();
}

int Board::get_width() const {
    return width;
}

int Board::get_height() const {
    return height;
}

Tile Board::get_goal() const {
    return goal;
}

const vector<Piece>& Board::get_pieces() const {
    return pieces;
}

const set<Tile>& Board::get_occupied_tiles() const {
    return occupied_tiles;
}

bool Board::is_won() const {
    return won;
}

vector<Move> Board::all_moves() const {
    vector<Move> moves;
    for (const Piece& piece : pieces) {
        Tile loc = piece.get_location();
        int x = loc.x, y = loc.y;

        // probes stop at the first blocked or off-board tile, so the run
        // can never be longer than the board along that axis
        if (piece.get_direction() == Direction::Horizontal) {
            int start = x, end = x + piece.get_size() - 1;
            for (int i = 1; i <= width; ++i) {
                if (!empty_tile(Tile(end + i, y))) break;
                moves.push_back(Move::right(loc, i));
            }
            for (int i = 1; i <= width; ++i) {
                if (start < i || !empty_tile(Tile(start - i, y))) break;
                moves.push_back(Move::left(loc, i));
            }
        } else {
            int start = y, end = y + piece.get_size() - 1;
            for (int i = 1; i <= height; ++i) {
                if (start < i || !empty_tile(Tile(x, start - i))) break;
                moves.push_back(Move::up(loc, i));
            }
            for (int i = 1; i <= height; ++i) {
                if (!empty_tile(Tile(x, end + i))) break;
                moves.push_back(Move::down(loc, i));
            }
        }
    }
    return moves;
}

vector<pair<Board, Move>> Board::future_boards() const {
    vector<pair<Board, Move>> boards;
    vector<Move> moves = all_moves();
    boards.reserve(moves.size());
    for (const Move& m : moves) {
        boards.emplace_back(play(m), m);
    }
    return boards;
}

Board Board::play(const Move& move) const {
    vector<Piece> new_pieces;
    new_pieces.reserve(pieces.size());
    for (const Piece& p : pieces) {
        if (p.get_location() == move.get_tile()) {
            new_pieces.push_back(p.moved_by(move.dx(), move.dy()));
        } else {
            new_pieces.push_back(p);
        }
    }
    return Board(width, height, goal, new_pieces);
}

Board Board::undo(const Move& move) const {
    return play(move.inverse());
}

bool Board::empty_tile(Tile t) const {
    return tile_exists(t) && occupied_tiles.find(t) == occupied_tiles.end();
}

bool Board::tile_exists(Tile t) const {
    return t.x >= 0 && t.y >= 0 && t.x < width && t.y < height;
}

size_t Board::hash() const {
    // FNV over the dimensions, the goal and the pieces in order
    size_t h = 1469598103934665603ULL;
    const size_t header[] = {
        static_cast<size_t>(width),
        static_cast<size_t>(height),
        static_cast<size_t>(goal.x),
        static_cast<size_t>(goal.y)
    };
    for (size_t v : header) {
        h ^= v + 1;
        h *= 1099511628211ULL;
    }
    for (const Piece& p : pieces) {
        h ^= p.hash();
        h *= 1099511628211ULL;
    }
    return h;
}

bool Board::operator==(const Board &rhs) const {
    return width == rhs.width && height == rhs.height && goal == rhs.goal &&
           won == rhs.won && pieces == rhs.pieces && occupied_tiles == rhs.occupied_tiles;
}

bool Board::operator!=(const Board &rhs) const {
    return !(*this == rhs);
}

ostream &operator<<(ostream &os, const Board &board) {
    int w = board.get_width(), h = board.get_height();
    vector<string> rows(h, string(w, '.'));
    Tile goal = board.get_goal();
    if (board.tile_exists(goal)) {
        rows[goal.y][goal.x] = 'G';
    }
    int letter = 0;
    for (const Piece& p : board.get_pieces()) {
        char c = p.is_marked() ? 'X' : static_cast<char>('a' + letter++ % 26);
        for (const Tile& t : p.occupies()) {
            if (board.tile_exists(t)) {
                rows[t.y][t.x] = c;
            }
        }
    }
    for (int y = 0; y < h; ++y) {
        os << rows[y];
        if (y + 1 < h) os << '\n';
    }
    return os;
}
