#include <vector>

#include "piece.hpp"

using namespace std;

Piece::Piece(Tile location, int size, Direction direction, bool marked)
    : size(size), location(location), direction(direction), marked(marked) {
}

Piece Piece::marked_piece(Tile location, int size, Direction direction) {
    return Piece(location, size, direction, true);
}

Tile Piece::get_location() const {
    return location;
}

int Piece::get_size() const {
    return size;
}

Direction Piece::get_direction() const {
    return direction;
}

bool Piece::is_marked() const {
    return marked;
}

vector<Tile> Piece::occupies() const {
    vector<Tile> tiles;
    tiles.reserve(size);
    for (int i = 0; i < size; ++i) {
        if (direction == Direction::Horizontal) {
            tiles.emplace_back(location.x + i, location.y);
        } else {
            tiles.emplace_back(location.x, location.y + i);
        }
    }
    return tiles;
}

Piece Piece::moved_by(int dx, int dy) const {
    return Piece(Tile(location.x + dx, location.y + dy), size, direction, marked);
}

size_t Piece::hash() const {
    // FNV-1a over the four fields
    size_t h = 1469598103934665603ULL;
    const size_t fields[] = {
        static_cast<size_t>(location.x),
        static_cast<size_t>(location.y),
        static_cast<size_t>(size),
        static_cast<size_t>(direction == Direction::Horizontal ? 1 : 2) | (marked ? 4 : 0)
    };
    for (size_t v : fields) {
        h ^= v + 1;
        h *= 1099511628211ULL;
    }
    return h;
}

bool Piece::operator==(const Piece &rhs) const {
    return size == rhs.size && location == rhs.location &&
           direction == rhs.direction && marked == rhs.marked;
}

bool Piece::operator!=(const Piece &rhs) const {
    return !(*this == rhs);
}
