#include <sstream>
#include <stdexcept>
#include <string>

#include "move.hpp"

using namespace std;

const char *move_kind_name(MoveKind kind) {
    switch (kind) {
        case MoveKind::Left:  return "left";
        case MoveKind::Right: return "right";
        case MoveKind::Up:    return "up";
        case MoveKind::Down:  return "down";
    }
    throw invalid_argument("Unexpected move kind");
}

int Move::dx() const {
    switch (kind) {
        case MoveKind::Left:  return -steps;
        case MoveKind::Right: return steps;
        default:              return 0;
    }
}

int Move::dy() const {
    switch (kind) {
        case MoveKind::Up:   return -steps;
        case MoveKind::Down: return steps;
        default:             return 0;
    }
}

Move Move::inverse() const {
    Tile destination(origin.x + dx(), origin.y + dy());
    switch (kind) {
        case MoveKind::Left:  return Move::right(destination, steps);
        case MoveKind::Right: return Move::left(destination, steps);
        case MoveKind::Up:    return Move::down(destination, steps);
        case MoveKind::Down:  return Move::up(destination, steps);
    }
    throw invalid_argument("Unexpected move kind");
}

string Move::to_string() const {
    ostringstream ss;
    ss << *this;
    return ss.str();
}

ostream &operator<<(ostream &os, const Move &m) {
    return os << "Move " << m.origin << " " << move_kind_name(m.kind)
              << " by " << m.steps << " steps";
}
