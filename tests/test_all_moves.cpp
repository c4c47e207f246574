// Google Test for Board::all_moves
#include <gtest/gtest.h>
#include <map>
#include <random>
#include <tuple>
#include <vector>

#include "board.hpp"
#include "generate_sample_board.hpp"

// tiles a move sweeps over, i.e. the tiles that must have been empty
static std::vector<Tile> destination_tiles(const Board& b, const Move& m) {
    std::vector<Tile> tiles;
    for (const Piece& p : b.get_pieces()) {
        if (p.get_location() != m.get_tile()) continue;
        Tile lead = p.occupies().back();
        Tile tail = p.get_location();
        for (int i = 1; i <= m.steps; ++i) {
            switch (m.kind) {
                case MoveKind::Right: tiles.emplace_back(lead.x + i, lead.y); break;
                case MoveKind::Down:  tiles.emplace_back(lead.x, lead.y + i); break;
                case MoveKind::Left:  tiles.emplace_back(tail.x - i, tail.y); break;
                case MoveKind::Up:    tiles.emplace_back(tail.x, tail.y - i); break;
            }
        }
    }
    return tiles;
}

static std::vector<Board> probe_boards() {
    std::mt19937 rng(11);
    std::vector<Board> boards = {sample_board()};
    for (int depth = 1; depth <= 20; depth += 3) {
        boards.push_back(random_board_random_walk(sample_board(), depth, rng));
    }
    return boards;
}

TEST(AllMoves, EveryStepLengthIsOffered) {
    Board b(3, 1, Tile(2, 0), {Piece::marked_piece(Tile(0, 0), 1, Direction::Horizontal)});
    std::vector<Move> expected = {Move::right(Tile(0, 0), 1), Move::right(Tile(0, 0), 2)};
    EXPECT_EQ(b.all_moves(), expected);
}

TEST(AllMoves, HorizontalRightThenLeft) {
    Board b(5, 1, Tile(4, 0), {Piece(Tile(2, 0), 1, Direction::Horizontal)});
    std::vector<Move> expected = {
        Move::right(Tile(2, 0), 1), Move::right(Tile(2, 0), 2),
        Move::left(Tile(2, 0), 1), Move::left(Tile(2, 0), 2),
    };
    EXPECT_EQ(b.all_moves(), expected);
}

TEST(AllMoves, VerticalUpThenDown) {
    Board b(1, 4, Tile(0, 0), {Piece(Tile(0, 1), 2, Direction::Vertical)});
    std::vector<Move> expected = {Move::up(Tile(0, 1), 1), Move::down(Tile(0, 1), 1)};
    EXPECT_EQ(b.all_moves(), expected);
}

TEST(AllMoves, PieceAtOriginDoesNotProbeBelowZero) {
    Board b(2, 2, Tile(1, 1), {
        Piece(Tile(0, 0), 1, Direction::Horizontal),
        Piece(Tile(1, 0), 2, Direction::Vertical),
    });
    // the horizontal piece is boxed in by the wall and the vertical one,
    // the vertical piece fills its column
    EXPECT_TRUE(b.all_moves().empty());
}

TEST(AllMoves, BlockersStopTheProbe) {
    // . a . . X .
    Board b(6, 1, Tile(5, 0), {
        Piece(Tile(1, 0), 1, Direction::Horizontal),
        Piece::marked_piece(Tile(4, 0), 1, Direction::Horizontal),
    });
    std::vector<Move> expected = {
        Move::right(Tile(1, 0), 1), Move::right(Tile(1, 0), 2),
        Move::left(Tile(1, 0), 1),
        Move::right(Tile(4, 0), 1),
        Move::left(Tile(4, 0), 1), Move::left(Tile(4, 0), 2),
    };
    EXPECT_EQ(b.all_moves(), expected);
}

TEST(AllMoves, MovesFollowThePieceAxis) {
    for (const Board& b : probe_boards()) {
        std::map<std::pair<int, int>, Direction> axis;
        for (const Piece& p : b.get_pieces()) {
            axis[{p.get_location().x, p.get_location().y}] = p.get_direction();
        }
        for (const Move& m : b.all_moves()) {
            auto it = axis.find({m.origin.x, m.origin.y});
            ASSERT_TRUE(it != axis.end()) << m;
            bool horizontal_move = m.kind == MoveKind::Left || m.kind == MoveKind::Right;
            EXPECT_EQ(horizontal_move, it->second == Direction::Horizontal) << m;
        }
    }
}

TEST(AllMoves, DestinationsAreOnBoardAndWereEmpty) {
    for (const Board& b : probe_boards()) {
        for (const Move& m : b.all_moves()) {
            EXPECT_GE(m.steps, 1);
            auto tiles = destination_tiles(b, m);
            ASSERT_EQ(tiles.size(), static_cast<size_t>(m.steps)) << m;
            for (const Tile& t : tiles) {
                EXPECT_TRUE(b.tile_exists(t)) << m;
                EXPECT_TRUE(b.empty_tile(t)) << m;
            }
        }
    }
}

TEST(AllMoves, StepLengthsFormAPrefixUpToTheFirstObstruction) {
    for (const Board& b : probe_boards()) {
        // (origin x, origin y, kind) -> step lengths in generation order
        std::map<std::tuple<int, int, int>, std::vector<int>> runs;
        for (const Move& m : b.all_moves()) {
            runs[std::make_tuple(m.origin.x, m.origin.y, static_cast<int>(m.kind))].push_back(m.steps);
        }
        for (const auto& run : runs) {
            const std::vector<int>& steps = run.second;
            for (size_t i = 0; i < steps.size(); ++i) {
                EXPECT_EQ(steps[i], static_cast<int>(i) + 1);
            }
            // one more step would hit a piece or leave the board
            Move longest(static_cast<MoveKind>(std::get<2>(run.first)),
                         Tile(std::get<0>(run.first), std::get<1>(run.first)),
                         static_cast<int>(steps.size()) + 1);
            auto tiles = destination_tiles(b, longest);
            ASSERT_FALSE(tiles.empty());
            EXPECT_FALSE(b.empty_tile(tiles.back())) << longest;
        }
    }
}

TEST(AllMoves, FutureBoardsPairEachMoveWithItsResult) {
    Board b = sample_board();
    auto moves = b.all_moves();
    auto futures = b.future_boards();
    ASSERT_EQ(futures.size(), moves.size());
    for (size_t i = 0; i < moves.size(); ++i) {
        EXPECT_EQ(futures[i].second, moves[i]);
        EXPECT_EQ(futures[i].first, b.play(moves[i]));
    }
}
