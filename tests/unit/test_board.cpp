#include <gtest/gtest.h>
#include "Board.hpp"
#include <stdexcept>

namespace {

Position at(const char* text) {
    return *hex::parsePosition(text);
}

} // namespace

class BoardTest : public ::testing::Test {
protected:
    Board board;

    void place(std::initializer_list<const char*> cells, Board::Player player) {
        for (const char* cell : cells) {
            board.set(at(cell), player);
        }
    }

    int totalMarbles(Board::Player player) const {
        return board.marbleCount(player) + board.getScore(Board::opponent(player));
    }
};

// ============================================================================
// Setup
// ============================================================================

TEST_F(BoardTest, EmptyBoard) {
    EXPECT_EQ(board.marbleCount(Board::BLACK), 0);
    EXPECT_EQ(board.marbleCount(Board::WHITE), 0);
    EXPECT_EQ(board.getScore(Board::BLACK), 0);
    EXPECT_FALSE(board.isGameOver());
    EXPECT_EQ(board.get(Position(0, 0)), Board::NONE);
}

TEST_F(BoardTest, StandardLayout) {
    board.setupStandard();
    EXPECT_EQ(board.marbleCount(Board::BLACK), 14);
    EXPECT_EQ(board.marbleCount(Board::WHITE), 14);
    EXPECT_EQ(board.get(at("a1")), Board::BLACK);
    EXPECT_EQ(board.get(at("c5")), Board::BLACK);
    EXPECT_EQ(board.get(at("c6")), Board::NONE);
    EXPECT_EQ(board.get(at("i9")), Board::WHITE);
    EXPECT_EQ(board.get(at("g5")), Board::WHITE);
    EXPECT_EQ(board.get(at("e5")), Board::NONE);
}

TEST_F(BoardTest, AllLayoutsHaveFourteenEach) {
    for (const auto& name : Board::layoutNames()) {
        board.setupLayout(name);
        EXPECT_EQ(board.marbleCount(Board::BLACK), Board::MARBLES_PER_SIDE) << name;
        EXPECT_EQ(board.marbleCount(Board::WHITE), Board::MARBLES_PER_SIDE) << name;
    }
    EXPECT_EQ(Board::layoutNames().size(), 3u);
}

TEST_F(BoardTest, UnknownLayoutThrows) {
    EXPECT_THROW(board.setupLayout("hexagon"), std::invalid_argument);
}

TEST_F(BoardTest, MarblesAreSorted) {
    board.setupStandard();
    std::vector<Position> marbles = board.getMarbles(Board::WHITE);
    ASSERT_EQ(marbles.size(), 14u);
    for (size_t i = 1; i < marbles.size(); i++) {
        EXPECT_TRUE(marbles[i - 1] < marbles[i]);
    }
}

TEST_F(BoardTest, CloneIsIndependent) {
    board.setupStandard();
    Board copy = board.clone();
    EXPECT_EQ(copy, board);
    copy.set(at("e5"), Board::BLACK);
    EXPECT_NE(copy, board);
    EXPECT_EQ(board.get(at("e5")), Board::NONE);
}

TEST_F(BoardTest, WinnerAtSixPushOffs) {
    board.setScore(Board::WHITE, 5);
    EXPECT_FALSE(board.isGameOver());
    board.setScore(Board::WHITE, 6);
    EXPECT_TRUE(board.isGameOver());
    EXPECT_EQ(board.getWinner(), Board::WHITE);
}

// ============================================================================
// Sumito
// ============================================================================

TEST_F(BoardTest, ThreePushesTwoIntoEmptyCell) {
    place({"e3", "e4", "e5"}, Board::BLACK);
    place({"e6", "e7"}, Board::WHITE);
    Move move({at("e3"), at("e4"), at("e5")}, hex::E);

    ASSERT_TRUE(board.isLegalMove(move, Board::BLACK));
    EXPECT_TRUE(board.wouldPush(move, Board::BLACK));

    Board::ApplyResult result;
    ASSERT_TRUE(board.makeMove(move, Board::BLACK, &result));
    EXPECT_FALSE(result.pushOff);
    ASSERT_EQ(result.pushed.size(), 2u);
    EXPECT_EQ(result.pushed[0], at("e6"));

    EXPECT_EQ(board.getMarbles(Board::WHITE), (std::vector<Position>{at("e7"), at("e8")}));
    EXPECT_EQ(board.getMarbles(Board::BLACK), (std::vector<Position>{at("e4"), at("e5"), at("e6")}));
    EXPECT_EQ(board.getScore(Board::BLACK), 0);
}

TEST_F(BoardTest, PushAtRowEndScores) {
    // Row c ends at c7, so the second white marble leaves the board
    place({"c3", "c4", "c5"}, Board::BLACK);
    place({"c6", "c7"}, Board::WHITE);
    Move move({at("c3"), at("c4"), at("c5")}, hex::E);

    Board::ApplyResult result;
    ASSERT_TRUE(board.makeMove(move, Board::BLACK, &result));
    EXPECT_TRUE(result.pushOff);
    EXPECT_EQ(board.getScore(Board::BLACK), 1);
    EXPECT_EQ(board.getMarbles(Board::WHITE), (std::vector<Position>{at("c7")}));
    EXPECT_EQ(board.getMarbles(Board::BLACK), (std::vector<Position>{at("c4"), at("c5"), at("c6")}));
}

TEST_F(BoardTest, EqualLinesCannotPush) {
    place({"e3", "e4", "e5"}, Board::BLACK);
    place({"e6", "e7", "e8"}, Board::WHITE);
    Move move({at("e3"), at("e4"), at("e5")}, hex::E);

    Board::MoveCheck check = board.checkMove(move, Board::BLACK);
    EXPECT_FALSE(check.legal);
    EXPECT_EQ(check.error, Board::MoveError::OUTNUMBERED);
    EXPECT_EQ(check.reason, "Pushing line must outnumber the opposing line.");
}

TEST_F(BoardTest, SingleMarbleCannotPush) {
    place({"e4"}, Board::BLACK);
    place({"e5"}, Board::WHITE);
    EXPECT_EQ(board.checkMove(Move({at("e4")}, hex::E), Board::BLACK).error, Board::MoveError::OUTNUMBERED);
}

TEST_F(BoardTest, PushBlockedByOwnMarbleBehind) {
    place({"e2", "e3", "e4"}, Board::BLACK);
    place({"e5", "e6"}, Board::WHITE);
    place({"e7"}, Board::BLACK);
    Move move({at("e2"), at("e3"), at("e4")}, hex::E);
    EXPECT_EQ(board.checkMove(move, Board::BLACK).error, Board::MoveError::PUSH_BLOCKED);
}

TEST_F(BoardTest, OpponentChainBrokenByOwnMarble) {
    // White, Black, White ahead: the sandwich cannot be pushed
    place({"e2", "e3", "e4"}, Board::BLACK);
    place({"e5"}, Board::WHITE);
    place({"e6"}, Board::BLACK);
    place({"e7"}, Board::WHITE);
    Move move({at("e2"), at("e3"), at("e4")}, hex::E);
    EXPECT_FALSE(board.isLegalMove(move, Board::BLACK));
}

TEST_F(BoardTest, SelfPushIsIllegal) {
    place({"e4", "e5", "e6"}, Board::BLACK);
    Move move({at("e4"), at("e5")}, hex::E);
    EXPECT_EQ(board.checkMove(move, Board::BLACK).error, Board::MoveError::SELF_PUSH);
}

TEST_F(BoardTest, OwnMarbleCannotLeaveBoard) {
    place({"a1"}, Board::BLACK);
    EXPECT_EQ(board.checkMove(Move({at("a1")}, hex::W), Board::BLACK).error, Board::MoveError::OFF_BOARD);
    EXPECT_EQ(board.checkMove(Move({at("a1")}, hex::SE), Board::BLACK).error, Board::MoveError::OFF_BOARD);
    EXPECT_TRUE(board.isLegalMove(Move({at("a1")}, hex::E), Board::BLACK));
}

TEST_F(BoardTest, PushOffConservesMarbles) {
    place({"a3", "a4", "a5"}, Board::WHITE);
    place({"a1", "a2"}, Board::BLACK);
    Move triple({at("a3"), at("a4"), at("a5")}, hex::W);
    ASSERT_TRUE(board.isLegalMove(triple, Board::WHITE));

    int before = totalMarbles(Board::BLACK);
    Board::ApplyResult result = board.applyMove(triple, Board::WHITE);
    EXPECT_TRUE(result.pushOff);
    EXPECT_EQ(board.getScore(Board::WHITE), 1);
    EXPECT_EQ(totalMarbles(Board::BLACK), before);
    EXPECT_EQ(board.get(at("a1")), Board::BLACK);
    EXPECT_EQ(board.get(at("a2")), Board::WHITE);
    EXPECT_EQ(board.marbleCount(Board::WHITE), 3);
}

// ============================================================================
// Broadside
// ============================================================================

TEST_F(BoardTest, BroadsideIntoOccupiedCell) {
    place({"a1", "a2"}, Board::BLACK);
    place({"b1"}, Board::WHITE);
    Move move({at("a1"), at("a2")}, hex::NW);

    Board::MoveCheck check = board.checkMove(move, Board::BLACK);
    EXPECT_FALSE(check.legal);
    EXPECT_EQ(check.error, Board::MoveError::DESTINATION_OCCUPIED);

    // Own marble in the way is also blocked
    board.set(at("b1"), Board::BLACK);
    EXPECT_FALSE(board.isLegalMove(move, Board::BLACK));
}

TEST_F(BoardTest, BroadsideOffBoard) {
    place({"a1", "a2"}, Board::BLACK);
    EXPECT_EQ(board.checkMove(Move({at("a1"), at("a2")}, hex::SE), Board::BLACK).error,
              Board::MoveError::OFF_BOARD);
}

TEST_F(BoardTest, BroadsideTouchesOnlyOriginsAndDestinations) {
    board.setupStandard();
    Board before = board;
    Move move({at("c3"), at("c4"), at("c5")}, hex::NE);
    ASSERT_TRUE(board.makeMove(move, Board::BLACK));

    for (const auto& pos : hex::validPositions()) {
        bool origin = (pos == at("c3") || pos == at("c4") || pos == at("c5"));
        bool dest = (pos == at("d4") || pos == at("d5") || pos == at("d6"));
        if (origin) {
            EXPECT_EQ(board.get(pos), Board::NONE) << hex::toString(pos);
        } else if (dest) {
            EXPECT_EQ(board.get(pos), Board::BLACK) << hex::toString(pos);
        } else {
            EXPECT_EQ(board.get(pos), before.get(pos)) << hex::toString(pos);
        }
    }
    EXPECT_EQ(board.marbleCount(Board::BLACK), 14);
}

// ============================================================================
// Shape and ownership
// ============================================================================

TEST_F(BoardTest, MustOwnEveryMarble) {
    board.setupStandard();
    EXPECT_EQ(board.checkMove(Move({at("e5")}, hex::E), Board::BLACK).error, Board::MoveError::NOT_OWNED);
    EXPECT_EQ(board.checkMove(Move({at("i9")}, hex::W), Board::BLACK).error, Board::MoveError::NOT_OWNED);
    EXPECT_EQ(board.checkMove(Move({at("c5"), at("c6")}, hex::W), Board::BLACK).error,
              Board::MoveError::NOT_OWNED);
}

TEST_F(BoardTest, GapInLineIsIllegal) {
    place({"e3", "e5"}, Board::BLACK);
    EXPECT_EQ(board.checkMove(Move({at("e3"), at("e5")}, hex::NW), Board::BLACK).error,
              Board::MoveError::NOT_IN_LINE);
}

TEST_F(BoardTest, BadDirectionIsIllegal) {
    place({"e5"}, Board::BLACK);
    EXPECT_EQ(board.checkMove(Move({at("e5")}, Direction(1, -1)), Board::BLACK).error,
              Board::MoveError::BAD_DIRECTION);
}

TEST_F(BoardTest, IllegalMakeMoveLeavesBoardUntouched) {
    board.setupStandard();
    Board before = board;
    EXPECT_FALSE(board.makeMove(Move({at("a1")}, hex::W), Board::BLACK));
    EXPECT_EQ(board, before);
}

TEST_F(BoardTest, StringShowsScoreAndRows) {
    board.setupStandard();
    std::string text = board.toString();
    EXPECT_NE(text.find("Score: Black(@@) 0 - 0 White(OO)"), std::string::npos);
    EXPECT_NE(text.find("e5"), std::string::npos);
    EXPECT_EQ(text.find("a1"), std::string::npos);
}
