#include <gtest/gtest.h>
#include "GameUtils.hpp"
#include "Move.hpp"

namespace {

Position at(const char* text) {
    return *hex::parsePosition(text);
}

} // namespace

class MoveTest : public ::testing::Test {
protected:
    std::string error;
};

TEST_F(MoveTest, MarbleOrderDoesNotMatter) {
    Move a({at("c5"), at("c3"), at("c4")}, hex::E);
    Move b({at("c3"), at("c4"), at("c5")}, hex::E);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.key(), b.key());
    EXPECT_EQ(a.marble(0), at("c3"));
    EXPECT_EQ(a.marble(2), at("c5"));
}

TEST_F(MoveTest, DirectionDistinguishesMoves) {
    Move a({at("c3"), at("c4")}, hex::E);
    Move b({at("c3"), at("c4")}, hex::W);
    EXPECT_NE(a, b);
    EXPECT_NE(a.key(), b.key());
}

TEST_F(MoveTest, InlineVersusBroadside) {
    EXPECT_TRUE(Move({at("e5")}, hex::NE).isInline());
    EXPECT_TRUE(Move({at("c3"), at("c4")}, hex::E).isInline());
    EXPECT_TRUE(Move({at("c3"), at("c4")}, hex::W).isInline());
    EXPECT_FALSE(Move({at("c3"), at("c4")}, hex::NW).isInline());
    EXPECT_FALSE(Move({at("c3"), at("c4")}, hex::SW).isInline());
    EXPECT_TRUE(Move({at("a1"), at("b2"), at("c3")}, hex::SW).isInline());
}

TEST_F(MoveTest, LeadingAndTrailing) {
    Move east({at("c3"), at("c4"), at("c5")}, hex::E);
    EXPECT_EQ(east.leadingAndTrailing().first, at("c3"));
    EXPECT_EQ(east.leadingAndTrailing().second, at("c5"));

    Move west({at("c3"), at("c4"), at("c5")}, hex::W);
    EXPECT_EQ(west.leadingAndTrailing().first, at("c5"));
    EXPECT_EQ(west.leadingAndTrailing().second, at("c3"));

    std::vector<Position> ordered = west.marblesLeadingFirst();
    ASSERT_EQ(ordered.size(), 3u);
    EXPECT_EQ(ordered[0], at("c3"));
    EXPECT_EQ(ordered[2], at("c5"));
}

TEST_F(MoveTest, ContiguousLine) {
    EXPECT_TRUE(Move({at("e5")}, hex::E).isContiguousLine());
    EXPECT_TRUE(Move({at("e5"), at("f6"), at("g7")}, hex::E).isContiguousLine());
    EXPECT_FALSE(Move({at("e5"), at("e7")}, hex::E).isContiguousLine());
    EXPECT_FALSE(Move({at("e5"), at("e6"), at("e8")}, hex::E).isContiguousLine());
    // (1,-1) is not a hex axis
    EXPECT_FALSE(Move({at("e5"), at("f4")}, hex::E).isContiguousLine());
}

TEST_F(MoveTest, WrongCountIsInvalid) {
    EXPECT_FALSE(Move().isValid());
    EXPECT_FALSE(Move(std::vector<Position>{}, hex::E).isValid());
    EXPECT_FALSE(Move({at("e1"), at("e2"), at("e3"), at("e4")}, hex::E).isValid());
}

TEST_F(MoveTest, InlineNotation) {
    EXPECT_EQ(Move({at("e5")}, hex::E).toNotation(), "1:e5e6");
    EXPECT_EQ(Move({at("a1"), at("b1"), at("c1")}, hex::NW).toNotation(), "3:a1d1");
    EXPECT_EQ(Move({at("c3"), at("c4")}, hex::W).toNotation(), "2:c4c2");
    EXPECT_EQ(Move({at("c3"), at("c4")}, hex::E).toNotation(true), "2:c3c5*");
}

TEST_F(MoveTest, BroadsideNotation) {
    EXPECT_EQ(Move({at("c4"), at("c3")}, hex::NW).toNotation(), "2:c3-c4>NW");
    EXPECT_EQ(Move({at("e5"), at("e6"), at("e7")}, hex::SE).toNotation(), "3:e5-e7>SE");
    // Push marker only applies to inline moves
    EXPECT_EQ(Move({at("c4"), at("c3")}, hex::NW).toNotation(true), "2:c3-c4>NW");
}

TEST_F(MoveTest, FromPartsAcceptsLine) {
    auto move = Move::fromParts({at("e7"), at("e5"), at("e6")}, hex::NE, error);
    ASSERT_TRUE(move.has_value());
    EXPECT_TRUE(error.empty());
    EXPECT_EQ(move->count(), 3);
    EXPECT_FALSE(move->isInline());
}

TEST_F(MoveTest, FromPartsReasons) {
    EXPECT_FALSE(Move::fromParts({}, hex::E, error).has_value());
    EXPECT_EQ(error, "Move must contain between 1 and 3 marbles.");

    EXPECT_FALSE(Move::fromParts({at("e1"), at("e2"), at("e3"), at("e4")}, hex::E, error).has_value());
    EXPECT_EQ(error, "Move must contain between 1 and 3 marbles.");

    EXPECT_FALSE(Move::fromParts({at("e5"), at("e5")}, hex::E, error).has_value());
    EXPECT_EQ(error, "Move contains duplicate marbles.");

    EXPECT_FALSE(Move::fromParts({Position(0, 7)}, hex::E, error).has_value());
    EXPECT_EQ(error, "Marble position is not on the board.");

    EXPECT_FALSE(Move::fromParts({at("e5")}, Direction(1, -1), error).has_value());
    EXPECT_EQ(error, "Direction is not one of the six hex directions.");

    EXPECT_FALSE(Move::fromParts({at("e5"), at("e7")}, hex::E, error).has_value());
    EXPECT_EQ(error, "Marbles must form a contiguous line.");
}

TEST_F(MoveTest, ParseInlineNotation) {
    auto move = GameUtils::parseMove("3:a1d1");
    ASSERT_TRUE(move.has_value());
    EXPECT_EQ(*move, Move({at("a1"), at("b1"), at("c1")}, hex::NW));

    auto west = GameUtils::parseMove("2:c4c2");
    ASSERT_TRUE(west.has_value());
    EXPECT_EQ(*west, Move({at("c3"), at("c4")}, hex::W));

    auto pushed = GameUtils::parseMove(" 2:C3C5* ");
    ASSERT_TRUE(pushed.has_value());
    EXPECT_EQ(*pushed, Move({at("c3"), at("c4")}, hex::E));
}

TEST_F(MoveTest, ParseBroadsideNotation) {
    auto move = GameUtils::parseMove("3:e5-e7>NW");
    ASSERT_TRUE(move.has_value());
    EXPECT_EQ(*move, Move({at("e5"), at("e6"), at("e7")}, hex::NW));

    auto reversed = GameUtils::parseMove("2:c4-c3>nw");
    ASSERT_TRUE(reversed.has_value());
    EXPECT_EQ(*reversed, Move({at("c3"), at("c4")}, hex::NW));
}

TEST_F(MoveTest, ParseRejectsMalformedText) {
    EXPECT_FALSE(GameUtils::parseMove("").has_value());
    EXPECT_FALSE(GameUtils::parseMove("e5e6").has_value());
    EXPECT_FALSE(GameUtils::parseMove("4:a1e1").has_value());
    EXPECT_FALSE(GameUtils::parseMove("2:a1a2").has_value());
    EXPECT_FALSE(GameUtils::parseMove("2:c3-c5>NW").has_value());
    EXPECT_FALSE(GameUtils::parseMove("2:c3-c4>N").has_value());
    EXPECT_FALSE(GameUtils::parseMove("1:z5e6").has_value());
}

TEST_F(MoveTest, NotationParsesBack) {
    std::vector<Move> samples = {
        Move({at("e5")}, hex::SW),
        Move({at("g5"), at("h6")}, hex::NE),
        Move({at("d2"), at("d3"), at("d4")}, hex::SE),
        Move({at("b2"), at("c2"), at("d2")}, hex::E),
    };
    for (const auto& move : samples) {
        auto parsed = GameUtils::parseMove(move.toNotation());
        ASSERT_TRUE(parsed.has_value()) << move.toNotation();
        EXPECT_EQ(*parsed, move) << move.toNotation();
    }
}

TEST_F(MoveTest, BuildMoveFromStrings) {
    auto move = GameUtils::buildMove({"c3", "c4", "c5"}, 0, 1, error);
    ASSERT_TRUE(move.has_value());
    EXPECT_EQ(move->toNotation(), "3:c3c6");

    EXPECT_FALSE(GameUtils::buildMove({"c3", "zz"}, 0, 1, error).has_value());
    EXPECT_EQ(error, "Malformed marble position 'zz'.");

    EXPECT_FALSE(GameUtils::buildMove({"c3", "c4"}, 2, 0, error).has_value());
    EXPECT_EQ(error, "Direction is not one of the six hex directions.");
}
