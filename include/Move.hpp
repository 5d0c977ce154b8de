#ifndef MOVE_HPP
#define MOVE_HPP

#include "Hex.hpp"
#include <array>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// A line of 1-3 marbles and a movement direction.
// Marbles are stored sorted, so equality is independent of input order.
class Move {
public:
    static constexpr int MAX_MARBLES = 3;

    Move() = default;
    Move(std::initializer_list<Position> marbles, Direction direction);
    Move(const std::vector<Position>& marbles, Direction direction);

    // Builds a move from collaborator input, rejecting malformed shapes.
    // On failure returns nullopt and fills error with the violated rule.
    static std::optional<Move> fromParts(const std::vector<Position>& marbles, Direction direction,
                                         std::string& error);

    int count() const { return count_; }
    bool isValid() const { return count_ > 0; }
    bool isInline() const { return inline_; }
    Direction direction() const { return direction_; }
    Position marble(int i) const { return marbles_[i]; }
    std::vector<Position> marbles() const { return std::vector<Position>(marbles_.begin(), marbles_.begin() + count_); }

    // True when the sorted marbles step along one hex direction without gaps
    bool isContiguousLine() const;

    // {trailing, leading} by projection onto the direction vector
    std::pair<Position, Position> leadingAndTrailing() const;

    // Marbles ordered leading first
    std::vector<Position> marblesLeadingFirst() const;

    std::string toNotation(bool pushed = false) const;

    // Packed (sorted marbles, direction) identity
    uint32_t key() const;

    bool operator==(const Move& other) const;
    bool operator!=(const Move& other) const { return !(*this == other); }

private:
    void init(const Position* first, int n, Direction direction);

    std::array<Position, MAX_MARBLES> marbles_{};
    uint8_t count_ = 0;
    Direction direction_{};
    bool inline_ = false;
};

#endif // MOVE_HPP
