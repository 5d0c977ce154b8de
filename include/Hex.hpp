#ifndef HEX_HPP
#define HEX_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>

// Board coordinates
//   rows a (0) at the bottom to i (8) at the top
//   row r spans columns 1..5+r for r <= 4 and r-3..9 above the middle row
//
//            i5 i6 i7 i8 i9
//          h4 h5 h6 h7 h8 h9
//            ...
//        e1 e2 e3 e4 e5 e6 e7 e8 e9
//            ...
//            a1 a2 a3 a4 a5

struct Position {
    int row = -1;
    int col = -1;

    constexpr Position() = default;
    constexpr Position(int r, int c) : row(r), col(c) {}

    constexpr bool operator==(const Position& other) const { return row == other.row && col == other.col; }
    constexpr bool operator!=(const Position& other) const { return !(*this == other); }
    constexpr bool operator<(const Position& other) const {
        return row < other.row || (row == other.row && col < other.col);
    }
};

struct Direction {
    int drow = 0;
    int dcol = 0;

    constexpr Direction() = default;
    constexpr Direction(int dr, int dc) : drow(dr), dcol(dc) {}

    constexpr bool operator==(const Direction& other) const { return drow == other.drow && dcol == other.dcol; }
    constexpr bool operator!=(const Direction& other) const { return !(*this == other); }
};

namespace hex {

constexpr int NUM_ROWS = 9;
constexpr int NUM_CELLS = 61;
constexpr int NUM_DIRECTIONS = 6;

// Canonical order: E, W, NW, SE, NE, SW
constexpr Direction E{0, 1};
constexpr Direction W{0, -1};
constexpr Direction NW{1, 0};
constexpr Direction SE{-1, 0};
constexpr Direction NE{1, 1};
constexpr Direction SW{-1, -1};

constexpr std::array<Direction, NUM_DIRECTIONS> DIRECTIONS = {E, W, NW, SE, NE, SW};

// One direction per axis, used to anchor lines at their lowest marble
constexpr std::array<Direction, 3> POSITIVE_DIRECTIONS = {E, NW, NE};

constexpr Position CENTER{4, 5};

inline Position neighbor(Position pos, Direction dir) {
    return Position(pos.row + dir.drow, pos.col + dir.dcol);
}

inline Direction opposite(Direction dir) {
    return Direction(-dir.drow, -dir.dcol);
}

// Scalar projection used to order marbles along a movement direction
inline int projection(Position pos, Direction dir) {
    return pos.row * dir.drow + pos.col * dir.dcol;
}

bool isValid(Position pos);

// Dense cell index in [0, NUM_CELLS), -1 for off-board positions
int index(Position pos);
Position positionAt(int cellIndex);

const std::array<Position, NUM_CELLS>& validPositions();

// -1 unless dir is one of the six canonical vectors
int directionIndex(Direction dir);
inline bool isDirection(Direction dir) { return directionIndex(dir) >= 0; }

const char* directionName(Direction dir);
std::optional<Direction> parseDirection(const std::string& name);

std::string toString(Position pos);
std::optional<Position> parsePosition(const std::string& text);

int distanceFromCenter(Position pos);

} // namespace hex

#endif // HEX_HPP
