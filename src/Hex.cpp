#include "Hex.hpp"
#include <cctype>
#include <cstdlib>

namespace hex {

namespace {

constexpr int MAX_COL = 10; // columns 1..9, slot 0 unused
constexpr const char* ROW_LETTERS = "abcdefghi";
constexpr const char* DIRECTION_NAMES[NUM_DIRECTIONS] = {"E", "W", "NW", "SE", "NE", "SW"};

// Position <-> index tables, built once on first use
struct CellTable {
    int indexOf[NUM_ROWS][MAX_COL];
    std::array<Position, NUM_CELLS> positions;

    CellTable() {
        int next = 0;
        for (int r = 0; r < NUM_ROWS; r++) {
            for (int c = 0; c < MAX_COL; c++) {
                indexOf[r][c] = -1;
            }
            int first = (r <= 4) ? 1 : r - 3;
            int last = (r <= 4) ? 5 + r : 9;
            for (int c = first; c <= last; c++) {
                indexOf[r][c] = next;
                positions[next] = Position(r, c);
                next++;
            }
        }
    }

    static const CellTable& instance() {
        static const CellTable table;
        return table;
    }
};

} // namespace

bool isValid(Position pos) {
    return index(pos) >= 0;
}

int index(Position pos) {
    if (pos.row < 0 || pos.row >= NUM_ROWS || pos.col < 0 || pos.col >= MAX_COL) {
        return -1;
    }
    return CellTable::instance().indexOf[pos.row][pos.col];
}

Position positionAt(int cellIndex) {
    if (cellIndex < 0 || cellIndex >= NUM_CELLS) {
        return Position();
    }
    return CellTable::instance().positions[cellIndex];
}

const std::array<Position, NUM_CELLS>& validPositions() {
    return CellTable::instance().positions;
}

int directionIndex(Direction dir) {
    for (int i = 0; i < NUM_DIRECTIONS; i++) {
        if (DIRECTIONS[i] == dir) {
            return i;
        }
    }
    return -1;
}

const char* directionName(Direction dir) {
    int i = directionIndex(dir);
    return i >= 0 ? DIRECTION_NAMES[i] : "?";
}

std::optional<Direction> parseDirection(const std::string& name) {
    std::string upper;
    for (char ch : name) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    for (int i = 0; i < NUM_DIRECTIONS; i++) {
        if (upper == DIRECTION_NAMES[i]) {
            return DIRECTIONS[i];
        }
    }
    return std::nullopt;
}

std::string toString(Position pos) {
    if (!isValid(pos)) {
        return "??";
    }
    return std::string(1, ROW_LETTERS[pos.row]) + std::to_string(pos.col);
}

std::optional<Position> parsePosition(const std::string& text) {
    if (text.size() != 2) {
        return std::nullopt;
    }
    char rowChar = static_cast<char>(std::tolower(static_cast<unsigned char>(text[0])));
    if (rowChar < 'a' || rowChar > 'i' || !std::isdigit(static_cast<unsigned char>(text[1]))) {
        return std::nullopt;
    }
    Position pos(rowChar - 'a', text[1] - '0');
    if (!isValid(pos)) {
        return std::nullopt;
    }
    return pos;
}

int distanceFromCenter(Position pos) {
    return std::abs(pos.row - CENTER.row) + std::abs(pos.col - CENTER.col);
}

} // namespace hex
