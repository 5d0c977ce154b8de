#include "Board.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

// ============================================================================
// Starting layouts
// ============================================================================

namespace {

struct Layout {
    const char* name;
    std::array<Position, Board::MARBLES_PER_SIDE> black;
    std::array<Position, Board::MARBLES_PER_SIDE> white;
};

const Layout LAYOUTS[] = {
    {"standard",
     {{{0, 1}, {0, 2}, {0, 3}, {0, 4}, {0, 5},
       {1, 1}, {1, 2}, {1, 3}, {1, 4}, {1, 5}, {1, 6},
       {2, 3}, {2, 4}, {2, 5}}},
     {{{6, 5}, {6, 6}, {6, 7},
       {7, 4}, {7, 5}, {7, 6}, {7, 7}, {7, 8}, {7, 9},
       {8, 5}, {8, 6}, {8, 7}, {8, 8}, {8, 9}}}},
    {"belgian_daisy",
     {{{0, 1}, {0, 2}, {1, 1}, {1, 2}, {1, 3}, {2, 1}, {2, 2},
       {6, 8}, {6, 9}, {7, 7}, {7, 8}, {7, 9}, {8, 8}, {8, 9}}},
     {{{0, 4}, {0, 5}, {1, 4}, {1, 5}, {1, 6}, {2, 6}, {2, 7},
       {6, 3}, {6, 4}, {7, 4}, {7, 5}, {7, 6}, {8, 5}, {8, 6}}}},
    {"german_daisy",
     {{{1, 1}, {1, 2}, {2, 1}, {2, 2}, {2, 3}, {3, 1}, {3, 2},
       {5, 8}, {5, 9}, {6, 7}, {6, 8}, {6, 9}, {7, 8}, {7, 9}}},
     {{{1, 5}, {1, 6}, {2, 5}, {2, 6}, {2, 7}, {3, 7}, {3, 8},
       {5, 2}, {5, 3}, {6, 3}, {6, 4}, {6, 5}, {7, 4}, {7, 5}}}},
};

} // namespace

std::vector<std::string> Board::layoutNames() {
    std::vector<std::string> names;
    for (const auto& layout : LAYOUTS) {
        names.emplace_back(layout.name);
    }
    return names;
}

const char* Board::moveErrorMessage(MoveError error) {
    switch (error) {
    case MoveError::NONE:
        return "";
    case MoveError::MALFORMED:
        return "Move must contain between 1 and 3 marbles.";
    case MoveError::BAD_DIRECTION:
        return "Direction is not one of the six hex directions.";
    case MoveError::NOT_OWNED:
        return "Every marble in the move must belong to the player.";
    case MoveError::NOT_IN_LINE:
        return "Marbles must form a contiguous line.";
    case MoveError::OFF_BOARD:
        return "A marble cannot move off the board.";
    case MoveError::SELF_PUSH:
        return "A line cannot push its own marbles.";
    case MoveError::OUTNUMBERED:
        return "Pushing line must outnumber the opposing line.";
    case MoveError::PUSH_BLOCKED:
        return "No free cell behind the pushed marbles.";
    case MoveError::DESTINATION_OCCUPIED:
        return "Broadside destination is occupied.";
    }
    return "Illegal move.";
}

// ============================================================================
// Setup and access
// ============================================================================

Board::Board() {
    clear();
}

void Board::clear() {
    cells.fill(NONE);
    blackScore = 0;
    whiteScore = 0;
}

void Board::setupStandard() {
    setupLayout("standard");
}

void Board::setupLayout(const std::string& name) {
    for (const auto& layout : LAYOUTS) {
        if (name == layout.name) {
            clear();
            for (const auto& pos : layout.black) {
                set(pos, BLACK);
            }
            for (const auto& pos : layout.white) {
                set(pos, WHITE);
            }
            return;
        }
    }
    throw std::invalid_argument("Unknown layout: " + name);
}

Board::Player Board::get(Position pos) const {
    int i = hex::index(pos);
    return i >= 0 ? cells[i] : NONE;
}

void Board::set(Position pos, Player player) {
    int i = hex::index(pos);
    if (i >= 0) {
        cells[i] = player;
    }
}

void Board::setScore(Player player, int score) {
    if (player == BLACK) {
        blackScore = score;
    } else if (player == WHITE) {
        whiteScore = score;
    }
}

int Board::marbleCount(Player player) const {
    return static_cast<int>(std::count(cells.begin(), cells.end(), player));
}

std::vector<Position> Board::getMarbles(Player player) const {
    // Cell indices run in sorted (row, col) order
    std::vector<Position> marbles;
    marbles.reserve(MARBLES_PER_SIDE);
    for (int i = 0; i < hex::NUM_CELLS; i++) {
        if (cells[i] == player) {
            marbles.push_back(hex::positionAt(i));
        }
    }
    return marbles;
}

bool Board::isGameOver() const {
    return getWinner() != NONE;
}

Board::Player Board::getWinner() const {
    if (blackScore >= WINNING_SCORE) return BLACK;
    if (whiteScore >= WINNING_SCORE) return WHITE;
    return NONE;
}

// ============================================================================
// Legality
// ============================================================================

bool Board::isLegalMove(const Move& move, Player player) const {
    return legality(move, player) == MoveError::NONE;
}

Board::MoveCheck Board::checkMove(const Move& move, Player player) const {
    MoveCheck check;
    check.error = legality(move, player);
    check.legal = (check.error == MoveError::NONE);
    check.reason = moveErrorMessage(check.error);
    return check;
}

Board::MoveError Board::legality(const Move& move, Player player) const {
    if (!move.isValid()) {
        return MoveError::MALFORMED;
    }
    if (!hex::isDirection(move.direction())) {
        return MoveError::BAD_DIRECTION;
    }

    for (int i = 0; i < move.count(); i++) {
        if (get(move.marble(i)) != player) {
            return MoveError::NOT_OWNED;
        }
    }

    if (!move.isContiguousLine()) {
        return MoveError::NOT_IN_LINE;
    }

    return move.isInline() ? checkInline(move, player) : checkBroadside(move);
}

Board::MoveError Board::checkInline(const Move& move, Player player) const {
    Direction d = move.direction();
    Position leading = move.leadingAndTrailing().second;
    Position ahead = hex::neighbor(leading, d);

    if (!hex::isValid(ahead)) {
        return MoveError::OFF_BOARD;
    }

    Player target = get(ahead);
    if (target == NONE) {
        return MoveError::NONE;
    }
    if (target == player) {
        return MoveError::SELF_PUSH;
    }

    // Sumito: count the opposing chain
    Player opp = opponent(player);
    int pushedCount = 0;
    Position pos = ahead;
    while (hex::isValid(pos) && get(pos) == opp) {
        pushedCount++;
        pos = hex::neighbor(pos, d);
    }

    if (pushedCount >= move.count()) {
        return MoveError::OUTNUMBERED;
    }
    if (hex::isValid(pos) && get(pos) != NONE) {
        return MoveError::PUSH_BLOCKED;
    }
    return MoveError::NONE;
}

Board::MoveError Board::checkBroadside(const Move& move) const {
    Direction d = move.direction();
    for (int i = 0; i < move.count(); i++) {
        Position dest = hex::neighbor(move.marble(i), d);
        if (!hex::isValid(dest)) {
            return MoveError::OFF_BOARD;
        }
        if (get(dest) != NONE) {
            return MoveError::DESTINATION_OCCUPIED;
        }
    }
    return MoveError::NONE;
}

bool Board::wouldPush(const Move& move, Player player) const {
    if (!move.isInline() || move.count() < 2) {
        return false;
    }
    Position ahead = hex::neighbor(move.leadingAndTrailing().second, move.direction());
    return hex::isValid(ahead) && get(ahead) == opponent(player);
}

// ============================================================================
// Apply
// ============================================================================

Board::ApplyResult Board::applyMove(const Move& move, Player player) {
    ApplyResult result;
    if (move.isInline()) {
        applyInline(move, player, result);
    } else {
        applyBroadside(move, player);
    }
    return result;
}

bool Board::makeMove(const Move& move, Player player, ApplyResult* result) {
    if (!isLegalMove(move, player)) {
        return false;
    }
    ApplyResult applied = applyMove(move, player);
    if (result) {
        *result = std::move(applied);
    }
    return true;
}

void Board::applyInline(const Move& move, Player player, ApplyResult& result) {
    Direction d = move.direction();
    Player opp = opponent(player);
    Position leading = move.leadingAndTrailing().second;

    Position pos = hex::neighbor(leading, d);
    while (hex::isValid(pos) && get(pos) == opp) {
        result.pushed.push_back(pos);
        pos = hex::neighbor(pos, d);
    }
    // pos is now the first cell past the chain: empty or off the board

    if (!result.pushed.empty() && !hex::isValid(pos)) {
        result.pushOff = true;
        if (player == BLACK) {
            blackScore++;
        } else {
            whiteScore++;
        }
    }

    // Farthest pushed marble first so nothing is overwritten
    for (auto it = result.pushed.rbegin(); it != result.pushed.rend(); ++it) {
        Position dest = hex::neighbor(*it, d);
        if (hex::isValid(dest)) {
            set(dest, opp);
        }
        set(*it, NONE);
    }

    for (const auto& marble : move.marblesLeadingFirst()) {
        set(hex::neighbor(marble, d), player);
        set(marble, NONE);
    }
}

void Board::applyBroadside(const Move& move, Player player) {
    Direction d = move.direction();
    for (int i = 0; i < move.count(); i++) {
        set(move.marble(i), NONE);
    }
    for (int i = 0; i < move.count(); i++) {
        set(hex::neighbor(move.marble(i), d), player);
    }
}

// ============================================================================
// Display
// ============================================================================

std::string Board::toString() const {
    static const char* ROW_LETTERS = "abcdefghi";
    std::ostringstream out;

    out << "\n  Score: Black(@@) " << blackScore << " - " << whiteScore << " White(OO)\n\n";

    for (int r = hex::NUM_ROWS - 1; r >= 0; r--) {
        int indent = std::abs(r - 4);
        int first = (r <= 4) ? 1 : r - 3;
        int last = (r <= 4) ? 5 + r : 9;

        std::string line = "  " + std::string(indent * 2, ' ');
        for (int c = first; c <= last; c++) {
            Player stone = get(Position(r, c));
            if (stone == BLACK) {
                line += "@@";
            } else if (stone == WHITE) {
                line += "OO";
            } else {
                line += hex::toString(Position(r, c));
            }
            if (c < last) line += ' ';
        }
        if (line.size() < 40) {
            line.resize(40, ' ');
        }
        out << line << ROW_LETTERS[r] << "\n";
    }
    return out.str();
}

void Board::print() const {
    std::cout << toString() << std::endl;
}

bool Board::operator==(const Board& other) const {
    return cells == other.cells && blackScore == other.blackScore && whiteScore == other.whiteScore;
}
