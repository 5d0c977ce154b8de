#include "GameUtils.hpp"
#include "Minimax.hpp"
#include "MoveGenerator.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

// ============================================================================
// Notation parsing
// ============================================================================

std::optional<Move> GameUtils::parseMove(const std::string& input) {
    std::string text;
    for (char ch : input) {
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            text += ch;
        }
    }
    if (!text.empty() && text.back() == '*') {
        text.pop_back();
    }

    // "N:" prefix
    if (text.size() < 6 || text[1] != ':' || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        return std::nullopt;
    }
    int count = text[0] - '0';
    if (count < 1 || count > Move::MAX_MARBLES) {
        return std::nullopt;
    }
    std::string body = text.substr(2);
    std::string error;

    size_t arrow = body.find('>');
    if (arrow != std::string::npos) {
        // Broadside: xx-yy>DIR
        auto direction = hex::parseDirection(body.substr(arrow + 1));
        std::string head = body.substr(0, arrow);
        size_t dash = head.find('-');
        if (!direction || dash == std::string::npos) {
            return std::nullopt;
        }
        auto end1 = hex::parsePosition(head.substr(0, dash));
        auto end2 = hex::parsePosition(head.substr(dash + 1));
        if (!end1 || !end2) {
            return std::nullopt;
        }

        int dr = end2->row - end1->row;
        int dc = end2->col - end1->col;
        int steps = std::max(std::abs(dr), std::abs(dc));
        if (steps == 0 || steps != count - 1 || dr % steps != 0 || dc % steps != 0) {
            return std::nullopt;
        }
        Direction unit(dr / steps, dc / steps);

        std::vector<Position> marbles;
        for (int i = 0; i < count; i++) {
            marbles.emplace_back(end1->row + i * unit.drow, end1->col + i * unit.dcol);
        }
        return Move::fromParts(marbles, *direction, error);
    }

    // Inline: xxyy, trailing marble then goal cell
    if (body.size() != 4) {
        return std::nullopt;
    }
    auto start = hex::parsePosition(body.substr(0, 2));
    auto goal = hex::parsePosition(body.substr(2, 2));
    if (!start || !goal) {
        return std::nullopt;
    }

    int dr = goal->row - start->row;
    int dc = goal->col - start->col;
    if (dr % count != 0 || dc % count != 0) {
        return std::nullopt;
    }
    Direction direction(dr / count, dc / count);
    if (!hex::isDirection(direction)) {
        return std::nullopt;
    }

    std::vector<Position> marbles;
    for (int i = 0; i < count; i++) {
        marbles.emplace_back(start->row + i * direction.drow, start->col + i * direction.dcol);
    }
    return Move::fromParts(marbles, direction, error);
}

std::optional<Move> GameUtils::buildMove(const std::vector<std::string>& marbles, int drow, int dcol,
                                         std::string& error) {
    if (marbles.empty() || marbles.size() > static_cast<size_t>(Move::MAX_MARBLES)) {
        error = "Move must contain between 1 and 3 marbles.";
        return std::nullopt;
    }

    std::vector<Position> positions;
    for (const auto& text : marbles) {
        auto pos = hex::parsePosition(text);
        if (!pos) {
            error = "Malformed marble position '" + text + "'.";
            return std::nullopt;
        }
        positions.push_back(*pos);
    }
    return Move::fromParts(positions, Direction(drow, dcol), error);
}

const char* GameUtils::playerName(Board::Player player) {
    switch (player) {
    case Board::BLACK: return "Black(@)";
    case Board::WHITE: return "White(O)";
    default: return "None";
    }
}

// ============================================================================
// Printing
// ============================================================================

void GameUtils::printGameState(const Board& board, Board::Player toMove) {
    board.print();
    std::cout << "  Turn: " << playerName(toMove) << "\n";
    std::cout << "  Marbles: B=" << board.marbleCount(Board::BLACK)
              << " W=" << board.marbleCount(Board::WHITE) << "\n\n";
}

namespace {

void printGroup(const char* label, const std::vector<Move>& moves, const Board& board, Board::Player player) {
    if (moves.empty()) return;
    std::cout << "  " << label << " (" << moves.size() << "):\n";
    for (const auto& move : moves) {
        std::cout << "    " << move.toNotation(board.wouldPush(move, player)) << "\n";
    }
}

} // namespace

void GameUtils::printLegalMoves(const Board& board, Board::Player player) {
    std::vector<Move> legal = MoveGenerator::generateLegalMoves(board, player);
    if (legal.empty()) {
        std::cout << "  No legal moves!\n";
        return;
    }

    MoveGenerator::Categories cats = MoveGenerator::categorize(legal);
    std::cout << "\n  Legal moves (" << legal.size() << " total):\n";
    printGroup("Single", cats.singleInline, board, player);
    printGroup("Double inline", cats.doubleInline, board, player);
    printGroup("Double broadside", cats.doubleBroadside, board, player);
    printGroup("Triple inline", cats.tripleInline, board, player);
    printGroup("Triple broadside", cats.tripleBroadside, board, player);
    std::cout << "\n";
}

void GameUtils::printStateSpaceSummary(const Board& board, Board::Player player) {
    std::vector<Move> raw = MoveGenerator::generateRawMoves(board, player);
    std::vector<Move> legal = MoveGenerator::generateLegalMoves(board, player);
    MoveGenerator::Categories cats = MoveGenerator::categorize(legal);

    std::cout << "\n=== State Space for " << (player == Board::BLACK ? "Black" : "White")
              << " (" << board.marbleCount(player) << " marbles) ===\n";
    std::cout << "  Raw moves (with duplicates, no legality): " << raw.size() << "\n";
    std::cout << "  Legal moves (unique):                     " << legal.size() << "\n\n";
    std::cout << "  Breakdown:\n";
    std::cout << "    Single Inline            : " << cats.singleInline.size() << "\n";
    std::cout << "    Double Inline            : " << cats.doubleInline.size() << "\n";
    std::cout << "    Double Broadside         : " << cats.doubleBroadside.size() << "\n";
    std::cout << "    Triple Inline            : " << cats.tripleInline.size() << "\n";
    std::cout << "    Triple Broadside         : " << cats.tripleBroadside.size() << "\n";

    std::vector<Move> pushes = MoveGenerator::pushMoves(board, player, legal);
    if (!pushes.empty()) {
        std::cout << "\n  Push moves (sumito): " << pushes.size() << "\n";
        for (const auto& move : pushes) {
            std::cout << "    " << move.toNotation(true) << "\n";
        }
    }
    std::cout << std::endl;
}

bool GameUtils::printDepthOneChild(const Board& board, Board::Player player, int childIndex) {
    Board::Player next = Board::opponent(player);

    std::cout << "=== Root Node (" << playerName(player) << " to move) ===\n";
    printStateSpaceSummary(board, player);

    std::vector<Move> rootMoves = MoveGenerator::generateLegalMoves(board, player);
    if (rootMoves.empty()) {
        std::cout << "No legal root moves to expand.\n";
        return false;
    }
    if (childIndex < 0 || childIndex >= static_cast<int>(rootMoves.size())) {
        std::cout << "Requested child index " << childIndex << " is out of range. Valid range: 0.."
                  << rootMoves.size() - 1 << ".\n";
        return false;
    }

    const Move& move = rootMoves[childIndex];
    Board child = board;
    Board::ApplyResult applied = child.applyMove(move, player);

    std::cout << "=== Depth 1 Child (" << playerName(next) << " to move) ===\n";
    std::cout << "Expanded root move [" << childIndex << "]: " << move.toNotation(!applied.pushed.empty()) << "\n";
    child.print();
    printStateSpaceSummary(child, next);
    return true;
}

// ============================================================================
// Formatting
// ============================================================================

std::string GameUtils::formatWithCommas(int value) {
    std::string num = std::to_string(value);
    std::string result;
    int count = 0;
    for (int i = static_cast<int>(num.length()) - 1; i >= 0; --i) {
        if (count > 0 && count % 3 == 0 && num[i] != '-') result = ',' + result;
        result = num[i] + result;
        ++count;
    }
    return result;
}

// ============================================================================
// Search
// ============================================================================

std::optional<Move> GameUtils::runSearchAndReport(Minimax& engine, const Board& board, Board::Player player) {
    Minimax::Result result = engine.chooseMove(board, player);
    engine.printStats();
    if (result.move) {
        std::cout << "Minimax selected move: "
                  << result.move->toNotation(board.wouldPush(*result.move, player)) << std::endl;
    } else {
        std::cout << "No legal move available." << std::endl;
    }
    return result.move;
}
