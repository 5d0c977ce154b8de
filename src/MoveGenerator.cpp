#include "MoveGenerator.hpp"
#include "Profiler.hpp"
#include <unordered_set>

// ============================================================================
// Candidate enumeration
// ============================================================================

// Lines are anchored at their lowest marble: a pair or triple is only formed
// by stepping forward along a positive axis direction from an own marble, and
// only when every extension cell also holds an own marble.
template <typename Visitor>
void MoveGenerator::forEachCandidate(const Board& board, Board::Player player, Visitor&& visit) {
    std::unordered_set<uint32_t> seen;
    seen.reserve(256);

    auto emit = [&](const Move& move) {
        if (seen.insert(move.key()).second) {
            visit(move);
        }
    };

    for (const auto& m : board.getMarbles(player)) {
        for (const auto& d : hex::DIRECTIONS) {
            emit(Move({m}, d));
        }

        for (const auto& axis : hex::POSITIVE_DIRECTIONS) {
            Position m2 = hex::neighbor(m, axis);
            if (board.get(m2) != player) continue;
            for (const auto& d : hex::DIRECTIONS) {
                emit(Move({m, m2}, d));
            }
        }

        for (const auto& axis : hex::POSITIVE_DIRECTIONS) {
            Position m2 = hex::neighbor(m, axis);
            Position m3 = hex::neighbor(m2, axis);
            if (board.get(m2) != player || board.get(m3) != player) continue;
            for (const auto& d : hex::DIRECTIONS) {
                emit(Move({m, m2, m3}, d));
            }
        }
    }
}

// ============================================================================
// Public interface
// ============================================================================

std::vector<Move> MoveGenerator::generateLegalMoves(const Board& board, Board::Player player) {
    PROFILE_SCOPE("MoveGenerator::generateLegalMoves");
    std::vector<Move> moves;
    moves.reserve(128);
    forEachCandidate(board, player, [&](const Move& move) {
        if (board.isLegalMove(move, player)) {
            moves.push_back(move);
        }
    });
    return moves;
}

int MoveGenerator::countLegalMoves(const Board& board, Board::Player player) {
    PROFILE_SCOPE("MoveGenerator::countLegalMoves");
    int count = 0;
    forEachCandidate(board, player, [&](const Move& move) {
        if (board.isLegalMove(move, player)) {
            count++;
        }
    });
    return count;
}

std::vector<Move> MoveGenerator::generateRawMoves(const Board& board, Board::Player player) {
    std::vector<Move> raw;
    std::vector<Position> marbles = board.getMarbles(player);
    raw.reserve(marbles.size() * 60);

    for (const auto& m : marbles) {
        // 1-stone: 6
        for (const auto& d : hex::DIRECTIONS) {
            raw.emplace_back(Move({m}, d));
        }
        // 2-stone: 6 neighbour slots x 6 directions
        for (const auto& nd : hex::DIRECTIONS) {
            Position m2 = hex::neighbor(m, nd);
            for (const auto& d : hex::DIRECTIONS) {
                raw.emplace_back(Move({m, m2}, d));
            }
        }
        // 3-stone: 3 axes x 6 directions
        for (const auto& axis : hex::POSITIVE_DIRECTIONS) {
            Position m2 = hex::neighbor(m, axis);
            Position m3 = hex::neighbor(m2, axis);
            for (const auto& d : hex::DIRECTIONS) {
                raw.emplace_back(Move({m, m2, m3}, d));
            }
        }
    }
    return raw;
}

MoveGenerator::Categories MoveGenerator::categorize(const std::vector<Move>& moves) {
    Categories cats;
    for (const auto& move : moves) {
        switch (move.count()) {
        case 1:
            cats.singleInline.push_back(move);
            break;
        case 2:
            (move.isInline() ? cats.doubleInline : cats.doubleBroadside).push_back(move);
            break;
        default:
            (move.isInline() ? cats.tripleInline : cats.tripleBroadside).push_back(move);
            break;
        }
    }
    return cats;
}

std::vector<Move> MoveGenerator::pushMoves(const Board& board, Board::Player player, const std::vector<Move>& moves) {
    std::vector<Move> pushes;
    for (const auto& move : moves) {
        if (board.wouldPush(move, player)) {
            pushes.push_back(move);
        }
    }
    return pushes;
}
