#ifndef MOVEGENERATOR_HPP
#define MOVEGENERATOR_HPP

#include "Board.hpp"
#include "Move.hpp"
#include <vector>

class MoveGenerator {
public:
    struct Categories {
        std::vector<Move> singleInline;
        std::vector<Move> doubleInline;
        std::vector<Move> doubleBroadside;
        std::vector<Move> tripleInline;
        std::vector<Move> tripleBroadside;
    };

    // Every distinct legal move for player, in generation order
    // (marble, then axis, then direction). Not sorted.
    static std::vector<Move> generateLegalMoves(const Board& board, Board::Player player);

    // Number of legal moves without keeping them
    static int countLegalMoves(const Board& board, Board::Player player);

    // Theoretical per-turn space: 60 shapes per marble, no legality checks,
    // duplicates kept (pairs from both ends, triples from every member).
    static std::vector<Move> generateRawMoves(const Board& board, Board::Player player);

    static Categories categorize(const std::vector<Move>& moves);

    // Inline moves that would displace an opponent marble
    static std::vector<Move> pushMoves(const Board& board, Board::Player player, const std::vector<Move>& moves);

private:
    template <typename Visitor>
    static void forEachCandidate(const Board& board, Board::Player player, Visitor&& visit);
};

#endif // MOVEGENERATOR_HPP
