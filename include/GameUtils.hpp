#ifndef GAMEUTILS_HPP
#define GAMEUTILS_HPP

#include "Board.hpp"
#include "Move.hpp"
#include <optional>
#include <string>
#include <vector>

class Minimax;

class GameUtils {
public:
    // Move notation
    //   inline     {count}:{trailing}{goal}     e.g. 3:a1d1  1:e5e6
    //   broadside  {count}:{end1}-{end2}>{DIR}  e.g. 2:c3-c4>NW
    // A trailing '*' (push marker) is accepted and ignored.
    static std::optional<Move> parseMove(const std::string& text);

    // Builds a move from position strings and a direction vector, as sent by
    // external front ends. Fills error with a specific reason on failure.
    static std::optional<Move> buildMove(const std::vector<std::string>& marbles, int drow, int dcol,
                                         std::string& error);

    static const char* playerName(Board::Player player);

    // Board printing
    static void printGameState(const Board& board, Board::Player toMove);
    static void printLegalMoves(const Board& board, Board::Player player);
    static void printStateSpaceSummary(const Board& board, Board::Player player);

    // Root summary for player, then the child reached by legal move
    // childIndex (generation order) with the opponent's summary.
    // Returns false when childIndex is out of range.
    static bool printDepthOneChild(const Board& board, Board::Player player, int childIndex);

    // Number formatting
    static std::string formatWithCommas(int value);

    // Search utilities
    static std::optional<Move> runSearchAndReport(Minimax& engine, const Board& board, Board::Player player);
};

#endif // GAMEUTILS_HPP
