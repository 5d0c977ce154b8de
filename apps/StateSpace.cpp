#include "Board.hpp"
#include "GameUtils.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

// Usage: abalone_statespace [layout] [player] [childIndex]
// Prints the raw and legal move space for both players at the start of a game.
// With a player (black|white) and child index, expands that root move one ply
// and prints the child position with the opponent's move space.

int main(int argc, char* argv[]) {
    std::string layout = argc > 1 ? argv[1] : "standard";
    std::string playerArg = argc > 2 ? argv[2] : "";
    int childIndex = argc > 3 ? std::atoi(argv[3]) : 0;

    Board::Player player = Board::BLACK;
    if (!playerArg.empty()) {
        if (playerArg == "black") {
            player = Board::BLACK;
        } else if (playerArg == "white") {
            player = Board::WHITE;
        } else {
            std::cerr << "Error: unknown player '" << playerArg << "' (expected black or white)\n";
            return 1;
        }
    }

    Board board;
    try {
        board.setupLayout(layout);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Available layouts:";
        for (const auto& name : Board::layoutNames()) {
            std::cerr << " " << name;
        }
        std::cerr << "\n";
        return 1;
    }

    std::cout << "Abalone state space (" << layout << ")" << std::endl;
    board.print();

    if (!playerArg.empty()) {
        return GameUtils::printDepthOneChild(board, player, childIndex) ? 0 : 1;
    }

    GameUtils::printStateSpaceSummary(board, Board::BLACK);
    GameUtils::printStateSpaceSummary(board, Board::WHITE);

    return 0;
}
