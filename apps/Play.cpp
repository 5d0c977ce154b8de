#include "Board.hpp"
#include "GameUtils.hpp"
#include "Minimax.hpp"
#include "MoveGenerator.hpp"
#include "Profiler.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Usage: abalone_play [hvh|hva|ava] [depth] [layout] [maxMoves] [black|white]
//   hvh  two humans at one terminal
//   hva  human against the engine; the last argument picks the human's side
//        (default black)
//   ava  engine against engine
// maxMoves caps the game; the side with the higher score then wins.

namespace {

void printHelp() {
    std::cout << "Commands:\n"
              << "  <move>  e.g. 3:a1d1  1:e5e6  2:c3-c4>NW\n"
              << "  moves   list all legal moves\n"
              << "  state   show state space summary\n"
              << "  undo    take back the last move\n"
              << "  help    show this message\n"
              << "  q       quit\n\n";
}

void reportApply(const Board::ApplyResult& applied) {
    if (applied.pushed.empty()) return;
    std::cout << "  Pushed " << applied.pushed.size() << " marble(s)";
    if (applied.pushOff) {
        std::cout << ", one off the board!";
    }
    std::cout << "\n";
}

bool isHuman(const std::string& mode, Board::Player humanSide, Board::Player player) {
    if (mode == "hvh") return true;
    if (mode == "hva") return player == humanSide;
    return false;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string mode = argc > 1 ? argv[1] : "hva";
    int depth = argc > 2 ? std::atoi(argv[2]) : 2;
    std::string layout = argc > 3 ? argv[3] : "standard";
    int maxMoves = argc > 4 ? std::atoi(argv[4]) : 200;
    std::string side = argc > 5 ? argv[5] : "black";

    if (mode != "hvh" && mode != "hva" && mode != "ava") {
        std::cerr << "Unknown mode '" << mode << "' (expected hvh, hva or ava)\n";
        return 1;
    }
    if (side != "black" && side != "white") {
        std::cerr << "Unknown side '" << side << "' (expected black or white)\n";
        return 1;
    }
    Board::Player humanSide = side == "white" ? Board::WHITE : Board::BLACK;

    Board board;
    Minimax::Config config;
    config.depth = depth;
    std::unique_ptr<Minimax> engine;
    try {
        board.setupLayout(layout);
        engine = std::make_unique<Minimax>(config);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Playing Abalone (" << mode << ", depth " << depth << ", layout " << layout << ")..." << std::endl;
    if (mode == "hva") {
        std::cout << "You play " << GameUtils::playerName(humanSide) << std::endl;
    }
    printHelp();

    std::vector<Board> history;
    std::vector<std::string> moves;
    Board::Player toMove = Board::BLACK;
    double engineTotalTime = 0.0;

    while (!board.isGameOver() && static_cast<int>(moves.size()) < maxMoves) {
        GameUtils::printGameState(board, toMove);

        if (MoveGenerator::countLegalMoves(board, toMove) == 0) {
            std::cout << GameUtils::playerName(toMove) << " has no legal move.\n";
            break;
        }

        Move move;
        if (isHuman(mode, humanSide, toMove)) {
            std::cout << GameUtils::playerName(toMove) << " > " << std::flush;
            std::string line;
            if (!std::getline(std::cin, line) || line == "q" || line == "quit") {
                std::cout << "\nQuit.\n";
                break;
            }
            if (line.empty()) continue;

            if (line == "help") {
                printHelp();
                continue;
            }
            if (line == "moves") {
                GameUtils::printLegalMoves(board, toMove);
                continue;
            }
            if (line == "state") {
                GameUtils::printStateSpaceSummary(board, toMove);
                continue;
            }
            if (line == "undo") {
                // Against the engine, take back the engine's reply as well
                size_t plies = mode == "hva" ? 2 : 1;
                if (history.size() < plies) {
                    std::cout << "  Nothing to undo.\n";
                    continue;
                }
                for (size_t i = 0; i < plies; i++) {
                    board = history.back();
                    history.pop_back();
                    moves.pop_back();
                    toMove = Board::opponent(toMove);
                }
                continue;
            }

            auto parsed = GameUtils::parseMove(line);
            if (!parsed) {
                std::cout << "  Could not parse '" << line << "'. Type 'help' for notation.\n";
                continue;
            }
            Board::MoveCheck check = board.checkMove(*parsed, toMove);
            if (!check.legal) {
                std::cout << "  Illegal move: " << check.reason << "\n";
                continue;
            }
            move = *parsed;
        } else {
            std::cout << GameUtils::playerName(toMove) << "'s turn (Minimax)" << std::endl;
            auto t0 = std::chrono::high_resolution_clock::now();
            std::optional<Move> chosen;
            try {
                chosen = GameUtils::runSearchAndReport(*engine, board, toMove);
            } catch (const SearchInvariantError& e) {
                std::cerr << "Engine error: " << e.what() << "\n";
                return 1;
            }
            double elapsed = std::chrono::duration<double>(std::chrono::high_resolution_clock::now() - t0).count();
            engineTotalTime += elapsed;
            std::cout << "  move time: " << elapsed << "s\n";
            if (!chosen) break;
            move = *chosen;
        }

        std::string notation = move.toNotation(board.wouldPush(move, toMove));
        history.push_back(board);
        Board::ApplyResult applied;
        if (!board.makeMove(move, toMove, &applied)) {
            std::cerr << "Rejected move " << notation << "\n";
            return 1;
        }
        moves.push_back(notation);
        std::cout << "Played: " << notation << "\n";
        reportApply(applied);

        toMove = Board::opponent(toMove);
    }

    GameUtils::printGameState(board, toMove);

    std::cout << "Moves: ";
    for (const auto& notation : moves) {
        std::cout << notation << " ";
    }
    std::cout << "\n\n";

    Board::Player winner = board.getWinner();
    if (winner == Board::NONE) {
        int black = board.getScore(Board::BLACK);
        int white = board.getScore(Board::WHITE);
        if (black > white) winner = Board::BLACK;
        if (white > black) winner = Board::WHITE;
    }
    if (winner == Board::NONE) {
        std::cout << "Draw\n";
    } else {
        std::cout << "Winner: " << GameUtils::playerName(winner) << "\n";
    }

    if (mode != "hvh") {
        std::cout << "Engine total time: " << engineTotalTime << "s\n";
    }
    Profiler::instance().printReport();

    return 0;
}
