#include "Minimax.hpp"
#include "GameUtils.hpp"
#include "MoveGenerator.hpp"
#include "Profiler.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <tuple>
#include <utility>

// ============================================================================
// Configuration
// ============================================================================

Minimax::TieBreak Minimax::parseTieBreak(const std::string& name) {
    if (name == "lexicographic") {
        return TieBreak::LEXICOGRAPHIC;
    }
    return TieBreak::FIRST;
}

Minimax::Minimax() : Minimax(Config()) {
}

Minimax::Minimax(const Config& config) {
    setConfig(config);
}

void Minimax::setConfig(const Config& config) {
    if (config.depth < MIN_DEPTH || config.depth > MAX_DEPTH) {
        throw std::invalid_argument("Search depth must be between 1 and 5, got " + std::to_string(config.depth));
    }

    config_ = config;
    tieBreak_ = parseTieBreak(config.tieBreak);

    if (config.evaluator) {
        ownedEvaluator_.reset();
        evaluator_ = config.evaluator;
        return;
    }

    if (!HeuristicEvaluator::Weights::isKnownPreset(config.heuristic)) {
        std::cerr << "Unknown heuristic preset '" << config.heuristic << "' (known:";
        for (const auto& name : HeuristicEvaluator::Weights::presetNames()) {
            std::cerr << " " << name;
        }
        std::cerr << "), using 'balanced'\n";
    }
    ownedEvaluator_ = std::make_unique<HeuristicEvaluator>(config.heuristic);
    evaluator_ = ownedEvaluator_.get();
}

// ============================================================================
// Search
// ============================================================================

Minimax::Result Minimax::search(const Board& board, Board::Player player) {
    PROFILE_SCOPE("Minimax::search");
    auto startTime = std::chrono::high_resolution_clock::now();

    rootPlayer_ = player;
    nodes_ = 0;
    cutoffs_ = 0;

    std::optional<Move> bestMove;
    double score = searchRoot(board, bestMove);

    auto endTime = std::chrono::high_resolution_clock::now();

    Result result;
    result.move = bestMove;
    result.score = score;
    result.nodes = nodes_;
    result.cutoffs = cutoffs_;
    result.elapsedMs = std::chrono::duration<double, std::milli>(endTime - startTime).count();
    result.depth = config_.depth;

    lastResult_ = result;
    return result;
}

Minimax::Result Minimax::chooseMove(const Board& board, Board::Player player) {
    Result result = search(board, player);
    verifyResult(board, player, result);
    return result;
}

void Minimax::verifyResult(const Board& board, Board::Player player, const Result& result) {
    if (!result.move) {
        return;
    }
    Board::MoveCheck check = board.checkMove(*result.move, player);
    if (!check.legal) {
        throw SearchInvariantError("Search produced illegal move " + result.move->toNotation() +
                                   ": " + check.reason);
    }
}

double Minimax::searchRoot(const Board& board, std::optional<Move>& bestMove) {
    const double inf = std::numeric_limits<double>::infinity();
    nodes_++;

    if (isTerminal(board)) {
        return evaluate(board);
    }

    std::vector<Move> moves = MoveGenerator::generateLegalMoves(board, rootPlayer_);
    if (moves.empty()) {
        return evaluate(board);
    }
    if (config_.useMoveOrdering) {
        moves = orderMoves(board, rootPlayer_, std::move(moves));
    }

    const Board::Player next = Board::opponent(rootPlayer_);
    double bestValue = -inf;

    for (const auto& move : moves) {
        Board child = board;
        child.applyMove(move, rootPlayer_);

        double value = alphaBeta(child, next, config_.depth - 1, bestValue, inf);
        if (value > bestValue || !bestMove) {
            bestValue = value;
            bestMove = move;
        } else if (value == bestValue && preferOnTie(move, bestMove)) {
            // value may only be an upper bound; search with the bound just
            // inside the window to get the exact value
            if (config_.usePruning) {
                value = alphaBeta(child, next, config_.depth - 1, std::nextafter(bestValue, -inf), inf);
            }
            if (value == bestValue) {
                bestMove = move;
            }
        }
    }

    return bestValue;
}

double Minimax::alphaBeta(const Board& board, Board::Player toMove, int depth, double alpha, double beta) {
    nodes_++;

    if (depth == 0 || isTerminal(board)) {
        return evaluate(board);
    }

    std::vector<Move> moves = MoveGenerator::generateLegalMoves(board, toMove);
    if (moves.empty()) {
        return evaluate(board);
    }
    if (config_.useMoveOrdering) {
        moves = orderMoves(board, toMove, std::move(moves));
    }

    const bool maximizing = (toMove == rootPlayer_);
    const Board::Player next = Board::opponent(toMove);
    double bestValue = maximizing ? -std::numeric_limits<double>::infinity()
                                  : std::numeric_limits<double>::infinity();

    for (const auto& move : moves) {
        Board child = board;
        child.applyMove(move, toMove);

        double value = alphaBeta(child, next, depth - 1, alpha, beta);
        if (maximizing) {
            bestValue = std::max(bestValue, value);
            alpha = std::max(alpha, bestValue);
        } else {
            bestValue = std::min(bestValue, value);
            beta = std::min(beta, bestValue);
        }

        if (config_.usePruning && alpha >= beta) {
            cutoffs_++;
            break;
        }
    }

    return bestValue;
}

bool Minimax::isTerminal(const Board& board) const {
    return board.getScore(Board::BLACK) >= Board::WINNING_SCORE ||
           board.getScore(Board::WHITE) >= Board::WINNING_SCORE;
}

bool Minimax::preferOnTie(const Move& candidate, const std::optional<Move>& incumbent) const {
    if (!incumbent) {
        return true;
    }
    if (tieBreak_ == TieBreak::LEXICOGRAPHIC) {
        return candidate.toNotation() < incumbent->toNotation();
    }
    return false;
}

double Minimax::evaluate(const Board& board) const {
    return evaluator_->evaluate(board, rootPlayer_);
}

// ============================================================================
// Move ordering: pushes first, then longer lines, then notation
// ============================================================================

std::vector<Move> Minimax::orderMoves(const Board& board, Board::Player player, std::vector<Move> moves) {
    struct Keyed {
        int pushRank;
        int count;
        std::string notation;
        Move move;
    };

    std::vector<Keyed> keyed;
    keyed.reserve(moves.size());
    for (const auto& move : moves) {
        keyed.push_back({board.wouldPush(move, player) ? 0 : 1, move.count(), move.toNotation(), move});
    }

    std::sort(keyed.begin(), keyed.end(), [](const Keyed& a, const Keyed& b) {
        return std::tie(a.pushRank, b.count, a.notation) < std::tie(b.pushRank, a.count, b.notation);
    });

    for (size_t i = 0; i < keyed.size(); i++) {
        moves[i] = keyed[i].move;
    }
    return moves;
}

// ============================================================================
// Reporting
// ============================================================================

void Minimax::printStats() const {
    const Result& r = lastResult_;
    std::cout << "\n=== Minimax Statistics ===\n";
    std::cout << "Depth: " << r.depth
              << ". Nodes: " << GameUtils::formatWithCommas(r.nodes)
              << ". Cutoffs: " << GameUtils::formatWithCommas(r.cutoffs) << "\n";
    std::cout << "Search time: " << std::fixed << std::setprecision(1) << r.elapsedMs << " ms\n";
    std::cout << "Nodes/second: " << std::fixed << std::setprecision(0)
              << (r.elapsedMs > 0 ? r.nodes / (r.elapsedMs / 1000.0) : 0.0) << "\n";
    std::cout << "Score: " << std::setprecision(1) << r.score << "\n";
    std::cout << "Best move: " << (r.move ? r.move->toNotation() : std::string("none")) << "\n";
    std::cout << "==========================\n\n";
}
