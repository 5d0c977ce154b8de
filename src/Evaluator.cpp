#include "Evaluator.hpp"
#include "MoveGenerator.hpp"
#include "Profiler.hpp"

// ============================================================================
// Weight presets
// ============================================================================

bool HeuristicEvaluator::Weights::isKnownPreset(const std::string& name) {
    return name == "balanced" || name == "material";
}

HeuristicEvaluator::Weights HeuristicEvaluator::Weights::fromPreset(const std::string& name) {
    if (name == "material") {
        return material();
    }
    return balanced();
}

std::vector<std::string> HeuristicEvaluator::Weights::presetNames() {
    return {"balanced", "material"};
}

// ============================================================================
// Terms
// ============================================================================

double HeuristicEvaluator::scoreAdvantage(const Board& board, Board::Player player) {
    return static_cast<double>(board.getScore(player) - board.getScore(Board::opponent(player)));
}

double HeuristicEvaluator::materialAdvantage(const Board& board, Board::Player player) {
    return static_cast<double>(board.marbleCount(player) - board.marbleCount(Board::opponent(player)));
}

double HeuristicEvaluator::centerControl(const Board& board, Board::Player player) {
    Board::Player opp = Board::opponent(player);
    int mine = 0;
    int theirs = 0;
    for (int i = 0; i < hex::NUM_CELLS; i++) {
        Position pos = hex::positionAt(i);
        Board::Player stone = board.get(pos);
        if (stone == player) {
            mine += hex::distanceFromCenter(pos);
        } else if (stone == opp) {
            theirs += hex::distanceFromCenter(pos);
        }
    }
    // Closer to the centre is better, so the opponent's distance counts for us
    return static_cast<double>(theirs - mine);
}

double HeuristicEvaluator::mobility(const Board& board, Board::Player player) {
    return static_cast<double>(MoveGenerator::countLegalMoves(board, player) -
                               MoveGenerator::countLegalMoves(board, Board::opponent(player)));
}

// ============================================================================
// HeuristicEvaluator
// ============================================================================

double HeuristicEvaluator::evaluate(const Board& board, Board::Player player) const {
    PROFILE_SCOPE("HeuristicEvaluator::evaluate");
    double value = weights_.scoreWeight * scoreAdvantage(board, player)
                 + weights_.materialWeight * materialAdvantage(board, player);

    if (weights_.centerWeight != 0.0) {
        value += weights_.centerWeight * centerControl(board, player);
    }
    // Mobility runs the generator for both sides; skip it when unweighted
    if (weights_.mobilityWeight != 0.0) {
        value += weights_.mobilityWeight * mobility(board, player);
    }
    return value;
}
