#ifndef MINIMAX_HPP
#define MINIMAX_HPP

#include "Board.hpp"
#include "Evaluator.hpp"
#include "Move.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Raised when the engine proposes a move the legality engine rejects.
// Generator and legality engine disagreeing is a defect, not a game outcome.
class SearchInvariantError : public std::logic_error {
public:
    explicit SearchInvariantError(const std::string& what) : std::logic_error(what) {}
};

// ============================================================================
// Depth-bounded minimax with alpha-beta pruning
// ============================================================================
//
// Single perspective: every leaf is scored for the root player. Nodes where
// the root player moves maximise, all others minimise. A node is a leaf when
// no plies remain, either side has reached the winning score, or the side to
// move has no legal move. Siblings are cut once alpha >= beta.
//
// Only the root keeps a move. A root child that ties the best value may be a
// bound from a cutoff, so a tie that would change the move is re-searched
// just below the bound before it is accepted.

class Minimax {
public:
    static constexpr int MIN_DEPTH = 1;
    static constexpr int MAX_DEPTH = 5;

    enum class TieBreak : uint8_t {
        FIRST = 0,       // keep the first best move found under the ordering
        LEXICOGRAPHIC    // on an exact tie prefer the earlier notation string
    };

    struct Config {
        int depth = 2;                           // plies, 1-5
        std::string heuristic = "balanced";      // HeuristicEvaluator preset
        std::string tieBreak = "lexicographic";  // "lexicographic" or "first"
        bool usePruning = true;                  // false runs full minimax
        bool useMoveOrdering = true;
        const Evaluator* evaluator = nullptr;    // overrides heuristic when set

        static Config fast() {
            Config c;
            c.depth = 1;
            c.heuristic = "material";
            return c;
        }

        static Config strong() {
            Config c;
            c.depth = 3;
            return c;
        }
    };

    struct Result {
        std::optional<Move> move;   // empty when the mover has no legal move
        double score = 0.0;         // from the mover's perspective
        int nodes = 0;
        int cutoffs = 0;
        double elapsedMs = 0.0;
        int depth = 0;
    };

    static TieBreak parseTieBreak(const std::string& name);

    Minimax();

    // Throws std::invalid_argument when depth is outside 1-5
    explicit Minimax(const Config& config);

    Result search(const Board& board, Board::Player player);

    // search() followed by a legality re-check of the chosen move.
    // Throws SearchInvariantError if the engine returned an illegal move.
    Result chooseMove(const Board& board, Board::Player player);

    // The re-check chooseMove applies. Throws SearchInvariantError when
    // result.move is set and not legal for player on board.
    static void verifyResult(const Board& board, Board::Player player, const Result& result);

    // Move ordering used before expanding a node
    static std::vector<Move> orderMoves(const Board& board, Board::Player player, std::vector<Move> moves);

    void setConfig(const Config& config);
    const Config& getConfig() const { return config_; }

    const Result& getLastResult() const { return lastResult_; }
    void printStats() const;

private:
    double searchRoot(const Board& board, std::optional<Move>& bestMove);
    double alphaBeta(const Board& board, Board::Player toMove, int depth, double alpha, double beta);
    bool isTerminal(const Board& board) const;
    bool preferOnTie(const Move& candidate, const std::optional<Move>& incumbent) const;
    double evaluate(const Board& board) const;

    Config config_;
    TieBreak tieBreak_ = TieBreak::LEXICOGRAPHIC;
    std::unique_ptr<HeuristicEvaluator> ownedEvaluator_;
    const Evaluator* evaluator_ = nullptr;

    // Per-search state
    Board::Player rootPlayer_ = Board::BLACK;
    int nodes_ = 0;
    int cutoffs_ = 0;
    Result lastResult_;
};

#endif // MINIMAX_HPP
