#ifndef EVALUATOR_HPP
#define EVALUATOR_HPP

#include "Board.hpp"
#include <string>
#include <vector>

// Abstract interface for position evaluation
class Evaluator {
public:
    virtual ~Evaluator() = default;

    // Score of board from player's point of view; higher is better for player
    virtual double evaluate(const Board& board, Board::Player player) const = 0;
};

// Weighted sum of symmetric (player - opponent) terms
class HeuristicEvaluator : public Evaluator {
public:
    struct Weights {
        double scoreWeight = 1400.0;
        double materialWeight = 40.0;
        double centerWeight = 4.0;
        double mobilityWeight = 1.0;

        // Material and score dominate, light positional influence
        static Weights balanced() { return Weights(); }

        // Ignores position entirely
        static Weights material() {
            Weights w;
            w.scoreWeight = 1800.0;
            w.materialWeight = 50.0;
            w.centerWeight = 0.0;
            w.mobilityWeight = 0.0;
            return w;
        }

        static bool isKnownPreset(const std::string& name);

        // Unknown names fall back to balanced()
        static Weights fromPreset(const std::string& name);

        static std::vector<std::string> presetNames();
    };

    HeuristicEvaluator() = default;
    explicit HeuristicEvaluator(const Weights& weights) : weights_(weights) {}
    explicit HeuristicEvaluator(const std::string& preset) : weights_(Weights::fromPreset(preset)) {}
    ~HeuristicEvaluator() override = default;

    double evaluate(const Board& board, Board::Player player) const override;

    const Weights& getWeights() const { return weights_; }

    // Individual terms, each positive when player is ahead
    static double scoreAdvantage(const Board& board, Board::Player player);
    static double materialAdvantage(const Board& board, Board::Player player);
    static double centerControl(const Board& board, Board::Player player);
    static double mobility(const Board& board, Board::Player player);

private:
    Weights weights_;
};

#endif // EVALUATOR_HPP
