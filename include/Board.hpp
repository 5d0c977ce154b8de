#ifndef BOARD_HPP
#define BOARD_HPP

#include "Hex.hpp"
#include "Move.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

class Board {
public:
    static constexpr int WINNING_SCORE = 6;
    static constexpr int MARBLES_PER_SIDE = 14;

    enum Player : uint8_t {
        NONE = 0,
        BLACK = 1,
        WHITE = 2
    };

    enum class MoveError : uint8_t {
        NONE = 0,
        MALFORMED,            // wrong marble count
        BAD_DIRECTION,        // not one of the six hex directions
        NOT_OWNED,            // a marble is empty or the opponent's
        NOT_IN_LINE,          // marbles are not colinear and contiguous
        OFF_BOARD,            // own marble would leave the board
        SELF_PUSH,            // inline move runs into an own marble
        OUTNUMBERED,          // pushed chain is not shorter than the pushing line
        PUSH_BLOCKED,         // cell behind the pushed chain is occupied
        DESTINATION_OCCUPIED  // broadside destination is not empty
    };

    struct MoveCheck {
        bool legal = false;
        MoveError error = MoveError::NONE;
        std::string reason;
    };

    // What a move did to the opponent, for presentation
    struct ApplyResult {
        std::vector<Position> pushed;  // opponent marbles displaced, nearest first
        bool pushOff = false;          // the last of them left the board
    };

    static Player opponent(Player p) { return p == BLACK ? WHITE : BLACK; }
    static const char* moveErrorMessage(MoveError error);
    static std::vector<std::string> layoutNames();

    Board();

    // Setup
    void clear();
    void setupStandard();
    void setupLayout(const std::string& name);  // throws std::invalid_argument

    // Cell access
    Player get(Position pos) const;
    void set(Position pos, Player player);

    // Score / material
    int getScore(Player player) const { return player == BLACK ? blackScore : whiteScore; }
    void setScore(Player player, int score);
    int marbleCount(Player player) const;
    std::vector<Position> getMarbles(Player player) const;

    // Legality
    bool isLegalMove(const Move& move, Player player) const;
    MoveCheck checkMove(const Move& move, Player player) const;
    bool wouldPush(const Move& move, Player player) const;

    // Mutation. applyMove assumes the move is legal; makeMove checks first
    // and leaves the board untouched when it is not.
    ApplyResult applyMove(const Move& move, Player player);
    bool makeMove(const Move& move, Player player, ApplyResult* result = nullptr);

    bool isGameOver() const;
    Player getWinner() const;

    Board clone() const { return *this; }

    std::string toString() const;
    void print() const;

    bool operator==(const Board& other) const;
    bool operator!=(const Board& other) const { return !(*this == other); }

private:
    MoveError legality(const Move& move, Player player) const;
    MoveError checkInline(const Move& move, Player player) const;
    MoveError checkBroadside(const Move& move) const;

    void applyInline(const Move& move, Player player, ApplyResult& result);
    void applyBroadside(const Move& move, Player player);

    std::array<Player, hex::NUM_CELLS> cells;
    int blackScore;
    int whiteScore;
};

#endif // BOARD_HPP
