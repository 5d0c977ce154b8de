#include "Move.hpp"
#include <algorithm>

Move::Move(std::initializer_list<Position> marbles, Direction direction) {
    init(marbles.begin(), static_cast<int>(marbles.size()), direction);
}

Move::Move(const std::vector<Position>& marbles, Direction direction) {
    init(marbles.data(), static_cast<int>(marbles.size()), direction);
}

void Move::init(const Position* first, int n, Direction direction) {
    direction_ = direction;
    if (n < 1 || n > MAX_MARBLES) {
        count_ = 0;
        return;
    }

    count_ = static_cast<uint8_t>(n);
    std::copy(first, first + n, marbles_.begin());
    std::sort(marbles_.begin(), marbles_.begin() + n);

    if (n == 1) {
        inline_ = true;
    } else {
        Direction lineDir(marbles_[1].row - marbles_[0].row, marbles_[1].col - marbles_[0].col);
        inline_ = (direction == lineDir || direction == hex::opposite(lineDir));
    }
}

std::optional<Move> Move::fromParts(const std::vector<Position>& marbles, Direction direction,
                                    std::string& error) {
    if (marbles.empty() || marbles.size() > static_cast<size_t>(MAX_MARBLES)) {
        error = "Move must contain between 1 and 3 marbles.";
        return std::nullopt;
    }
    for (size_t i = 0; i < marbles.size(); i++) {
        for (size_t j = i + 1; j < marbles.size(); j++) {
            if (marbles[i] == marbles[j]) {
                error = "Move contains duplicate marbles.";
                return std::nullopt;
            }
        }
    }
    for (const auto& pos : marbles) {
        if (!hex::isValid(pos)) {
            error = "Marble position is not on the board.";
            return std::nullopt;
        }
    }
    if (!hex::isDirection(direction)) {
        error = "Direction is not one of the six hex directions.";
        return std::nullopt;
    }

    Move move(marbles, direction);
    if (!move.isContiguousLine()) {
        error = "Marbles must form a contiguous line.";
        return std::nullopt;
    }

    error.clear();
    return move;
}

bool Move::isContiguousLine() const {
    if (count_ <= 1) {
        return count_ == 1;
    }
    Direction step(marbles_[1].row - marbles_[0].row, marbles_[1].col - marbles_[0].col);
    if (!hex::isDirection(step)) {
        return false;
    }
    for (int i = 2; i < count_; i++) {
        Position expected(marbles_[0].row + i * step.drow, marbles_[0].col + i * step.dcol);
        if (marbles_[i] != expected) {
            return false;
        }
    }
    return true;
}

std::pair<Position, Position> Move::leadingAndTrailing() const {
    Position trailing = marbles_[0];
    Position leading = marbles_[0];
    int minProj = hex::projection(trailing, direction_);
    int maxProj = minProj;

    for (int i = 1; i < count_; i++) {
        int p = hex::projection(marbles_[i], direction_);
        if (p < minProj) {
            minProj = p;
            trailing = marbles_[i];
        }
        if (p > maxProj) {
            maxProj = p;
            leading = marbles_[i];
        }
    }
    return {trailing, leading};
}

std::vector<Position> Move::marblesLeadingFirst() const {
    std::vector<Position> ordered = marbles();
    Direction d = direction_;
    std::stable_sort(ordered.begin(), ordered.end(), [d](const Position& a, const Position& b) {
        return hex::projection(a, d) > hex::projection(b, d);
    });
    return ordered;
}

std::string Move::toNotation(bool pushed) const {
    if (count_ == 0) {
        return "";
    }

    std::string text = std::to_string(count_) + ":";
    if (inline_) {
        auto [trailing, leading] = leadingAndTrailing();
        Position goal = hex::neighbor(leading, direction_);
        // goal may sit off the board for candidate moves that are not legal
        text += hex::toString(trailing) + hex::toString(goal);
        if (pushed) {
            text += "*";
        }
    } else {
        text += hex::toString(marbles_[0]) + "-" + hex::toString(marbles_[count_ - 1]);
        text += ">";
        text += hex::directionName(direction_);
    }
    return text;
}

uint32_t Move::key() const {
    // [count:2][direction:3][marble0:6][marble1:6][marble2:6]
    uint32_t k = static_cast<uint32_t>(count_);
    k = (k << 3) | static_cast<uint32_t>(hex::directionIndex(direction_) + 1);
    for (int i = 0; i < MAX_MARBLES; i++) {
        uint32_t cell = (i < count_) ? static_cast<uint32_t>(hex::index(marbles_[i]) + 1) : 0u;
        k = (k << 6) | (cell & 0x3F);
    }
    return k;
}

bool Move::operator==(const Move& other) const {
    if (count_ != other.count_ || direction_ != other.direction_) {
        return false;
    }
    for (int i = 0; i < count_; i++) {
        if (marbles_[i] != other.marbles_[i]) {
            return false;
        }
    }
    return true;
}
