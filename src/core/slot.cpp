#include "crossword_csp/slot.hpp"

namespace crossword_csp {

std::vector<Cell> Slot::cells() const {
    std::vector<Cell> result;
    result.reserve(static_cast<size_t>(length));
    for (int k = 0; k < length; ++k) {
        if (direction == Direction::Down) {
            result.emplace_back(row + k, col);
        } else {
            result.emplace_back(row, col + k);
        }
    }
    return result;
}

std::string Slot::to_string() const {
    return "(" + std::to_string(row) + ", " + std::to_string(col) + ") " +
           (direction == Direction::Across ? "across " : "down ") +
           std::to_string(length);
}

} // namespace crossword_csp
