#include "crossword_csp/grid.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace crossword_csp {

Grid::Grid(size_t height, size_t width, std::vector<bool> fillable)
    : height_(height)
    , width_(width)
    , cells_(std::move(fillable)) {
    if (cells_.size() != height_ * width_) {
        throw std::invalid_argument("Grid: cell count does not match height * width");
    }
}

Grid::Grid(const std::vector<std::vector<bool>>& rows)
    : height_(rows.size())
    , width_(0) {
    for (const auto& row : rows) {
        width_ = std::max(width_, row.size());
    }
    cells_.assign(height_ * width_, false);
    for (size_t i = 0; i < height_; ++i) {
        for (size_t j = 0; j < rows[i].size(); ++j) {
            cells_[i * width_ + j] = rows[i][j];
        }
    }
}

bool Grid::fillable(int row, int col) const {
    if (row < 0 || col < 0) return false;
    auto r = static_cast<size_t>(row);
    auto c = static_cast<size_t>(col);
    if (r >= height_ || c >= width_) return false;
    return cells_[r * width_ + c];
}

std::vector<Slot> Grid::find_slots() const {
    std::vector<Slot> slots;
    const int h = static_cast<int>(height_);
    const int w = static_cast<int>(width_);

    for (int i = 0; i < h; ++i) {
        for (int j = 0; j < w; ++j) {
            if (!fillable(i, j)) continue;

            // 縦
            if (!fillable(i - 1, j)) {
                int length = 1;
                while (fillable(i + length, j)) ++length;
                if (length > 1) {
                    slots.emplace_back(i, j, length, Direction::Down);
                }
            }

            // 横
            if (!fillable(i, j - 1)) {
                int length = 1;
                while (fillable(i, j + length)) ++length;
                if (length > 1) {
                    slots.emplace_back(i, j, length, Direction::Across);
                }
            }
        }
    }

    std::sort(slots.begin(), slots.end());
    return slots;
}

} // namespace crossword_csp
