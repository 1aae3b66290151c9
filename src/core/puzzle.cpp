#include "crossword_csp/puzzle.hpp"
#include <algorithm>
#include <map>

namespace crossword_csp {

Puzzle::Puzzle(Grid grid, std::vector<std::string> words)
    : grid_(std::move(grid))
    , words_(std::move(words)) {
    std::sort(words_.begin(), words_.end());
    words_.erase(std::unique(words_.begin(), words_.end()), words_.end());

    slots_ = grid_.find_slots();
    compute_overlaps();
}

void Puzzle::compute_overlaps() {
    const size_t n = slots_.size();
    overlaps_.assign(n * n, std::nullopt);
    neighbors_.assign(n, {});

    // セル -> (slot id, スロット内インデックス)
    std::map<Cell, std::vector<std::pair<size_t, size_t>>> cell_users;
    for (size_t id = 0; id < n; ++id) {
        auto cells = slots_[id].cells();
        for (size_t k = 0; k < cells.size(); ++k) {
            cell_users[cells[k]].emplace_back(id, k);
        }
    }

    for (const auto& entry : cell_users) {
        const auto& users = entry.second;
        for (const auto& a : users) {
            for (const auto& b : users) {
                if (a.first == b.first) continue;
                auto& slot_overlap = overlaps_[a.first * n + b.first];
                // 2 スロットが共有するセルは高々 1 つ
                if (!slot_overlap) {
                    slot_overlap = Overlap{a.second, b.second};
                }
            }
        }
    }

    for (size_t x = 0; x < n; ++x) {
        for (size_t y = 0; y < n; ++y) {
            if (overlaps_[x * n + y]) {
                neighbors_[x].push_back(y);
            }
        }
    }
}

} // namespace crossword_csp
