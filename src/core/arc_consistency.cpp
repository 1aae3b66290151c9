#include "crossword_csp/arc_consistency.hpp"
#include <array>
#include <deque>

namespace crossword_csp {

void ArcConsistency::enforce_node_consistency() {
    for (size_t v = 0; v < domains_.size(); ++v) {
        const auto length = static_cast<size_t>(puzzle_.slot(v).length);
        domains_.domain(v).retain_if([length](const std::string& word) {
            return word.size() == length;
        });
    }
}

bool ArcConsistency::revise(size_t x, size_t y) {
    const auto& overlap = puzzle_.overlap(x, y);
    if (!overlap) {
        return false;  // 二項制約なし
    }
    const size_t i = overlap->first;
    const size_t j = overlap->second;

    // y の定義域が重なり位置に持つ文字の集合
    std::array<bool, 256> letters{};
    for (const auto& yval : domains_.domain(y)) {
        if (j < yval.size()) {
            letters[static_cast<unsigned char>(yval[j])] = true;
        }
    }

    size_t removed = domains_.domain(x).retain_if([i, &letters](const std::string& xval) {
        return i < xval.size() && letters[static_cast<unsigned char>(xval[i])];
    });
    if (removed > 0) {
        ++revision_count_;
        return true;
    }
    return false;
}

std::vector<Arc> ArcConsistency::all_arcs() const {
    std::vector<Arc> arcs;
    for (size_t x = 0; x < puzzle_.slot_count(); ++x) {
        for (size_t y : puzzle_.neighbors(x)) {
            arcs.emplace_back(x, y);
        }
    }
    return arcs;
}

bool ArcConsistency::ac3() {
    return ac3(all_arcs());
}

bool ArcConsistency::ac3(const std::vector<Arc>& arcs) {
    std::deque<Arc> queue(arcs.begin(), arcs.end());

    while (!queue.empty()) {
        Arc arc = queue.front();
        queue.pop_front();
        ++arc_count_;

        const size_t x = arc.first;
        const size_t y = arc.second;
        if (!revise(x, y)) {
            continue;
        }
        if (domains_.domain(x).empty()) {
            return false;
        }
        // x の定義域が狭まったので、x に支えられていた隣接を再検査
        for (size_t z : puzzle_.neighbors(x)) {
            if (z != y) {
                queue.emplace_back(z, x);
            }
        }
    }
    return true;
}

} // namespace crossword_csp
