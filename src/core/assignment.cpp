#include "crossword_csp/assignment.hpp"
#include <algorithm>
#include <set>

namespace crossword_csp {

bool assignment_complete(const Puzzle& puzzle, const Assignment& assignment) {
    return assignment.size() == puzzle.slot_count();
}

bool consistent(const Puzzle& puzzle, const Assignment& assignment) {
    // 単語長
    for (const auto& [slot, word] : assignment) {
        if (word.size() != static_cast<size_t>(puzzle.slot(slot).length)) {
            return false;
        }
    }

    // 単語の重複
    std::set<std::string> seen;
    for (const auto& [slot, word] : assignment) {
        if (!seen.insert(word).second) {
            return false;
        }
    }

    // 割当済み隣接スロットとの重なり
    for (const auto& [slot, word] : assignment) {
        for (size_t nb : puzzle.neighbors(slot)) {
            auto it = assignment.find(nb);
            if (it == assignment.end()) continue;
            const auto& overlap = puzzle.overlap(slot, nb);
            if (word[overlap->first] != it->second[overlap->second]) {
                return false;
            }
        }
    }
    return true;
}

size_t select_unassigned_slot(const Puzzle& puzzle, const DomainStore& domains,
                              const Assignment& assignment) {
    size_t best_idx = puzzle.slot_count();
    size_t min_domain_size = 0;
    size_t best_degree = 0;

    for (size_t i = 0; i < puzzle.slot_count(); ++i) {
        if (assignment.count(i) > 0) continue;

        size_t domain_size = domains.domain(i).size();
        size_t degree = puzzle.degree(i);

        bool better = false;
        if (best_idx == puzzle.slot_count()) {
            better = true;
        } else if (domain_size < min_domain_size) {
            better = true;
        } else if (domain_size == min_domain_size && degree > best_degree) {
            better = true;
        }

        if (better) {
            best_idx = i;
            min_domain_size = domain_size;
            best_degree = degree;
        }
    }
    return best_idx;
}

size_t conflict_count(const Puzzle& puzzle, const DomainStore& domains,
                      const Assignment& assignment, size_t slot, const std::string& word) {
    size_t count = 0;
    for (size_t nb : puzzle.neighbors(slot)) {
        if (assignment.count(nb) > 0) continue;
        const auto& overlap = puzzle.overlap(slot, nb);
        const char letter = word[overlap->first];
        for (const auto& nb_val : domains.domain(nb)) {
            if (nb_val[overlap->second] != letter) {
                ++count;
            }
        }
    }
    return count;
}

std::vector<std::string> order_domain_values(const Puzzle& puzzle, const DomainStore& domains,
                                             const Assignment& assignment, size_t slot) {
    const auto& values = domains.domain(slot).values();

    std::vector<std::pair<size_t, const std::string*>> scored;
    scored.reserve(values.size());
    for (const auto& word : values) {
        scored.emplace_back(conflict_count(puzzle, domains, assignment, slot, word), &word);
    }
    // values は昇順なので stable_sort で同点は単語昇順になる
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<std::string> ordered;
    ordered.reserve(scored.size());
    for (const auto& entry : scored) {
        ordered.push_back(*entry.second);
    }
    return ordered;
}

} // namespace crossword_csp
