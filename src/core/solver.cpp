#include "crossword_csp/solver.hpp"
#include "crossword_csp/arc_consistency.hpp"
#include <iostream>

namespace crossword_csp {

std::optional<Assignment> Solver::solve(const Puzzle& puzzle) {
    std::optional<Assignment> result;
    reset_stats();

    DomainStore domains(puzzle);

    if (verbose_) {
        std::cerr << "% [verbose] presolve start: " << puzzle.slot_count()
                  << " slots, " << puzzle.words().size() << " words\n";
    }
    if (!presolve(puzzle, domains)) {
        if (verbose_) std::cerr << "% [verbose] presolve failed\n";
        return std::nullopt;  // UNSAT
    }
    if (verbose_) std::cerr << "% [verbose] presolve done\n";

    auto res = run_search(puzzle, domains, Assignment{}, 0,
                          [&result](const Assignment& a) {
                              result = a;
                              return false;  // 最初の解で停止
                          });

    if (verbose_) {
        std::cerr << "% [verbose] search finished: "
                  << (res == SearchResult::SAT ? "SAT" :
                      res == SearchResult::UNSAT ? "UNSAT" : "UNKNOWN")
                  << " nodes=" << stats_.node_count
                  << " fails=" << stats_.fail_count << "\n";
    }
    return result;
}

size_t Solver::solve_all(const Puzzle& puzzle, AssignmentCallback callback) {
    reset_stats();

    DomainStore domains(puzzle);
    if (!presolve(puzzle, domains)) {
        return 0;  // UNSAT
    }

    size_t count = 0;
    run_search(puzzle, domains, Assignment{}, 0,
               [&count, &callback](const Assignment& a) {
                   count++;
                   return callback(a);  // trueなら継続
               });

    if (verbose_) {
        std::cerr << "% [verbose] enumeration finished: " << count << " solutions\n";
    }
    return count;
}

void Solver::reset_stats() {
    stats_ = SolverStats{};
}

bool Solver::presolve(const Puzzle& puzzle, DomainStore& domains) {
    ArcConsistency ac(puzzle, domains);

    ac.enforce_node_consistency();
    if (domains.has_empty_domain()) {
        // 必要な長さの単語が辞書にないスロットがある
        if (verbose_) {
            for (size_t v = 0; v < domains.size(); ++v) {
                if (domains.domain(v).empty()) {
                    std::cerr << "% [verbose] no word fits " << puzzle.slot(v).to_string() << "\n";
                }
            }
        }
        return false;
    }

    bool ok = ac.ac3();
    stats_.arc_count += ac.arc_count();
    stats_.revision_count += ac.revision_count();

    if (verbose_) {
        std::cerr << "% [verbose] ac3: arcs=" << ac.arc_count()
                  << " revisions=" << ac.revision_count() << "\n";
    }
    return ok;
}

bool Solver::infer(const Puzzle& puzzle, DomainStore& domains,
                   const Assignment& assignment, size_t slot, const std::string& word) {
    if (!domains.domain(slot).assign(word)) {
        return false;
    }

    std::vector<Arc> arcs;
    for (size_t nb : puzzle.neighbors(slot)) {
        if (assignment.count(nb) == 0) {
            arcs.emplace_back(nb, slot);
        }
    }

    ArcConsistency ac(puzzle, domains);
    bool ok = ac.ac3(arcs);
    stats_.arc_count += ac.arc_count();
    stats_.revision_count += ac.revision_count();
    return ok;
}

SearchResult Solver::run_search(const Puzzle& puzzle, const DomainStore& domains,
                                const Assignment& assignment, size_t depth,
                                const AssignmentCallback& callback) {
    // タイムアウトチェック
    if (stopped_) {
        return SearchResult::UNKNOWN;
    }

    if (depth > stats_.max_depth) {
        stats_.max_depth = depth;
    }

    if (assignment_complete(puzzle, assignment)) {
        stats_.solution_count++;
        if (!callback(assignment)) {
            return SearchResult::SAT;
        }
        return SearchResult::UNSAT;  // 全解探索: 次の解へ
    }

    size_t slot = select_unassigned_slot(puzzle, domains, assignment);
    if (verbose_) {
        std::cerr << "% [verbose] depth=" << depth << " select " << puzzle.slot(slot).to_string()
                  << " domain=" << domains.domain(slot).size() << "\n";
    }

    for (const auto& value : order_domain_values(puzzle, domains, assignment, slot)) {
        Assignment next = assignment;
        next[slot] = value;

        if (!consistent(puzzle, next)) {
            continue;
        }
        stats_.node_count++;

        SearchResult res;
        if (inference_) {
            DomainStore narrowed = domains;
            if (!infer(puzzle, narrowed, next, slot, value)) {
                continue;
            }
            res = run_search(puzzle, narrowed, next, depth + 1, callback);
        } else {
            res = run_search(puzzle, domains, next, depth + 1, callback);
        }

        if (res != SearchResult::UNSAT) {
            return res;
        }
    }

    stats_.fail_count++;
    return SearchResult::UNSAT;
}

} // namespace crossword_csp
