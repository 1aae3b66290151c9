#include <catch2/catch_test_macros.hpp>
#include "test_helpers.hpp"
#include "crossword_csp/arc_consistency.hpp"
#include "crossword_csp/assignment.hpp"
#include "crossword_csp/solver.hpp"
#include <algorithm>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace crossword_csp;
using crossword_csp::test::make_grid;

// 完全・単語が相異なる・隣接の重なり文字が一致
static bool is_valid_solution(const Puzzle& p, const Assignment& a) {
    if (a.size() != p.slot_count()) return false;
    std::set<std::string> seen;
    for (const auto& [slot, word] : a) {
        if (word.size() != static_cast<size_t>(p.slot(slot).length)) return false;
        if (!seen.insert(word).second) return false;
        if (!p.words().empty() &&
            !std::binary_search(p.words().begin(), p.words().end(), word)) return false;
    }
    for (size_t x = 0; x < p.slot_count(); ++x) {
        for (size_t y : p.neighbors(x)) {
            auto ov = *p.overlap(x, y);
            if (a.at(x)[ov.first] != a.at(y)[ov.second]) return false;
        }
    }
    return true;
}

// 縦 (0,1) = slot 0、横 (1,0) = slot 1。互いの中央文字で交差
static const std::vector<std::string> CROSS = {"#_#", "___", "#_#"};

// 縦 (0,0) = slot 0、横 (2,0) = slot 1。縦の末尾と横の先頭で交差
static const std::vector<std::string> L_SHAPE = {"_##", "_##", "___"};

// 横 (0,0) = 0、縦 (0,0) = 1、縦 (0,2) = 2、横 (2,0) = 3 の環
static const std::vector<std::string> RING = {"___", "_#_", "___"};

// ============================================================================
// assignment_complete / consistent
// ============================================================================

TEST_CASE("assignment_complete", "[search]") {
    Puzzle p(make_grid(CROSS), {"cat", "car"});

    REQUIRE_FALSE(assignment_complete(p, {}));
    REQUIRE_FALSE(assignment_complete(p, {{0, "cat"}}));
    REQUIRE(assignment_complete(p, {{0, "cat"}, {1, "car"}}));
}

TEST_CASE("consistent", "[search]") {
    SECTION("empty assignment") {
        Puzzle p(make_grid(CROSS), {"cat"});
        REQUIRE(consistent(p, {}));
    }

    SECTION("wrong length") {
        Puzzle p(make_grid(CROSS), {"cat"});
        REQUIRE_FALSE(consistent(p, {{0, "cats"}}));
    }

    SECTION("overlap letters agree") {
        Puzzle p(make_grid(CROSS), {"cat", "car"});
        REQUIRE(consistent(p, {{0, "cat"}, {1, "car"}}));
    }

    SECTION("overlap letters disagree") {
        Puzzle p(make_grid(CROSS), {"cat", "art"});
        REQUIRE_FALSE(consistent(p, {{0, "cat"}, {1, "art"}}));
    }

    SECTION("words must be unique across the whole puzzle") {
        // 2 本の横は重ならないが、同じ単語は使えない
        Puzzle p(make_grid({"___", "###", "___"}), {"cat"});
        REQUIRE(consistent(p, {{0, "cat"}}));
        REQUIRE_FALSE(consistent(p, {{0, "cat"}, {1, "cat"}}));
    }

    SECTION("unassigned neighbors impose nothing") {
        Puzzle p(make_grid(CROSS), {"xyz"});
        REQUIRE(consistent(p, {{1, "xyz"}}));
    }
}

// ============================================================================
// Variable selection (MRV + degree)
// ============================================================================

TEST_CASE("select_unassigned_slot", "[search][mrv]") {
    // 横 (0,0) = 0、縦 (0,0) = 1、横 (2,0) = 2。縦の次数が最大
    Puzzle p(make_grid({"___", "_##", "___"}), {"aaa", "aab", "baa"});
    DomainStore store(p);

    SECTION("ties on domain size go to the highest degree") {
        REQUIRE(select_unassigned_slot(p, store, {}) == 1);
    }

    SECTION("smallest domain wins over degree") {
        REQUIRE(store.domain(2).remove("baa"));
        REQUIRE(select_unassigned_slot(p, store, {}) == 2);
    }

    SECTION("assigned slots are skipped") {
        REQUIRE(select_unassigned_slot(p, store, {{1, "aaa"}}) == 0);
    }

    SECTION("remaining ties go to the lowest slot id") {
        REQUIRE(select_unassigned_slot(p, store, {{1, "aaa"}, {0, "aab"}}) == 2);
    }
}

// ============================================================================
// Value ordering (LCV)
// ============================================================================

TEST_CASE("order_domain_values", "[search][lcv]") {
    Puzzle p(make_grid({"___", "_##", "___"}), {"aaa", "aab", "baa"});
    DomainStore store(p);

    SECTION("conflict counts") {
        // 縦の先頭は横 (0,0) の先頭、末尾は横 (2,0) の先頭と比べる
        REQUIRE(conflict_count(p, store, {}, 1, "aaa") == 2);
        REQUIRE(conflict_count(p, store, {}, 1, "aab") == 3);
        REQUIRE(conflict_count(p, store, {}, 1, "baa") == 3);
    }

    SECTION("fewest conflicts first, ties in word order") {
        auto order = order_domain_values(p, store, {}, 1);
        REQUIRE(order == std::vector<std::string>{"aaa", "aab", "baa"});
    }

    SECTION("assigned neighbors are ignored") {
        Assignment a{{0, "aaa"}};
        REQUIRE(conflict_count(p, store, a, 1, "aab") == 2);
        auto order = order_domain_values(p, store, a, 1);
        REQUIRE(order == std::vector<std::string>{"aaa", "baa", "aab"});
    }

    SECTION("slot without unassigned neighbors keeps word order") {
        Puzzle single(make_grid({"___"}), {"dog", "cat", "ant"});
        DomainStore single_store(single);
        auto order = order_domain_values(single, single_store, {}, 0);
        REQUIRE(order == std::vector<std::string>{"ant", "cat", "dog"});
    }
}

// ============================================================================
// Solver
// ============================================================================

TEST_CASE("Solver single slot", "[solver]") {
    Puzzle p(make_grid({"___"}), {"cat", "dog"});
    Solver solver;

    auto sol = solver.solve(p);
    REQUIRE(sol.has_value());
    REQUIRE(sol->size() == 1);
    const auto& word = sol->at(0);
    REQUIRE((word == "cat" || word == "dog"));
}

TEST_CASE("Solver crossing slots", "[solver]") {
    SECTION("a pair sharing the middle letter exists") {
        Puzzle p(make_grid(CROSS), {"cat", "car", "art"});
        Solver solver;

        auto sol = solver.solve(p);
        REQUIRE(sol.has_value());
        REQUIRE(is_valid_solution(p, *sol));
        REQUIRE(sol->at(0)[1] == 'a');
        REQUIRE(sol->at(1)[1] == 'a');
    }

    SECTION("no pair shares the middle letter") {
        Puzzle p(make_grid(CROSS), {"cat", "art", "dog"});
        Solver solver;

        REQUIRE_FALSE(solver.solve(p).has_value());
        REQUIRE_FALSE(solver.is_stopped());
    }
}

TEST_CASE("Solver rejects reusing the only word", "[solver]") {
    // 自分自身が支持になるので AC-3 は通るが、同じ単語は 2 回使えない
    Puzzle p(make_grid(CROSS), {"cat"});
    Solver solver;

    REQUIRE_FALSE(solver.solve(p).has_value());
    REQUIRE(solver.stats().fail_count > 0);
}

TEST_CASE("Solver skips search when presolve fails", "[solver]") {
    SECTION("no word of the required length") {
        Puzzle p(make_grid({"____", "###_"}), {"cat", "dog"});
        Solver solver;

        REQUIRE_FALSE(solver.solve(p).has_value());
        REQUIRE(solver.stats().node_count == 0);
    }

    SECTION("AC-3 empties a domain") {
        Puzzle p(make_grid(L_SHAPE), {"cat", "dog"});
        Solver solver;

        REQUIRE_FALSE(solver.solve(p).has_value());
        REQUIRE(solver.stats().node_count == 0);
        REQUIRE(solver.stats().revision_count > 0);
    }
}

TEST_CASE("Solver follows MRV and LCV order", "[solver]") {
    // AC-3 後: 縦 {cat}、横 {tea, ten}。縦が先に決まり、横は単語順で tea
    Puzzle p(make_grid(L_SHAPE), {"cat", "tea", "dog", "ten"});
    Solver solver;

    auto sol = solver.solve(p);
    REQUIRE(sol.has_value());
    REQUIRE(*sol == Assignment{{0, "cat"}, {1, "tea"}});
    REQUIRE(solver.stats().max_depth == 2);
    REQUIRE(solver.stats().node_count == 2);
    REQUIRE(solver.stats().fail_count == 0);
}

TEST_CASE("Solver ring puzzle", "[solver]") {
    Puzzle p(make_grid(RING), {"cat", "car", "ten", "run", "dog", "art", "tar", "net", "rat"});

    SECTION("solution is valid") {
        Solver solver;
        auto sol = solver.solve(p);
        REQUIRE(sol.has_value());
        REQUIRE(is_valid_solution(p, *sol));
    }

    SECTION("repeated solves return the same assignment") {
        Solver a;
        Solver b;
        auto first = a.solve(p);
        auto second = a.solve(p);
        auto third = b.solve(p);
        REQUIRE(first.has_value());
        REQUIRE(first == second);
        REQUIRE(first == third);
    }

    SECTION("inference keeps the solution valid") {
        Solver solver;
        solver.set_inference(true);
        auto sol = solver.solve(p);
        REQUIRE(sol.has_value());
        REQUIRE(is_valid_solution(p, *sol));
    }
}

TEST_CASE("Solver solve_all", "[solver]") {
    SECTION("counts every solution") {
        // (cat, car) と (car, cat)
        Puzzle p(make_grid(CROSS), {"cat", "car", "art"});
        Solver solver;
        std::vector<Assignment> found;

        size_t count = solver.solve_all(p, [&found](const Assignment& a) {
            found.push_back(a);
            return true;
        });
        REQUIRE(count == 2);
        REQUIRE(found.size() == 2);
        REQUIRE(found[0] != found[1]);
        for (const auto& a : found) {
            REQUIRE(is_valid_solution(p, a));
        }
        REQUIRE(solver.stats().solution_count == 2);
    }

    SECTION("callback can stop the enumeration") {
        Puzzle p(make_grid(CROSS), {"cat", "car", "art"});
        Solver solver;

        size_t count = solver.solve_all(p, [](const Assignment&) { return false; });
        REQUIRE(count == 1);
    }

    SECTION("unsatisfiable puzzle") {
        Puzzle p(make_grid(CROSS), {"cat"});
        Solver solver;

        size_t count = solver.solve_all(p, [](const Assignment&) { return true; });
        REQUIRE(count == 0);
    }

    SECTION("inference does not change the solution set") {
        Puzzle p(make_grid(RING), {"cat", "car", "ten", "run", "dog", "art", "tar", "net", "rat"});

        auto collect = [&p](bool inference) {
            Solver solver;
            solver.set_inference(inference);
            std::set<Assignment> all;
            solver.solve_all(p, [&all](const Assignment& a) {
                all.insert(a);
                return true;
            });
            return all;
        };

        auto without = collect(false);
        auto with = collect(true);
        REQUIRE(!without.empty());
        REQUIRE(without == with);
    }
}

TEST_CASE("Solver stop", "[solver]") {
    Puzzle p(make_grid({"___"}), {"cat", "dog"});
    Solver solver;

    solver.stop();
    REQUIRE(solver.is_stopped());
    REQUIRE_FALSE(solver.solve(p).has_value());

    solver.reset_stop();
    REQUIRE_FALSE(solver.is_stopped());
    REQUIRE(solver.solve(p).has_value());
}

TEST_CASE("Solver empty grid", "[solver]") {
    // スロットがなければ空の割当が解
    Puzzle p(make_grid({"#_#"}), {"cat"});
    Solver solver;

    auto sol = solver.solve(p);
    REQUIRE(sol.has_value());
    REQUIRE(sol->empty());
}

TEST_CASE("Solver verbose log names slots", "[solver][verbose]") {
    // std::cerr を一時的に差し替えて verbose 出力を取り込む
    struct CerrCapture {
        std::ostringstream buffer;
        std::streambuf* old;
        CerrCapture() : old(std::cerr.rdbuf(buffer.rdbuf())) {}
        ~CerrCapture() { std::cerr.rdbuf(old); }
    };

    SECTION("selected slot during search") {
        Puzzle p(make_grid(L_SHAPE), {"cat", "tea", "dog", "ten"});
        Solver solver;
        solver.set_verbose(true);

        std::string log;
        {
            CerrCapture capture;
            REQUIRE(solver.solve(p).has_value());
            log = capture.buffer.str();
        }
        REQUIRE(log.find("depth=0 select (0, 0) down 3 domain=1") != std::string::npos);
        REQUIRE(log.find("depth=1 select (2, 0) across 3 domain=2") != std::string::npos);
    }

    SECTION("slot without a word of its length") {
        Puzzle p(make_grid({"____", "###_"}), {"cat", "dog"});
        Solver solver;
        solver.set_verbose(true);

        std::string log;
        {
            CerrCapture capture;
            REQUIRE_FALSE(solver.solve(p).has_value());
            log = capture.buffer.str();
        }
        REQUIRE(log.find("no word fits (0, 0) across 4") != std::string::npos);
        REQUIRE(log.find("no word fits (0, 3) down 2") != std::string::npos);
    }

    SECTION("quiet by default") {
        Puzzle p(make_grid({"___"}), {"cat"});
        Solver solver;

        std::string log;
        {
            CerrCapture capture;
            REQUIRE(solver.solve(p).has_value());
            log = capture.buffer.str();
        }
        REQUIRE(log.empty());
    }
}
