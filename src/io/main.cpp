#include "crossword_csp/io/crossword_file.hpp"
#include "crossword_csp/io/render.hpp"
#include "crossword_csp/solver.hpp"
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <unistd.h>

crossword_csp::Solver* g_current_solver = nullptr;

void timeout_handler(int) {
    if (g_current_solver) {
        g_current_solver->stop();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-a] [-i] [-s] [-v] [-t SEC] <structure> <words> [text-output]\n";
    std::cerr << "  text-output  Also write the rendered grid, as text, to this file\n";
    std::cerr << "  -a      Count all solutions (the first one is printed)\n";
    std::cerr << "  -i      Run arc consistency after every assignment during search\n";
    std::cerr << "  -s      Print solver statistics to stderr\n";
    std::cerr << "  -v      Verbose mode (print presolve/search progress)\n";
    std::cerr << "  -t SEC  Timeout in seconds\n";
}

bool g_print_stats = false;
bool g_verbose = false;

void print_stats(const crossword_csp::Solver& solver) {
    if (!g_print_stats) return;
    const auto& s = solver.stats();
    std::cerr << "% Stats: nodes=" << s.node_count
              << " fails=" << s.fail_count
              << " max_depth=" << s.max_depth
              << " arcs=" << s.arc_count
              << " revisions=" << s.revision_count
              << " solutions=" << s.solution_count
              << "\n";
}

/**
 * @brief 解を標準出力（と指定があればテキストファイル）に書き出す
 */
void write_solution(const crossword_csp::Puzzle& puzzle,
                    const crossword_csp::Assignment& assignment,
                    const char* text_output) {
    crossword_csp::io::print_assignment(std::cout, puzzle, assignment);
    if (text_output) {
        crossword_csp::io::write_assignment_file(text_output, puzzle, assignment);
    }
}

int main(int argc, char* argv[]) {
    bool find_all = false;
    bool inference = false;
    const char* positional[3] = {nullptr, nullptr, nullptr};
    int n_positional = 0;
    int timeout_sec = 0;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-a") == 0) {
            find_all = true;
        } else if (std::strcmp(argv[i], "-i") == 0) {
            inference = true;
        } else if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            g_verbose = true;
        } else if (std::strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            timeout_sec = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-' && n_positional < 3) {
            positional[n_positional++] = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (n_positional < 2) {
        print_usage(argv[0]);
        return 1;
    }

    // Setup timeout
    if (timeout_sec > 0) {
        std::signal(SIGALRM, timeout_handler);
        alarm(static_cast<unsigned>(timeout_sec));
    }

    try {
        auto puzzle = crossword_csp::io::load_puzzle(positional[0], positional[1]);

        crossword_csp::Solver solver;
        solver.set_verbose(g_verbose);
        solver.set_inference(inference);
        g_current_solver = &solver;

        std::optional<crossword_csp::Assignment> first;
        if (find_all) {
            size_t count = solver.solve_all(puzzle, [&first](const crossword_csp::Assignment& a) {
                if (!first) first = a;
                return true;
            });
            print_stats(solver);
            if (first) {
                write_solution(puzzle, *first, positional[2]);
            }
            if (solver.is_stopped()) {
                std::cout << "Unknown (timeout). " << count << " solutions so far.\n";
            } else if (count == 0) {
                std::cout << "No solution.\n";
            } else {
                std::cout << count << " solutions.\n";
            }
        } else {
            first = solver.solve(puzzle);
            print_stats(solver);
            if (first) {
                write_solution(puzzle, *first, positional[2]);
            } else if (solver.is_stopped()) {
                std::cout << "Unknown (timeout).\n";
            } else {
                std::cout << "No solution.\n";
            }
        }
        g_current_solver = nullptr;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
