#include "crossword_csp/io/render.hpp"
#include <fstream>
#include <stdexcept>

namespace crossword_csp {
namespace io {

std::vector<std::vector<char>> letter_grid(const Puzzle& puzzle, const Assignment& assignment) {
    const auto& grid = puzzle.grid();
    std::vector<std::vector<char>> letters(grid.height(), std::vector<char>(grid.width(), '\0'));

    for (const auto& [slot_id, word] : assignment) {
        auto cells = puzzle.slot(slot_id).cells();
        for (size_t k = 0; k < word.size() && k < cells.size(); ++k) {
            letters[static_cast<size_t>(cells[k].first)][static_cast<size_t>(cells[k].second)] = word[k];
        }
    }
    return letters;
}

void print_assignment(std::ostream& out, const Puzzle& puzzle, const Assignment& assignment) {
    const auto& grid = puzzle.grid();
    auto letters = letter_grid(puzzle, assignment);

    for (size_t i = 0; i < grid.height(); ++i) {
        for (size_t j = 0; j < grid.width(); ++j) {
            if (grid.fillable(static_cast<int>(i), static_cast<int>(j))) {
                out << (letters[i][j] != '\0' ? letters[i][j] : ' ');
            } else {
                out << BLOCK_GLYPH;
            }
        }
        out << '\n';
    }
}

void write_assignment_file(const std::string& filename, const Puzzle& puzzle,
                           const Assignment& assignment) {
    std::ofstream out(filename);
    if (!out) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    print_assignment(out, puzzle, assignment);
}

} // namespace io
} // namespace crossword_csp
