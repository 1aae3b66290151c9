#include "crossword_csp/io/crossword_file.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace crossword_csp {
namespace io {

namespace {

// 行末の '\r' を除去（CRLF のファイル対策）
void chomp(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

}  // namespace

Grid read_structure(std::istream& in) {
    std::vector<std::vector<bool>> rows;
    std::string line;
    while (std::getline(in, line)) {
        chomp(line);
        std::vector<bool> row(line.size());
        for (size_t j = 0; j < line.size(); ++j) {
            row[j] = (line[j] == FILLABLE_CELL);
        }
        rows.push_back(std::move(row));
    }
    return Grid(rows);
}

std::vector<std::string> read_words(std::istream& in) {
    std::vector<std::string> words;
    std::string line;
    while (std::getline(in, line)) {
        chomp(line);
        if (line.empty()) continue;
        std::transform(line.begin(), line.end(), line.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        words.push_back(line);
    }
    return words;
}

Grid read_structure_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    return read_structure(file);
}

std::vector<std::string> read_words_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    return read_words(file);
}

Puzzle load_puzzle(const std::string& structure_file, const std::string& words_file) {
    return Puzzle(read_structure_file(structure_file), read_words_file(words_file));
}

} // namespace io
} // namespace crossword_csp
