/**
 * @file crossword_file.hpp
 * @brief 盤面ファイル・単語リストファイルの読み込み
 */
#ifndef CROSSWORD_CSP_IO_CROSSWORD_FILE_HPP
#define CROSSWORD_CSP_IO_CROSSWORD_FILE_HPP

#include "crossword_csp/grid.hpp"
#include "crossword_csp/puzzle.hpp"
#include <istream>
#include <string>
#include <vector>

namespace crossword_csp {
namespace io {

/// 盤面ファイルで埋められるセルを表す文字
constexpr char FILLABLE_CELL = '_';

/**
 * @brief 盤面を読み込む
 *
 * 1 行が盤面の 1 行。'_' が埋められるセル、それ以外はブロック。
 * 幅は最長行に合わせ、短い行の残りはブロックとする。
 */
Grid read_structure(std::istream& in);

/**
 * @brief 単語リストを読み込む
 *
 * 1 行 1 単語。大文字化し、空行は無視する。
 */
std::vector<std::string> read_words(std::istream& in);

/**
 * @brief ファイルから盤面を読み込む
 * @throws std::runtime_error ファイルを開けない場合
 */
Grid read_structure_file(const std::string& filename);

/**
 * @brief ファイルから単語リストを読み込む
 * @throws std::runtime_error ファイルを開けない場合
 */
std::vector<std::string> read_words_file(const std::string& filename);

/**
 * @brief 盤面ファイルと単語リストファイルからパズルを構築
 */
Puzzle load_puzzle(const std::string& structure_file, const std::string& words_file);

} // namespace io
} // namespace crossword_csp

#endif // CROSSWORD_CSP_IO_CROSSWORD_FILE_HPP
