/**
 * @file render.hpp
 * @brief 割当のテキスト描画
 */
#ifndef CROSSWORD_CSP_IO_RENDER_HPP
#define CROSSWORD_CSP_IO_RENDER_HPP

#include "crossword_csp/assignment.hpp"
#include "crossword_csp/puzzle.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace crossword_csp {
namespace io {

/// ブロックセルの描画文字（UTF-8）
constexpr const char* BLOCK_GLYPH = "█";

/**
 * @brief 割当を文字グリッドに展開
 * @return height × width。文字が入らないセルは '\0'
 */
std::vector<std::vector<char>> letter_grid(const Puzzle& puzzle, const Assignment& assignment);

/**
 * @brief 割当を出力
 *
 * 埋められるセルは割り当てられた文字（未割当なら空白）、
 * ブロックセルは BLOCK_GLYPH。1 行ごとに改行する。
 */
void print_assignment(std::ostream& out, const Puzzle& puzzle, const Assignment& assignment);

/**
 * @brief 割当をテキストファイルに書き出す（内容は print_assignment と同じ）
 * @throws std::runtime_error ファイルを開けない場合
 */
void write_assignment_file(const std::string& filename, const Puzzle& puzzle,
                           const Assignment& assignment);

} // namespace io
} // namespace crossword_csp

#endif // CROSSWORD_CSP_IO_RENDER_HPP
