/**
 * @file puzzle.hpp
 * @brief パズルモデル（スロット・重なり関係・隣接関係・辞書）
 */
#ifndef CROSSWORD_CSP_PUZZLE_HPP
#define CROSSWORD_CSP_PUZZLE_HPP

#include "crossword_csp/grid.hpp"
#include "crossword_csp/slot.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace crossword_csp {

/**
 * @brief 2 スロットの重なり位置
 *
 * x の first 文字目と y の second 文字目が同じセルを指す。
 */
struct Overlap {
    size_t first;
    size_t second;

    bool operator==(const Overlap& other) const {
        return first == other.first && second == other.second;
    }
};

/**
 * @brief パズルモデル
 *
 * 盤面形状から抽出したスロット、全スロット対の重なり関係、
 * 隣接リスト、候補語の辞書を保持する。構築後は不変で、
 * 複数のソルバーから読み取り専用で共有してよい。
 *
 * スロットは Slot の昇順に番号 (slot id) が振られ、
 * エンジン内部ではこの番号で参照する。
 */
class Puzzle {
public:
    /**
     * @brief 盤面と辞書からパズルを作成
     * @param grid 盤面形状
     * @param words 候補語（重複は除去され昇順に整列される）
     */
    Puzzle(Grid grid, std::vector<std::string> words);

    const Grid& grid() const { return grid_; }

    /**
     * @brief スロット数
     */
    size_t slot_count() const { return slots_.size(); }

    const std::vector<Slot>& slots() const { return slots_; }
    const Slot& slot(size_t id) const { return slots_[id]; }

    /**
     * @brief 重なり位置を取得
     * @return 重ならない（または x == y）なら std::nullopt
     */
    const std::optional<Overlap>& overlap(size_t x, size_t y) const {
        return overlaps_[x * slots_.size() + y];
    }

    /**
     * @brief x と重なる全スロット（番号昇順）
     */
    const std::vector<size_t>& neighbors(size_t x) const { return neighbors_[x]; }

    /**
     * @brief 次数（隣接スロット数）
     */
    size_t degree(size_t x) const { return neighbors_[x].size(); }

    /**
     * @brief 辞書（昇順・重複なし）
     */
    const std::vector<std::string>& words() const { return words_; }

private:
    void compute_overlaps();

    Grid grid_;
    std::vector<Slot> slots_;
    std::vector<std::optional<Overlap>> overlaps_;  // slots_.size() × slots_.size()
    std::vector<std::vector<size_t>> neighbors_;
    std::vector<std::string> words_;
};

} // namespace crossword_csp

#endif // CROSSWORD_CSP_PUZZLE_HPP
