/**
 * @file grid.hpp
 * @brief クロスワードの盤面形状（埋められるセル／ブロックセル）
 */
#ifndef CROSSWORD_CSP_GRID_HPP
#define CROSSWORD_CSP_GRID_HPP

#include "crossword_csp/slot.hpp"
#include <cstddef>
#include <vector>

namespace crossword_csp {

/**
 * @brief 盤面形状
 *
 * height × width の行列で、各セルは埋められる (fillable) かブロックか。
 * 構築後は不変。
 */
class Grid {
public:
    Grid() = default;

    /**
     * @brief 盤面を作成
     * @param height 行数
     * @param width 列数
     * @param fillable 行優先の fillable フラグ（サイズ height * width）
     */
    Grid(size_t height, size_t width, std::vector<bool> fillable);

    /**
     * @brief 行ごとのフラグから盤面を作成（短い行はブロックで埋める）
     */
    explicit Grid(const std::vector<std::vector<bool>>& rows);

    size_t height() const { return height_; }
    size_t width() const { return width_; }

    /**
     * @brief セルが埋められるか（盤面外は false）
     */
    bool fillable(int row, int col) const;

    /**
     * @brief 盤面からスロットを抽出
     *
     * 直前のセルがブロックまたは盤面外である fillable セルから始まる
     * 最大ランをスロットとする。長さ 1 のランはスロットにしない。
     * @return Slot の昇順に並んだスロット列
     */
    std::vector<Slot> find_slots() const;

private:
    size_t height_ = 0;
    size_t width_ = 0;
    std::vector<bool> cells_;  // 行優先
};

} // namespace crossword_csp

#endif // CROSSWORD_CSP_GRID_HPP
