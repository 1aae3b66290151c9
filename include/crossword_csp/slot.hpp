/**
 * @file slot.hpp
 * @brief クロスワードのスロット（CSP変数）
 */
#ifndef CROSSWORD_CSP_SLOT_HPP
#define CROSSWORD_CSP_SLOT_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace crossword_csp {

/**
 * @brief スロットの向き
 */
enum class Direction {
    Across,  // 横
    Down     // 縦
};

/**
 * @brief グリッド上のセル位置 (row, col)
 */
using Cell = std::pair<int, int>;

/**
 * @brief スロット（埋めるべき連続セルの最大ラン）
 *
 * 4 属性（開始行・開始列・長さ・向き）が全て一致するとき等しい。
 */
struct Slot {
    int row = 0;
    int col = 0;
    int length = 0;
    Direction direction = Direction::Across;

    Slot() = default;
    Slot(int r, int c, int len, Direction dir)
        : row(r), col(c), length(len), direction(dir) {}

    /**
     * @brief スロットが覆うセルを文字順に列挙
     */
    std::vector<Cell> cells() const;

    /**
     * @brief 表示用の名前 (例: "(0, 2) across 5")
     */
    std::string to_string() const;

    bool operator==(const Slot& other) const {
        return row == other.row && col == other.col &&
               length == other.length && direction == other.direction;
    }

    bool operator!=(const Slot& other) const { return !(*this == other); }

    // (row, col, direction, length) の辞書順
    bool operator<(const Slot& other) const {
        if (row != other.row) return row < other.row;
        if (col != other.col) return col < other.col;
        if (direction != other.direction) return direction < other.direction;
        return length < other.length;
    }
};

} // namespace crossword_csp

namespace std {

template <>
struct hash<crossword_csp::Slot> {
    size_t operator()(const crossword_csp::Slot& s) const {
        size_t h = std::hash<int>()(s.row);
        h = h * 31 + std::hash<int>()(s.col);
        h = h * 31 + std::hash<int>()(s.length);
        h = h * 31 + static_cast<size_t>(s.direction);
        return h;
    }
};

} // namespace std

#endif // CROSSWORD_CSP_SLOT_HPP
