/**
 * @file arc_consistency.hpp
 * @brief ノード整合性・アーク整合性（AC-3）
 */
#ifndef CROSSWORD_CSP_ARC_CONSISTENCY_HPP
#define CROSSWORD_CSP_ARC_CONSISTENCY_HPP

#include "crossword_csp/domain_store.hpp"
#include "crossword_csp/puzzle.hpp"
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace crossword_csp {

/**
 * @brief 有向アーク (x, y): x の定義域を y に対して整合させる
 */
using Arc = std::pair<size_t, size_t>;

/**
 * @brief 整合性エンジン
 *
 * パズル（読み取り専用）と定義域ストア（書き換え対象）への参照を持ち、
 * 単項制約（単語長）と二項制約（重なり文字の一致）で定義域を絞り込む。
 */
class ArcConsistency {
public:
    ArcConsistency(const Puzzle& puzzle, DomainStore& domains)
        : puzzle_(puzzle), domains_(domains) {}

    /**
     * @brief ノード整合性: スロット長と異なる長さの単語を除去
     */
    void enforce_node_consistency();

    /**
     * @brief x を y に対してアーク整合にする
     *
     * y の定義域に重なり文字が一致する単語を持たない x の単語を除去する。
     * x と y が重ならなければ何もしない。
     *
     * @return x の定義域から単語を除去したらtrue
     */
    bool revise(size_t x, size_t y);

    /**
     * @brief 全アークで AC-3 を実行
     * @return 全定義域が空でなければtrue
     */
    bool ac3();

    /**
     * @brief 指定アークをキューの初期値として AC-3 を実行
     *
     * キューは FIFO で重複を許す。x の定義域が狭まったら
     * y 以外の全隣接 z について (z, x) を末尾に追加する。
     *
     * @return 全定義域が空でなければtrue（空になった時点で即 false）
     */
    bool ac3(const std::vector<Arc>& arcs);

    /**
     * @brief 全アーク（x 昇順、各 x で隣接 y 昇順）
     */
    std::vector<Arc> all_arcs() const;

    /**
     * @brief これまでに処理したアーク数
     */
    size_t arc_count() const { return arc_count_; }

    /**
     * @brief 定義域を狭めた revise の回数
     */
    size_t revision_count() const { return revision_count_; }

private:
    const Puzzle& puzzle_;
    DomainStore& domains_;
    size_t arc_count_ = 0;
    size_t revision_count_ = 0;
};

} // namespace crossword_csp

#endif // CROSSWORD_CSP_ARC_CONSISTENCY_HPP
