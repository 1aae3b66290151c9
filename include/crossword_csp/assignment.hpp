/**
 * @file assignment.hpp
 * @brief 部分割当と探索ヒューリスティクス
 */
#ifndef CROSSWORD_CSP_ASSIGNMENT_HPP
#define CROSSWORD_CSP_ASSIGNMENT_HPP

#include "crossword_csp/domain_store.hpp"
#include "crossword_csp/puzzle.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace crossword_csp {

/**
 * @brief 割当（slot id -> 単語）
 */
using Assignment = std::map<size_t, std::string>;

/**
 * @brief 全スロットに単語が割り当てられているか
 */
bool assignment_complete(const Puzzle& puzzle, const Assignment& assignment);

/**
 * @brief 割当が整合しているか
 *
 * - 各単語の長さがスロット長と一致
 * - 全単語が互いに異なる（パズル全体で）
 * - 割当済みの隣接スロット同士で重なり文字が一致
 *
 * 未割当のスロットは制約しない。
 */
bool consistent(const Puzzle& puzzle, const Assignment& assignment);

/**
 * @brief 次に割り当てるスロットを選択（MRV、同点なら次数の大きい方）
 *
 * それでも同点なら番号の小さいスロット。
 * @pre 未割当のスロットが存在すること
 */
size_t select_unassigned_slot(const Puzzle& puzzle, const DomainStore& domains,
                              const Assignment& assignment);

/**
 * @brief LCV の衝突スコア
 *
 * 未割当の隣接スロットの候補のうち、word と重なり文字が食い違うものの総数。
 * @pre ノード整合性を適用済みであること
 */
size_t conflict_count(const Puzzle& puzzle, const DomainStore& domains,
                      const Assignment& assignment, size_t slot, const std::string& word);

/**
 * @brief スロットの候補を LCV 順（衝突スコア昇順、同点は単語昇順）に並べる
 */
std::vector<std::string> order_domain_values(const Puzzle& puzzle, const DomainStore& domains,
                                             const Assignment& assignment, size_t slot);

} // namespace crossword_csp

#endif // CROSSWORD_CSP_ASSIGNMENT_HPP
