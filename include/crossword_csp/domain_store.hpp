/**
 * @file domain_store.hpp
 * @brief スロットごとの定義域ストア
 */
#ifndef CROSSWORD_CSP_DOMAIN_STORE_HPP
#define CROSSWORD_CSP_DOMAIN_STORE_HPP

#include "crossword_csp/puzzle.hpp"
#include "crossword_csp/word_domain.hpp"
#include <cstddef>
#include <vector>

namespace crossword_csp {

/**
 * @brief 定義域ストア
 *
 * slot id をインデックスとして各スロットの候補語集合を保持する。
 * 1 回の solve 呼び出しが排他的に所有し、並行する solve 間で共有しない。
 */
class DomainStore {
public:
    /**
     * @brief 全スロットの定義域を辞書全体で初期化
     */
    explicit DomainStore(const Puzzle& puzzle);

    size_t size() const { return domains_.size(); }

    WordDomain& domain(size_t slot) { return domains_[slot]; }
    const WordDomain& domain(size_t slot) const { return domains_[slot]; }

    /**
     * @brief どれかの定義域が空か
     */
    bool has_empty_domain() const;

private:
    std::vector<WordDomain> domains_;
};

} // namespace crossword_csp

#endif // CROSSWORD_CSP_DOMAIN_STORE_HPP
