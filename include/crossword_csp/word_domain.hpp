/**
 * @file word_domain.hpp
 * @brief 単語定義域クラス
 */
#ifndef CROSSWORD_CSP_WORD_DOMAIN_HPP
#define CROSSWORD_CSP_WORD_DOMAIN_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace crossword_csp {

/**
 * @brief スロットの候補語集合
 *
 * 単語は昇順・重複なしの配列で保持するので、走査順は常に決定的。
 * 値の追加は構築時のみで、以後は削除だけを行う。
 */
class WordDomain {
public:
    using value_type = std::string;
    using const_iterator = std::vector<value_type>::const_iterator;

    /**
     * @brief 空の定義域を作成
     */
    WordDomain() = default;

    /**
     * @brief 単語リストから定義域を作成
     * @param words 定義域に含める単語（重複は除去）
     */
    explicit WordDomain(std::vector<value_type> words);

    bool empty() const { return words_.empty(); }
    size_t size() const { return words_.size(); }

    /**
     * @brief 単語が定義域に含まれるか
     */
    bool contains(const value_type& word) const;

    /**
     * @brief 単語を削除
     * @return 単語が削除されたらtrue
     */
    bool remove(const value_type& word);

    /**
     * @brief 述語を満たさない単語を一括削除
     * @return 削除した単語数
     */
    size_t retain_if(const std::function<bool(const value_type&)>& keep);

    /**
     * @brief 指定した単語だけに固定
     * @return 単語が定義域にあればtrue（なければ変更しない）
     */
    bool assign(const value_type& word);

    /**
     * @brief 全ての有効な単語（昇順）
     */
    const std::vector<value_type>& values() const { return words_; }

    const_iterator begin() const { return words_.begin(); }
    const_iterator end() const { return words_.end(); }

private:
    std::vector<value_type> words_;
};

} // namespace crossword_csp

#endif // CROSSWORD_CSP_WORD_DOMAIN_HPP
