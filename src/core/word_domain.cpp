#include "crossword_csp/word_domain.hpp"
#include <algorithm>

namespace crossword_csp {

WordDomain::WordDomain(std::vector<value_type> words)
    : words_(std::move(words)) {
    // 重複を除去してソート
    std::sort(words_.begin(), words_.end());
    words_.erase(std::unique(words_.begin(), words_.end()), words_.end());
}

bool WordDomain::contains(const value_type& word) const {
    return std::binary_search(words_.begin(), words_.end(), word);
}

bool WordDomain::remove(const value_type& word) {
    auto it = std::lower_bound(words_.begin(), words_.end(), word);
    if (it == words_.end() || *it != word) {
        return false;
    }
    words_.erase(it);
    return true;
}

size_t WordDomain::retain_if(const std::function<bool(const value_type&)>& keep) {
    size_t before = words_.size();
    words_.erase(std::remove_if(words_.begin(), words_.end(),
                                [&keep](const value_type& w) { return !keep(w); }),
                 words_.end());
    return before - words_.size();
}

bool WordDomain::assign(const value_type& word) {
    if (!contains(word)) {
        return false;
    }
    words_.assign(1, word);
    return true;
}

} // namespace crossword_csp
