#include "crossword_csp/domain_store.hpp"
#include <algorithm>

namespace crossword_csp {

DomainStore::DomainStore(const Puzzle& puzzle)
    : domains_(puzzle.slot_count(), WordDomain(puzzle.words())) {}

bool DomainStore::has_empty_domain() const {
    return std::any_of(domains_.begin(), domains_.end(),
                       [](const WordDomain& d) { return d.empty(); });
}

} // namespace crossword_csp
