#include "factlog/reconstruct/grouper.hpp"

#include <algorithm>

namespace factlog {

std::vector<TxGroup> group_by_transaction(std::vector<FactRecord> facts) {
    std::vector<TxGroup> groups;
    if (facts.empty()) return groups;

    // Store iteration order is meaningless; tx order is chronological order
    std::stable_sort(facts.begin(), facts.end(),
                     [](const FactRecord& a, const FactRecord& b) { return a.tx < b.tx; });

    for (auto& fact : facts) {
        if (groups.empty() || groups.back().tx != fact.tx) {
            TxGroup group;
            group.tx = fact.tx;
            groups.push_back(std::move(group));
        }
        TxGroup& current = groups.back();
        if (!current.tx_instant && fact.tx_instant) {
            current.tx_instant = fact.tx_instant;
        }
        current.facts.push_back(std::move(fact));
    }

    return groups;
}

} // namespace factlog
