#include "factlog/reconstruct/accumulator.hpp"

namespace factlog {

AttributeMap merge_into(const AttributeMap& base, const AttributeMap& overlay) {
    AttributeMap merged = base;
    for (const auto& [attribute, value] : overlay) {
        merged.insert_or_assign(attribute, value);
    }
    return merged;
}

std::vector<Snapshot> accumulate(const std::vector<Delta>& deltas, RetractionPolicy policy) {
    std::vector<Snapshot> snapshots;
    snapshots.reserve(deltas.size());

    for (const auto& delta : deltas) {
        Snapshot snapshot;
        snapshot.tx = delta.tx;
        snapshot.tx_instant = delta.tx_instant;
        snapshot.state = snapshots.empty()
            ? delta.values
            : merge_into(snapshots.back().state, delta.values);

        if (policy == RetractionPolicy::Remove) {
            for (const auto& attribute : delta.retracted) {
                snapshot.state.erase(attribute);
            }
        }

        snapshots.push_back(std::move(snapshot));
    }

    return snapshots;
}

} // namespace factlog
