/**
 * @file pipeline.hpp
 * @brief Fact history -> ordered snapshot sequence
 *
 * store -> facts -> group_by_transaction -> resolve_delta -> accumulate
 *
 * Everything after the fetch is pure: no locks, no shared state, safe to
 * run concurrently for any entities.
 */

#pragma once

#include <map>
#include <optional>
#include <vector>

#include "factlog/store/fact_store.hpp"
#include "factlog/types.hpp"

namespace factlog {

class Config;

struct ReconstructOptions {
    RetractionPolicy retraction_policy = RetractionPolicy::Freeze;
    size_t max_threads = 0;  // reconstruct_many workers; 0 = hardware concurrency

    /**
     * Read reconstruct.retraction_policy and perf.max_threads.
     * @throws ConfigError on an unknown policy name.
     */
    static ReconstructOptions from_config(const Config& config);
};

// Group and resolve without accumulating: one Delta per transaction, oldest first
std::vector<Delta> resolve_deltas(std::vector<FactRecord> facts);

/**
 * Reconstruct from facts the caller already holds.
 * @return One snapshot per distinct tx, oldest first; empty for no facts.
 * @throws MalformedFactGroupError on a corrupted transaction.
 */
std::vector<Snapshot> reconstruct(std::vector<FactRecord> facts,
                                  const ReconstructOptions& options = {});

/**
 * Store-backed reconstruction. Each call issues a single bulk history read
 * and keeps nothing afterwards. A failed read raises StoreUnavailableError
 * and no partial result is produced. Never retries.
 */
class Reconstructor {
public:
    explicit Reconstructor(FactStore& store, ReconstructOptions options = {})
        : store_(store), options_(options) {}

    // Full history; back() is the current state. Empty means entity not found.
    std::vector<Snapshot> reconstruct(const EntityId& entity) const;

    // Per-transaction deltas, oldest first
    std::vector<Delta> changes(const EntityId& entity) const;

    std::optional<Snapshot> current(const EntityId& entity) const;

    // State after the latest tx <= tx; nullopt if the entity did not exist yet
    std::optional<Snapshot> as_of(const EntityId& entity, TxId tx) const;

    /**
     * Reconstruct several entities on a worker pool.
     * All tasks finish before the first failure is rethrown.
     */
    std::map<EntityId, std::vector<Snapshot>>
    reconstruct_many(const std::vector<EntityId>& entities) const;

    const ReconstructOptions& options() const { return options_; }

private:
    std::vector<FactRecord> fetch(const EntityId& entity) const;

    FactStore& store_;
    ReconstructOptions options_;
};

} // namespace factlog
