/**
 * @file memory_store.hpp
 * @brief Append-only in-memory fact log
 */

#pragma once

#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "factlog/store/fact_store.hpp"

namespace factlog {

/**
 * In-memory FactStore. Writes follow the same rules as a durable fact
 * store: changing an attribute emits a retraction of the old value and an
 * assertion of the new one under a single tx id; re-asserting the current
 * value is dropped as redundant. Thread-safe.
 */
class MemoryFactStore : public FactStore {
public:
    explicit MemoryFactStore(TxId first_tx = 1) : next_tx_(first_tx) {}

    /**
     * Record one transaction for entity.
     * @param changes Attribute values to assert.
     * @param instant Commit time; defaults to now.
     * @return The tx id, or nullopt when nothing actually changed.
     */
    std::optional<TxId> transact(const EntityId& entity, const AttributeMap& changes,
                                 std::optional<Instant> instant = std::nullopt);

    // Retract attributes without replacement. Unknown attributes are ignored.
    std::optional<TxId> retract(const EntityId& entity, const std::vector<Attribute>& attributes,
                                std::optional<Instant> instant = std::nullopt);

    std::vector<FactRecord> query_history(const EntityId& entity) override;
    std::optional<AttributeMap> query_current(const EntityId& entity) override;

    size_t fact_count() const;
    std::vector<EntityId> entities() const;

private:
    mutable std::mutex mutex_;
    TxId next_tx_;
    std::unordered_map<EntityId, std::vector<FactRecord>> log_;
    std::unordered_map<EntityId, AttributeMap> current_;
};

} // namespace factlog
