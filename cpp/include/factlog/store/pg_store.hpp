/**
 * @file pg_store.hpp
 * @brief PostgreSQL-backed fact log
 *
 * Tables:
 *   factlog_tx   (tx BIGSERIAL PRIMARY KEY, tx_instant TIMESTAMPTZ)
 *   factlog_fact (entity, tx, attribute, value_type, value, added)
 *
 * Values are stored through the Value text codec (value_type is the tag).
 */

#pragma once

#include <optional>
#include <vector>

#include "factlog/db/connection.hpp"
#include "factlog/store/fact_store.hpp"

namespace factlog {

class PgFactStore : public FactStore {
public:
    explicit PgFactStore(const db::ConnectionConfig& config, size_t pool_size = 4)
        : pool_(config, pool_size) {}

    // CREATE TABLE IF NOT EXISTS for both tables and the entity index
    void ensure_schema();

    /**
     * Write one transaction. Writers to the same entity are serialised with
     * a transaction-scoped advisory lock.
     * @return The new tx id, or nullopt when nothing changed.
     */
    std::optional<TxId> transact(const EntityId& entity, const AttributeMap& changes,
                                 std::optional<Instant> instant = std::nullopt);

    std::optional<TxId> retract(const EntityId& entity, const std::vector<Attribute>& attributes,
                                std::optional<Instant> instant = std::nullopt);

    // One SELECT inside a REPEATABLE READ READ ONLY transaction
    std::vector<FactRecord> query_history(const EntityId& entity) override;
    std::optional<AttributeMap> query_current(const EntityId& entity) override;

    db::ConnectionPool& pool() { return pool_; }

private:
    std::optional<TxId> write(const EntityId& entity, std::vector<FactRecord> facts,
                              std::optional<Instant> instant, PGconn* conn);

    db::ConnectionPool pool_;
};

} // namespace factlog
