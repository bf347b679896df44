#include "factlog/store/memory_store.hpp"

#include <algorithm>

#include "factlog/error.hpp"
#include "factlog/logging.hpp"

namespace factlog {

std::optional<TxId> MemoryFactStore::transact(const EntityId& entity, const AttributeMap& changes,
                                              std::optional<Instant> instant) {
    FACTLOG_CHECK_ARGUMENT(!entity.empty(), "Entity id must not be empty");
    FACTLOG_CHECK_ARGUMENT(!instant || instant->in_range(), "Transaction instant out of range");

    std::lock_guard<std::mutex> lock(mutex_);

    AttributeMap& current = current_[entity];
    const TxId tx = next_tx_;
    const Instant when = instant ? *instant : Instant::now();

    std::vector<FactRecord> facts = plan_assertions(current, changes);
    if (facts.empty()) {
        if (current.empty()) current_.erase(entity);
        return std::nullopt;
    }

    for (auto& fact : facts) {
        fact.tx = tx;
        fact.tx_instant = when;
        if (fact.added) current.insert_or_assign(fact.attribute, fact.value);
    }
    auto& log = log_[entity];
    log.insert(log.end(), facts.begin(), facts.end());
    ++next_tx_;

    LOG_DEBUG("tx ", tx, " wrote ", facts.size(), " facts for ", entity);
    return tx;
}

std::optional<TxId> MemoryFactStore::retract(const EntityId& entity,
                                             const std::vector<Attribute>& attributes,
                                             std::optional<Instant> instant) {
    FACTLOG_CHECK_ARGUMENT(!entity.empty(), "Entity id must not be empty");
    FACTLOG_CHECK_ARGUMENT(!instant || instant->in_range(), "Transaction instant out of range");

    std::lock_guard<std::mutex> lock(mutex_);

    auto entity_it = current_.find(entity);
    if (entity_it == current_.end()) return std::nullopt;

    AttributeMap& current = entity_it->second;
    const TxId tx = next_tx_;
    const Instant when = instant ? *instant : Instant::now();

    std::vector<FactRecord> facts = plan_retractions(current, attributes);
    for (const auto& fact : facts) {
        current.erase(fact.attribute);
    }
    if (facts.empty()) return std::nullopt;

    for (auto& fact : facts) {
        fact.tx = tx;
        fact.tx_instant = when;
    }
    auto& log = log_[entity];
    log.insert(log.end(), facts.begin(), facts.end());
    ++next_tx_;
    return tx;
}

std::vector<FactRecord> MemoryFactStore::query_history(const EntityId& entity) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = log_.find(entity);
    if (it == log_.end()) return {};
    return it->second;
}

std::optional<AttributeMap> MemoryFactStore::query_current(const EntityId& entity) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = current_.find(entity);
    if (it == current_.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

size_t MemoryFactStore::fact_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& [entity, facts] : log_) {
        total += facts.size();
    }
    return total;
}

std::vector<EntityId> MemoryFactStore::entities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EntityId> ids;
    ids.reserve(log_.size());
    for (const auto& [entity, facts] : log_) {
        ids.push_back(entity);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace factlog
