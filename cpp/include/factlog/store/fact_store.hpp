/**
 * @file fact_store.hpp
 * @brief Interface to the external store that owns the fact log
 */

#pragma once

#include <optional>
#include <vector>

#include "factlog/types.hpp"

namespace factlog {

/**
 * Source of an entity's facts. Implementations throw StoreUnavailableError
 * when they cannot answer; they never return partial results.
 */
class FactStore {
public:
    virtual ~FactStore() = default;

    /**
     * Every assertion and retraction ever made for the entity, in no
     * particular order, read as one consistent point in time. Retractions
     * must not be omitted. Empty when the entity is unknown.
     */
    virtual std::vector<FactRecord> query_history(const EntityId& entity) = 0;

    // Current attribute values, or nullopt when the entity has none
    virtual std::optional<AttributeMap> query_current(const EntityId& entity) = 0;
};

/**
 * Facts a store writes to move an entity from current to current+changes:
 * a retraction of the old value and an assertion of the new one for every
 * changed attribute, an assertion alone for a new attribute, nothing for an
 * unchanged one. tx and tx_instant are left for the caller to stamp.
 */
std::vector<FactRecord> plan_assertions(const AttributeMap& current, const AttributeMap& changes);

// Retractions for the attributes of `attributes` that currently hold a value
std::vector<FactRecord> plan_retractions(const AttributeMap& current,
                                         const std::vector<Attribute>& attributes);

} // namespace factlog
