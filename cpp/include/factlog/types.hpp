#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "factlog/value.hpp"

namespace factlog {

// Store-assigned transaction id. Monotonic, so ascending id == commit order.
using TxId = int64_t;

// Attribute identifier, namespaced by convention (order/operator)
using Attribute = std::string;

// Opaque entity identifier understood by the fact store
using EntityId = std::string;

// attribute -> value; ordered so that snapshots print and compare deterministically
using AttributeMap = std::map<Attribute, Value>;

/**
 * One row of an entity's change log. Immutable once written.
 * added == true asserts the value as of tx, false retracts it.
 */
struct FactRecord {
    TxId tx = 0;
    Attribute attribute;
    Value value;
    bool added = true;
    std::optional<Instant> tx_instant;

    FactRecord() = default;
    FactRecord(TxId tx_, Attribute attribute_, Value value_, bool added_,
               std::optional<Instant> tx_instant_ = std::nullopt)
        : tx(tx_), attribute(std::move(attribute_)), value(std::move(value_)),
          added(added_), tx_instant(tx_instant_) {}

    bool operator==(const FactRecord& other) const {
        return tx == other.tx && attribute == other.attribute &&
               value == other.value && added == other.added &&
               tx_instant == other.tx_instant;
    }
    bool operator!=(const FactRecord& other) const { return !(*this == other); }
};

// Every fact committed by one transaction
struct TxGroup {
    TxId tx = 0;
    std::optional<Instant> tx_instant;
    std::vector<FactRecord> facts;
};

/**
 * Net effect of one transaction: the attributes it asserted, plus the
 * attributes it retracted without asserting a replacement.
 */
struct Delta {
    TxId tx = 0;
    std::optional<Instant> tx_instant;
    AttributeMap values;
    std::vector<Attribute> retracted;

    bool operator==(const Delta& other) const {
        return tx == other.tx && tx_instant == other.tx_instant &&
               values == other.values && retracted == other.retracted;
    }
    bool operator!=(const Delta& other) const { return !(*this == other); }
};

// Complete entity state immediately after tx
struct Snapshot {
    TxId tx = 0;
    std::optional<Instant> tx_instant;
    AttributeMap state;

    bool operator==(const Snapshot& other) const {
        return tx == other.tx && tx_instant == other.tx_instant && state == other.state;
    }
    bool operator!=(const Snapshot& other) const { return !(*this == other); }
};

// What an unreplaced retraction does to later snapshots
enum class RetractionPolicy {
    Freeze,  // keep the last asserted value
    Remove   // drop the attribute from the snapshot
};

const char* retraction_policy_name(RetractionPolicy policy);

// Accepts "freeze" / "remove"
std::optional<RetractionPolicy> parse_retraction_policy(const std::string& name);

std::ostream& operator<<(std::ostream& os, const FactRecord& fact);
std::ostream& operator<<(std::ostream& os, const AttributeMap& map);

} // namespace factlog
