// =============================================================================
// Shared fixture data: one order's fact log across three transactions
// =============================================================================
//
//   tx ...313  place order:     id, operator "me", time 12:00, action "place order"
//   tx ...315  assign:          operator -> "logistics system", action -> "assign to warehouse A"
//   tx ...316  ship:            operator -> "shipper B", time -> 12:20,
//                               action -> "ship to logistics center C", + location
//
// Facts are listed out of order, the way a set-valued history query returns them.

#pragma once

#include <vector>

#include "factlog/types.hpp"

namespace factlog::testing {

constexpr TxId TX_PLACE = 13194139534313;
constexpr TxId TX_ASSIGN = 13194139534315;
constexpr TxId TX_SHIP = 13194139534316;

inline Uuid order_uuid() {
    return *Uuid::parse("287fc397-a432-49d7-9068-d7499cd2e28c");
}

inline Instant at(const char* iso) {
    return *Instant::parse(iso);
}

inline std::vector<FactRecord> order_history() {
    const Instant t1 = at("2018-07-01T12:00:00Z");
    const Instant t3 = at("2018-07-01T12:20:00Z");

    return {
        {TX_SHIP,   "order/operator", "logistics system", false},
        {TX_SHIP,   "order/operator", "shipper B", true},
        {TX_SHIP,   "order/location", "warehouse A", true},
        {TX_PLACE,  "order/action", "place order", true},
        {TX_ASSIGN, "order/operator", "logistics system", true},
        {TX_PLACE,  "order/id", order_uuid(), true},
        {TX_ASSIGN, "order/action", "place order", false},
        {TX_SHIP,   "order/action", "ship to logistics center C", true},
        {TX_ASSIGN, "order/action", "assign to warehouse A", true},
        {TX_PLACE,  "order/operator", "me", true},
        {TX_SHIP,   "order/time", t1, false},
        {TX_ASSIGN, "order/operator", "me", false},
        {TX_PLACE,  "order/time", t1, true},
        {TX_SHIP,   "order/action", "assign to warehouse A", false},
        {TX_SHIP,   "order/time", t3, true},
    };
}

} // namespace factlog::testing
