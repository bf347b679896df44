/**
 * @file grouper.hpp
 * @brief Transaction grouping - unordered facts to tx-ordered groups
 */

#pragma once

#include <vector>

#include "factlog/types.hpp"

namespace factlog {

/**
 * @brief Partition an entity's facts into one group per transaction.
 *
 * Groups come back in ascending tx order whatever the input order was.
 * Order inside a group is unspecified. Each group takes the first
 * tx_instant present among its facts.
 *
 * @param facts Facts for one entity, any order. Consumed.
 * @return Groups ordered by tx; empty when facts is empty.
 */
std::vector<TxGroup> group_by_transaction(std::vector<FactRecord> facts);

} // namespace factlog
