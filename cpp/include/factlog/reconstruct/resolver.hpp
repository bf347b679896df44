/**
 * @file resolver.hpp
 * @brief Collapse one transaction's assert/retract facts into a Delta
 */

#pragma once

#include "factlog/types.hpp"

namespace factlog {

/**
 * @brief Resolve a transaction group to its effective change.
 *
 * Assertions become Delta::values. Retractions are trusted (never checked
 * against the prior value) and dropped, except that an attribute retracted
 * with no assertion in the same group is listed in Delta::retracted.
 *
 * @throws MalformedFactGroupError if an attribute is asserted more than
 *         once, or if the group mixes transactions.
 */
Delta resolve_delta(const TxGroup& group);

} // namespace factlog
