/**
 * @file accumulator.hpp
 * @brief Fold per-transaction deltas into cumulative snapshots
 */

#pragma once

#include <vector>

#include "factlog/types.hpp"

namespace factlog {

/**
 * @brief Overlay one attribute map onto another.
 *
 * Every key of overlay takes overlay's value; every other key of base is
 * carried over unchanged.
 */
AttributeMap merge_into(const AttributeMap& base, const AttributeMap& overlay);

/**
 * @brief Build one snapshot per delta, oldest first.
 *
 * snapshot[0] is delta[0] copied; snapshot[i] is snapshot[i-1] overlaid
 * with delta[i]. Under RetractionPolicy::Remove the attributes listed in
 * delta[i].retracted are then erased.
 */
std::vector<Snapshot> accumulate(const std::vector<Delta>& deltas,
                                 RetractionPolicy policy = RetractionPolicy::Freeze);

} // namespace factlog
