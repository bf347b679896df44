#include "factlog/reconstruct/resolver.hpp"

#include <set>
#include <sstream>

#include "factlog/error.hpp"
#include "factlog/logging.hpp"

namespace factlog {

Delta resolve_delta(const TxGroup& group) {
    Delta delta;
    delta.tx = group.tx;
    delta.tx_instant = group.tx_instant;

    std::set<Attribute> retracted;

    for (const auto& fact : group.facts) {
        if (fact.tx != group.tx) {
            std::ostringstream msg;
            msg << "Fact " << fact << " found in group for tx " << group.tx;
            LOG_ERROR(msg.str());
            FACTLOG_THROW_HINT(MalformedFactGroupError, msg.str(),
                               "Group facts with group_by_transaction()");
        }

        if (!fact.added) {
            retracted.insert(fact.attribute);
            continue;
        }

        auto [it, inserted] = delta.values.emplace(fact.attribute, fact.value);
        if (!inserted) {
            std::ostringstream msg;
            msg << "tx " << group.tx << " asserts " << fact.attribute << " twice ("
                << it->second << " and " << fact.value << ")";
            LOG_ERROR(msg.str());
            FACTLOG_THROW_HINT(MalformedFactGroupError, msg.str(),
                               "Check the store for a cardinality-many attribute "
                               "or a corrupted transaction");
        }
    }

    for (const auto& attribute : retracted) {
        if (delta.values.find(attribute) == delta.values.end()) {
            delta.retracted.push_back(attribute);
        }
    }

    return delta;
}

} // namespace factlog
