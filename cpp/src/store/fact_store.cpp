#include "factlog/store/fact_store.hpp"

#include <set>

#include "factlog/error.hpp"

namespace factlog {

std::vector<FactRecord> plan_assertions(const AttributeMap& current, const AttributeMap& changes) {
    std::vector<FactRecord> facts;
    for (const auto& [attribute, value] : changes) {
        FACTLOG_CHECK_ARGUMENT(!value.is<Instant>() || value.as<Instant>().in_range(),
                               "Instant value for " + attribute + " is outside years 0001-9999");
        auto it = current.find(attribute);
        if (it != current.end()) {
            if (it->second == value) continue;  // redundant assertion
            facts.emplace_back(0, attribute, it->second, false);
        }
        facts.emplace_back(0, attribute, value, true);
    }
    return facts;
}

std::vector<FactRecord> plan_retractions(const AttributeMap& current,
                                         const std::vector<Attribute>& attributes) {
    std::vector<FactRecord> facts;
    std::set<Attribute> seen;
    for (const auto& attribute : attributes) {
        if (!seen.insert(attribute).second) continue;
        auto it = current.find(attribute);
        if (it == current.end()) continue;
        facts.emplace_back(0, attribute, it->second, false);
    }
    return facts;
}

} // namespace factlog
