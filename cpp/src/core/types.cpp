#include "factlog/types.hpp"

namespace factlog {

const char* retraction_policy_name(RetractionPolicy policy) {
    switch (policy) {
        case RetractionPolicy::Freeze: return "freeze";
        case RetractionPolicy::Remove: return "remove";
    }
    return "unknown";
}

std::optional<RetractionPolicy> parse_retraction_policy(const std::string& name) {
    if (name == "freeze") return RetractionPolicy::Freeze;
    if (name == "remove") return RetractionPolicy::Remove;
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, const FactRecord& fact) {
    os << "[" << fact.tx << " " << fact.attribute << " " << fact.value.to_string()
       << " " << (fact.added ? "true" : "false");
    if (fact.tx_instant) {
        os << " " << fact.tx_instant->to_string();
    }
    return os << "]";
}

std::ostream& operator<<(std::ostream& os, const AttributeMap& map) {
    os << "{";
    bool first = true;
    for (const auto& [attribute, value] : map) {
        if (!first) os << ", ";
        os << attribute << " " << value.to_string();
        first = false;
    }
    return os << "}";
}

} // namespace factlog
