#include "policy/filter_combiner.hpp"
#include "policy/policy_constants.hpp"

namespace rlsengine {

CombinedFilter FilterCombiner::combine(
    const std::vector<const RlsPolicy*>& applicable,
    const UserSecurityContext& user) {

    std::vector<Input> compiled;
    compiled.reserve(applicable.size());
    for (const auto* policy : applicable) {
        compiled.push_back(Input{policy->id, ConditionCompiler::compile(policy->filter_group, user)});
    }
    return combine(compiled);
}

CombinedFilter FilterCombiner::combine(const std::vector<Input>& compiled) {
    CombinedFilter result;
    if (compiled.empty()) {
        result.no_matching_policy = true;
        return result;
    }

    bool unrestricted = false;
    std::vector<std::string> disjuncts;

    for (const auto& input : compiled) {
        result.policies_applied.push_back(input.policy_id);
        const auto folded = input.predicate.constant_value();
        if (folded.has_value()) {
            if (*folded) unrestricted = true;
            continue;
        }
        disjuncts.push_back(input.predicate.to_sql());
    }

    if (unrestricted) {
        return result;
    }

    result.has_filters = true;
    if (disjuncts.empty()) {
        result.where_clause = std::string(policy::kSqlFalse);
    } else if (disjuncts.size() == 1) {
        result.where_clause = std::move(disjuncts.front());
    } else {
        std::string clause;
        for (size_t i = 0; i < disjuncts.size(); ++i) {
            if (i > 0) clause += " OR ";
            clause += "(" + disjuncts[i] + ")";
        }
        result.where_clause = std::move(clause);
    }
    return result;
}

} // namespace rlsengine
