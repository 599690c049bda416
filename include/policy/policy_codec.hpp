#pragma once

#include "core/types.hpp"
#include "policy/policy_types.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace rlsengine {

/**
 * @brief Raised when a persisted JSON shape is malformed
 *
 * The message names the offending object and field, e.g.
 * "condition 'c1': unknown operator 'like'".
 */
class PolicyCodecError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief dump() for documents that carry user-supplied strings
 *
 * Invalid UTF-8 is written as U+FFFD instead of raising type_error.316.
 */
[[nodiscard]] std::string dump_json(const nlohmann::json& j, int indent = -1);

// ============================================================================
// nlohmann::json ADL hooks - camelCase persisted shapes
// ============================================================================
//
// Optional fields are omitted when absent and accepted as absent when null,
// so decode(encode(x)) == x for every value.

void to_json(nlohmann::json& j, const SecurityRole& role);
void from_json(const nlohmann::json& j, SecurityRole& role);

void to_json(nlohmann::json& j, const RlsCondition& condition);
void from_json(const nlohmann::json& j, RlsCondition& condition);

void to_json(nlohmann::json& j, const ConditionGroup& group);
void from_json(const nlohmann::json& j, ConditionGroup& group);

void to_json(nlohmann::json& j, const RlsPolicy& policy);
void from_json(const nlohmann::json& j, RlsPolicy& policy);

void to_json(nlohmann::json& j, const RlsConfiguration& config);
void from_json(const nlohmann::json& j, RlsConfiguration& config);

void to_json(nlohmann::json& j, const FilterDecision& decision);
void from_json(const nlohmann::json& j, FilterDecision& decision);

void to_json(nlohmann::json& j, const UserSecurityContext& user);
void from_json(const nlohmann::json& j, UserSecurityContext& user);

/**
 * @brief One evaluation request (CLI input line)
 */
struct EvaluationRequest {
    TableIdentity table;
    UserSecurityContext user;
};

void from_json(const nlohmann::json& j, EvaluationRequest& request);

/// Parse a JSON document, converting nlohmann parse errors into PolicyCodecError
[[nodiscard]] nlohmann::json parse_json(const std::string& text);

} // namespace rlsengine
