#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace rlsengine {

// ============================================================================
// Attribute Values
// ============================================================================

// Literal values and user attributes share the JSON value model
// (string, number, bool, array, null) of the persisted policy shape.
using AttributeValue = nlohmann::json;
using AttributeMap = std::unordered_map<std::string, AttributeValue>;

// ============================================================================
// Table Identity
// ============================================================================

struct TableIdentity {
    std::string connection_id;
    std::string schema;         // Schema name (may be empty)
    std::string table;          // Table name

    TableIdentity() = default;
    TableIdentity(std::string c, std::string s, std::string t)
        : connection_id(std::move(c)), schema(std::move(s)), table(std::move(t)) {}

    std::string full_name() const {
        return schema.empty() ? table : (schema + "." + table);
    }
};

// ============================================================================
// User Security Context (produced by authentication, read-only here)
// ============================================================================

struct UserSecurityContext {
    std::string user_id;
    std::string username;
    std::optional<std::string> email;
    std::unordered_set<std::string> roles;  // Role ids currently held
    AttributeMap attributes;                // department, region, custom keys...

    bool has_role(const std::string& role_id) const {
        return roles.contains(role_id);
    }

    /// Role ids in ascending order (stable cache keys and log output)
    std::vector<std::string> sorted_roles() const;
};

// ============================================================================
// Filter Decision (engine output)
// ============================================================================

struct FilterDecision {
    bool has_filters = false;
    std::optional<std::string> where_clause;
    std::vector<std::string> policies_applied;
    bool access_denied = false;
    std::optional<std::string> denial_reason;

    bool operator==(const FilterDecision&) const = default;

    static FilterDecision unrestricted() { return {}; }

    static FilterDecision denied(std::string reason) {
        FilterDecision d;
        d.access_denied = true;
        d.denial_reason = std::move(reason);
        return d;
    }
};

} // namespace rlsengine
